/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <stfx/common/benchmark.hpp>
#include "ed25519.hpp"
#include "x25519.hpp"

namespace {
    using namespace stfx;
    using namespace stfx::crypto;
}

suite stfx_crypto_keys_bench_suite = [] {
    "stfx::crypto::ed25519"_test = [] {
        const auto kp = ed25519::key_pair_t::generate();
        const std::string msg(256, 'x');
        const auto sig = kp.sign(msg);
        ankerl::nanobench::Bench b {};
        b.title("stfx::crypto::ed25519")
            .output(&std::cerr)
            .unit("op")
            .performanceCounters(true)
            .relative(true);
        b.run("generate", [&] {
            ankerl::nanobench::doNotOptimizeAway(ed25519::key_pair_t::generate());
        });
        b.run("sign 256 bytes", [&] {
            ankerl::nanobench::doNotOptimizeAway(kp.sign(msg));
        });
        b.run("verify 256 bytes", [&] {
            ankerl::nanobench::doNotOptimizeAway(kp.public_key().verify(msg, sig));
        });
    };
    "stfx::crypto::x25519"_test = [] {
        const auto a = x25519::key_pair_t::generate();
        const auto b_pk = x25519::key_pair_t::generate().public_key();
        ankerl::nanobench::Bench b {};
        b.title("stfx::crypto::x25519")
            .output(&std::cerr)
            .unit("op")
            .performanceCounters(true)
            .relative(true);
        b.run("generate", [&] {
            ankerl::nanobench::doNotOptimizeAway(x25519::key_pair_t::generate());
        });
        b.run("diffie_hellman", [&] {
            ankerl::nanobench::doNotOptimizeAway(a.diffie_hellman(b_pk));
        });
    };
};

/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <stfx/common/benchmark.hpp>
#include "chacha20-poly1305.hpp"
#include "random.hpp"

namespace {
    using namespace stfx;
    using namespace stfx::crypto;
    namespace aead = stfx::crypto::chacha20_poly1305;
}

suite stfx_crypto_chacha20_poly1305_bench_suite = [] {
    "stfx::crypto::chacha20_poly1305"_test = [] {
        const auto key = random::generate<aead::key_t>();
        const auto nonce = random::generate<aead::nonce_t>();
        const auto msg = random::bytes(4096);
        uint8_vector ct { msg };
        aead::encrypt(key, nonce, buffer {}, ct);
        ankerl::nanobench::Bench b {};
        b.title("stfx::crypto::chacha20_poly1305 4096 bytes")
            .output(&std::cerr)
            .unit("byte")
            .batch(msg.size())
            .performanceCounters(true)
            .relative(true);
        // the benchmark reuses a nonce; the outputs are never published
        b.run("encrypt", [&] {
            uint8_vector data { msg };
            aead::encrypt(key, nonce, buffer {}, data);
            ankerl::nanobench::doNotOptimizeAway(data);
        });
        b.run("decrypt", [&] {
            uint8_vector data { ct };
            aead::decrypt(key, nonce, buffer {}, data);
            ankerl::nanobench::doNotOptimizeAway(data);
        });
    };
};

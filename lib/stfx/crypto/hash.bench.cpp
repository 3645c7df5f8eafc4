/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <stfx/common/benchmark.hpp>
#include "blake2b.hpp"
#include "random.hpp"
#include "sha256.hpp"

namespace {
    using namespace stfx;
    using namespace stfx::crypto;
}

suite stfx_crypto_hash_bench_suite = [] {
    "stfx::crypto::hash"_test = [] {
        for (const size_t sz: { 32ULL, 256ULL, 4096ULL }) {
            const auto data = random::bytes(sz);
            ankerl::nanobench::Bench b {};
            b.title(fmt::format("stfx::crypto::hash {} bytes", sz))
                .output(&std::cerr)
                .unit("byte")
                .batch(sz)
                .performanceCounters(true)
                .relative(true);
            b.run("sha256", [&] {
                ankerl::nanobench::doNotOptimizeAway(sha256::digest(data));
            });
            b.run("blake2b-256", [&] {
                ankerl::nanobench::doNotOptimizeAway(blake2b::digest(data));
            });
        }
    };
};

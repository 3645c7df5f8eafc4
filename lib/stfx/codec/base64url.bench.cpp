/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <stfx/common/benchmark.hpp>
#include "base64url.hpp"

namespace {
    using namespace stfx;
}

suite stfx_codec_base64url_bench_suite = [] {
    "stfx::codec::base64url"_test = [] {
        ankerl::nanobench::Bench b {};
        static const auto data = byte_array<64>::from_hex("00112233445566778899AABBCCDDEEFF00112233445566778899AABBCCDDEEFF00112233445566778899AABBCCDDEEFF00112233445566778899AABBCCDDEEFF");
        static const auto text = codec::base64url::encode(data);
        b.title("stfx::codec::base64url")
            .output(&std::cerr)
            .unit("byte")
            .performanceCounters(true)
            .relative(true)
            .batch(data.size());
        b.run("from_hex",[&] {
            byte_array<64> res;
            init_from_hex(res, "00112233445566778899AABBCCDDEEFF00112233445566778899AABBCCDDEEFF00112233445566778899AABBCCDDEEFF00112233445566778899AABBCCDDEEFF");
            ankerl::nanobench::doNotOptimizeAway(res);
        });
        b.run("encode",[&] {
            ankerl::nanobench::doNotOptimizeAway(codec::base64url::encode(data));
        });
        b.run("decode",[&] {
            ankerl::nanobench::doNotOptimizeAway(codec::base64url::decode(text));
        });
    };
};

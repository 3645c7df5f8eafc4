/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <stfx/common/test.hpp>
#include "sha256.hpp"

namespace {
    using namespace stfx;
    using namespace crypto::sha256;
}

suite stfx_crypto_sha256_suite = [] {
    "stfx::crypto::sha256"_test = [] {
        using test_vector = std::pair<std::string_view, std::string_view>;
        static std::vector test_vectors = {
            test_vector { "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855", "" },
            test_vector { "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad", "abc" },
            test_vector { "9f86d081884c7d659a2feaa0c55ad015a3bf4f1b2b0b822cd15d6c15b0f00a08", "test" }
        };
        for (const auto &[exp_hex, input]: test_vectors) {
            const auto exp = hash_t::from_hex(exp_hex);
            expect_equal(exp, digest(input), input);
            expect_equal(exp, hasher {}.hash(input), input);
        }
        "distinct inputs"_test = [] {
            expect(digest("test") != digest("Test"));
            expect(digest(uint8_vector::from_hex("00")) != digest(buffer {}));
        };
    };
};

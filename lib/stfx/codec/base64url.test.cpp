/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <stfx/common/test.hpp>
#include "base64url.hpp"

namespace {
    using namespace stfx;
    using namespace stfx::codec;
}

suite stfx_codec_base64url_suite = [] {
    "stfx::codec::base64url"_test = [] {
        "rfc4648 vectors"_test = [] {
            const std::vector<std::pair<std::string_view, std::string_view>> vectors {
                { "", "" },
                { "f", "Zg" },
                { "fo", "Zm8" },
                { "foo", "Zm9v" },
                { "foob", "Zm9vYg" },
                { "fooba", "Zm9vYmE" },
                { "foobar", "Zm9vYmFy" },
                { "hello world", "aGVsbG8gd29ybGQ" }
            };
            for (const auto &[data, text]: vectors) {
                expect_equal(std::string { text }, base64url::encode(data), data);
                expect_equal(std::string_view { data }, base64url::decode(text).str(), text);
            }
        };
        "url-safe alphabet"_test = [] {
            const auto data = uint8_vector::from_hex("FBFFBF");
            expect_equal(std::string { "-_-_" }, base64url::encode(data));
            expect_equal(data, base64url::decode("-_-_"));
        };
        "all byte values"_test = [] {
            uint8_vector data {};
            for (size_t i = 0; i < 256; ++i)
                data << static_cast<uint8_t>(i);
            const auto text = base64url::encode(data);
            expect_equal(base64url::encoded_size(data.size()), text.size());
            expect(text.find_first_of("+/=") == std::string::npos);
            expect_equal(data, base64url::decode(text));
        };
        "encoded_size"_test = [] {
            expect_equal(0ULL, base64url::encoded_size(0));
            expect_equal(2ULL, base64url::encoded_size(1));
            expect_equal(3ULL, base64url::encoded_size(2));
            expect_equal(4ULL, base64url::encoded_size(3));
            expect_equal(43ULL, base64url::encoded_size(32));
            expect_equal(86ULL, base64url::encoded_size(64));
        };
        "non-canonical input"_test = [] {
            // padding
            expect(throws<codec::decode_error>([] { base64url::decode("Zg=="); }));
            expect(throws<codec::decode_error>([] { base64url::decode("Zg="); }));
            // non-zero trailing bits
            expect(throws<codec::decode_error>([] { base64url::decode("Zh"); }));
            expect(throws<codec::decode_error>([] { base64url::decode("Zm9"); }));
            // a length that no byte sequence produces
            expect(throws<codec::decode_error>([] { base64url::decode("Z"); }));
            expect(throws<codec::decode_error>([] { base64url::decode("Zm9vY"); }));
            // the standard alphabet and whitespace
            expect(throws<codec::decode_error>([] { base64url::decode("a+b/"); }));
            expect(throws<codec::decode_error>([] { base64url::decode("ab c"); }));
            expect(throws<codec::decode_error>([] { base64url::decode("Zm9v\n"); }));
        };
    };
};

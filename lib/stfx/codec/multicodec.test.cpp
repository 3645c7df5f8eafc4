/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <stfx/common/test.hpp>
#include "multicodec.hpp"

namespace {
    using namespace stfx;
    using namespace stfx::codec;
    using multicodec::code_t;
}

suite stfx_codec_multicodec_suite = [] {
    "stfx::codec::multicodec"_test = [] {
        "prefixes"_test = [] {
            const auto payload = uint8_vector::from_hex("AABB");
            expect_equal(uint8_vector::from_hex("ED01AABB"), multicodec::encode(code_t::ed25519_pub, payload));
            expect_equal(uint8_vector::from_hex("EC01AABB"), multicodec::encode(code_t::x25519_pub, payload));
            expect_equal(uint8_vector::from_hex("12AABB"), multicodec::encode(code_t::sha2_256, payload));
            expect_equal(uint8_vector::from_hex("A0E402AABB"), multicodec::encode(code_t::blake2b_256, payload));
        };
        "decode"_test = [] {
            const auto data = uint8_vector::from_hex("A0E402AABB");
            const auto [code, payload] = multicodec::decode(data);
            expect_equal(static_cast<uint64_t>(code_t::blake2b_256), code);
            expect_equal(uint8_vector::from_hex("AABB"), uint8_vector { payload });
        };
        "varint boundaries"_test = [] {
            for (const uint64_t v: { 0ULL, 1ULL, 0x7FULL, 0x80ULL, 0x3FFFULL, 0x4000ULL, 0x7FFFFFFFFFFFFFFFULL }) {
                uint8_vector out {};
                multicodec::encode_varint(out, v);
                expect(out.size() <= multicodec::max_varint_size);
                buffer in = out;
                expect_equal(v, multicodec::decode_varint(in));
                expect(in.empty());
            }
        };
        "malformed varints"_test = [] {
            expect(throws<codec::decode_error>([] { multicodec::decode(buffer {}); }));
            expect(throws<codec::decode_error>([] { multicodec::decode(uint8_vector::from_hex("80")); }));
            expect(throws<codec::decode_error>([] { multicodec::decode(uint8_vector::from_hex("ED")); }));
            // 0x00 encoded with two bytes
            expect(throws<codec::decode_error>([] { multicodec::decode(uint8_vector::from_hex("8000")); }));
            expect(throws<codec::decode_error>([] { multicodec::decode(uint8_vector::from_hex("FFFFFFFFFFFFFFFFFF01")); }));
        };
        "names"_test = [] {
            expect_equal(std::string_view { "ed25519-pub" }, multicodec::name(code_t::ed25519_pub));
            expect_equal(std::string_view { "blake2b-256" }, multicodec::name(code_t::blake2b_256));
            expect(multicodec::from_name("x25519-pub") == code_t::x25519_pub);
            expect(multicodec::from_name("sha2-256") == code_t::sha2_256);
            expect(throws<error>([] { multicodec::from_name("secp256k1-pub"); }));
        };
    };
};

/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <stfx/common/test.hpp>
#include "random-insecure.hpp"
#include "x25519.hpp"

namespace {
    using namespace stfx;
    using namespace stfx::crypto;
    using namespace stfx::crypto::x25519;

    key_pair_t fixed_key_pair(const std::string_view sk_hex)
    {
        random::insecure_fixed_source_t src { uint8_vector::from_hex(sk_hex) };
        return key_pair_t::generate(src);
    }
}

suite stfx_crypto_x25519_suite = [] {
    "stfx::crypto::x25519"_test = [] {
        "rfc7748 section 6.1"_test = [] {
            const auto alice = fixed_key_pair("77076d0a7318a57d3c16c17251b26645df4c2f87ebc0992ab177fba51db92c2a");
            const auto bob = fixed_key_pair("5dab087e624a8a4b79e17f8b83800ee66f3bb1292618b6fd1c2f8b27ff88e0eb");
            expect_equal(pkey_t::from_hex("8520f0098930a754748b7ddcb43ef75a0dbf3a0d26381af4eba4a98eaa9b4e6a"), alice.public_key().bytes());
            expect_equal(pkey_t::from_hex("de9edb7d7b7dc1b4d35b61c2ece435373f8343c85b78674dadfc7e146f882b4f"), bob.public_key().bytes());
            const auto exp = byte_array<32>::from_hex("4a5d9d5ba4ce2de1728e3bf480350f25e07e21c947d19e3376f09b3c1e161742");
            expect_equal(exp, byte_array<32> { alice.diffie_hellman(bob.public_key()) });
            expect_equal(exp, byte_array<32> { bob.diffie_hellman(alice.public_key()) });
        };
        "regression vector"_test = [] {
            const auto a = fixed_key_pair("0102030405060708090a0b0c0d0e0f101112131415161718191a1b1c1d1e1f20");
            const auto b = fixed_key_pair("2122232425262728292a2b2c2d2e2f303132333435363738393a3b3c3d3e3f40");
            expect_equal(pkey_t::from_hex("07a37cbc142093c8b755dc1b10e86cb426374ad16aa853ed0bdfc0b2b86d1c7c"), a.public_key().bytes());
            expect_equal(pkey_t::from_hex("5869aff450549732cbaaed5e5df9b30a6da31cb0e5742bad5ad4a1a768f1a67b"), b.public_key().bytes());
            expect_equal(byte_array<32>::from_hex("a84dc7c3c8f058b1b2dc4cd1e9b5dc0a7987f88b6a9564cde3391fc421159e77"), byte_array<32> { a.diffie_hellman(b.public_key()) });
        };
        "agreement is symmetric"_test = [] {
            const auto a = key_pair_t::generate();
            const auto b = key_pair_t::generate();
            const auto c = key_pair_t::generate();
            expect(a.diffie_hellman(b.public_key()) == b.diffie_hellman(a.public_key()));
            expect(a.diffie_hellman(b.public_key()) != a.diffie_hellman(c.public_key()));
        };
        "clamp"_test = [] {
            skey_t sk {};
            std::fill(sk.begin(), sk.end(), 0xFF);
            clamp(sk);
            expect_equal(0xF8, static_cast<int>(sk[0]));
            expect_equal(0x7F, static_cast<int>(sk[31]));
            std::fill(sk.begin(), sk.end(), 0x00);
            clamp(sk);
            expect_equal(0x00, static_cast<int>(sk[0]));
            expect_equal(0x40, static_cast<int>(sk[31]));
        };
        "low-order points"_test = [] {
            const auto kp = key_pair_t::generate();
            static const std::vector<std::string_view> points {
                "0000000000000000000000000000000000000000000000000000000000000000",
                "0100000000000000000000000000000000000000000000000000000000000000",
                "e0eb7a7c3b41b8ae1656e3faf19fc46ada098deb9c32b1fd866205165f49b800",
                "5f9c95bca3508c24b1d0b1559c83ef5b04445cc4581c8e86d8224eddd09f1157",
                "ecffffffffffffffffffffffffffffffffffffffffffffffffffffffffffff7f",
                "edffffffffffffffffffffffffffffffffffffffffffffffffffffffffffff7f",
                "eeffffffffffffffffffffffffffffffffffffffffffffffffffffffffffff7f",
                // the same points with the ignored top bit set
                "0000000000000000000000000000000000000000000000000000000000000080",
                "0100000000000000000000000000000000000000000000000000000000000080",
                "e0eb7a7c3b41b8ae1656e3faf19fc46ada098deb9c32b1fd866205165f49b880",
                "5f9c95bca3508c24b1d0b1559c83ef5b04445cc4581c8e86d8224eddd09f11d7",
                "ecffffffffffffffffffffffffffffffffffffffffffffffffffffffffffffff",
                "edffffffffffffffffffffffffffffffffffffffffffffffffffffffffffffff",
                "eeffffffffffffffffffffffffffffffffffffffffffffffffffffffffffffff"
            };
            for (const auto hex: points) {
                const public_key_t pk { pkey_t::from_hex(hex) };
                expect(has_small_order(pk.bytes())) << hex;
                expect(throws<key_agreement_error>([&] { kp.diffie_hellman(pk); })) << hex;
            }
            expect(!has_small_order(kp.public_key().bytes()));
        };
        "generation draws only from the given source"_test = [] {
            expect(throws<random_error>([] { key_pair_t::generate(random::disabled_source()); }));
        };
    };
};

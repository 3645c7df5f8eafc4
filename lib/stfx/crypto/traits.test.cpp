/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <memory>
#include <stfx/common/test.hpp>
#include "blake2b.hpp"
#include "chacha20-poly1305.hpp"
#include "ed25519.hpp"
#include "sha256.hpp"
#include "x25519.hpp"

namespace {
    using namespace stfx;
    using namespace stfx::crypto;

    static_assert(key_pair_c<ed25519::key_pair_t>);
    static_assert(key_pair_c<x25519::key_pair_t>);
    static_assert(!std::is_copy_constructible_v<ed25519::key_pair_t>);
    static_assert(!std::is_copy_constructible_v<x25519::key_pair_t>);
    static_assert(std::is_move_constructible_v<ed25519::key_pair_t>);
    // keys of the two curves have the same size but must not be interchangeable
    static_assert(!std::is_convertible_v<ed25519::public_key_t, x25519::public_key_t>);
    static_assert(!std::is_convertible_v<x25519::public_key_t, ed25519::public_key_t>);
    static_assert(!std::is_convertible_v<ed25519::vkey_t, ed25519::public_key_t>);
    static_assert(std::is_base_of_v<verifier_t<ed25519::signature_t>, ed25519::public_key_t>);
    static_assert(std::is_base_of_v<signer_t<ed25519::signature_t>, ed25519::key_pair_t>);
    static_assert(std::is_base_of_v<key_agreement_t<x25519::public_key_t>, x25519::key_pair_t>);
    static_assert(!std::is_base_of_v<verifier_t<ed25519::signature_t>, x25519::public_key_t>);
    static_assert(chacha20_poly1305::cipher::tag_size == 16);
    // same-sized values of different meaning do not convert into each other
    static_assert(!std::is_same_v<shared_secret_t, chacha20_poly1305::key_t>);
    static_assert(!std::is_convertible_v<shared_secret_t, chacha20_poly1305::key_t>);
    static_assert(!std::is_convertible_v<digest_t, ed25519::vkey_t>);
    static_assert(!std::is_convertible_v<ed25519::vkey_t, x25519::pkey_t>);
    static_assert(!std::is_convertible_v<ed25519::seed_t, x25519::skey_t>);

    // generic code written once against the interfaces
    template<typename SIG>
    bool sign_and_verify(const signer_t<SIG> &signer, const verifier_t<SIG> &verifier, const buffer msg)
    {
        return verifier.verify(msg, signer.sign(msg));
    }

    template<typename KP>
    requires key_pair_c<KP>
    typename KP::public_key_type fresh_public_key()
    {
        return KP::generate().public_key();
    }
}

suite stfx_crypto_traits_suite = [] {
    "stfx::crypto::traits"_test = [] {
        "signer + verifier"_test = [] {
            const auto kp = ed25519::key_pair_t::generate();
            expect(sign_and_verify<ed25519::signature_t>(kp, kp.public_key(), "generic"));
            const auto other = ed25519::key_pair_t::generate();
            expect(!sign_and_verify<ed25519::signature_t>(kp, other.public_key(), "generic"));
        };
        "hashers"_test = [] {
            std::vector<std::unique_ptr<hasher_t>> hashers {};
            hashers.emplace_back(std::make_unique<sha256::hasher>());
            hashers.emplace_back(std::make_unique<blake2b::hasher>());
            expect_equal(sha256::digest("abc"), hashers[0]->hash("abc"));
            expect_equal(blake2b::digest("abc"), hashers[1]->hash("abc"));
            expect(hashers[0]->hash("abc") != hashers[1]->hash("abc"));
        };
        "key agreement"_test = [] {
            const auto a = x25519::key_pair_t::generate();
            const auto b = x25519::key_pair_t::generate();
            const key_agreement_t<x25519::public_key_t> &ka = a;
            expect(ka.diffie_hellman(b.public_key()) == b.diffie_hellman(a.public_key()));
        };
        "aead"_test = [] {
            const aead_t<chacha20_poly1305::key_t, chacha20_poly1305::nonce_t, 16> &c = chacha20_poly1305::cipher {};
            const auto key = random::generate<chacha20_poly1305::key_t>();
            const auto nonce = random::generate<chacha20_poly1305::nonce_t>();
            uint8_vector data { std::string_view { "generic" } };
            c.encrypt(key, nonce, buffer {}, data);
            expect_equal(7ULL + 16ULL, data.size());
            c.decrypt(key, nonce, buffer {}, data);
            expect_equal(std::string_view { "generic" }, data.str());
        };
        "key pair concept"_test = [] {
            expect(fresh_public_key<ed25519::key_pair_t>() != fresh_public_key<ed25519::key_pair_t>());
            expect(fresh_public_key<x25519::key_pair_t>() != fresh_public_key<x25519::key_pair_t>());
        };
        "error taxonomy"_test = [] {
            static_assert(std::is_base_of_v<error, signing_error>);
            static_assert(std::is_base_of_v<error, verification_error>);
            static_assert(std::is_base_of_v<error, key_agreement_error>);
            static_assert(std::is_base_of_v<error, aead_error>);
            static_assert(std::is_base_of_v<error, random_error>);
            expect_equal(std::string_view { "signature verification failed" }, std::string_view { verification_error {}.what() });
            expect_equal(std::string_view { "AEAD authentication failed" }, std::string_view { aead_error {}.what() });
        };
    };
};

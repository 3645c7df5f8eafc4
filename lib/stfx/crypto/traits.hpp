#pragma once
/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <concepts>
#include <stfx/common/bytes.hpp>
#include "error.hpp"
#include "random.hpp"

/*
 * Algorithm-agnostic capability interfaces.
 * Each interface is parameterized by the algorithm's natural output types and by the exception type
 * its operations raise, so generic code can be written once against the interface while
 * keys and signatures of different algorithms remain distinct C++ types.
 */
namespace stfx::crypto {
    struct digest_tag;
    struct shared_secret_tag;

    using digest_t = byte_array<32, digest_tag>;
    // raw key-agreement output: derive keys from it through a KDF, never use it as a key directly
    using shared_secret_t = secure_byte_array<32, shared_secret_tag>;

    template<typename SIG, typename ERR=signing_error>
    struct signer_t {
        using signature_type = SIG;
        using error_type = ERR;

        virtual ~signer_t() =default;
        // throws error_type only on an internal failure: any byte sequence is a valid message
        virtual signature_type sign(buffer msg) const =0;
    };

    template<typename SIG, typename ERR=verification_error>
    struct verifier_t {
        using signature_type = SIG;
        using error_type = ERR;

        virtual ~verifier_t() =default;
        // false for both a mismatch and a malformed signature; callers cannot tell them apart
        [[nodiscard]] virtual bool verify(buffer msg, const signature_type &sig) const =0;

        void verify_or_throw(const buffer msg, const signature_type &sig) const
        {
            if (!verify(msg, sig)) [[unlikely]]
                throw error_type {};
        }
    };

    // Hashing is total: any byte sequence has exactly one digest.
    struct hasher_t {
        using digest_type = digest_t;

        virtual ~hasher_t() =default;
        virtual digest_type hash(buffer data) const =0;
    };

    template<typename PK, typename SS=shared_secret_t, typename ERR=key_agreement_error>
    struct key_agreement_t {
        using public_key_type = PK;
        using shared_secret_type = SS;
        using error_type = ERR;

        virtual ~key_agreement_t() =default;
        // throws error_type when their_pk is not a usable curve point (including low-order points)
        virtual shared_secret_type diffie_hellman(const public_key_type &their_pk) const =0;
    };

    /*
     * Encrypts and decrypts in place: encrypt appends tag_size bytes, decrypt strips them.
     * The nonce must never repeat under the same key. Implementations cannot detect a repetition,
     * and a repeated nonce exposes the XOR of the two plaintexts.
     */
    template<typename KEY, typename NONCE, size_t TAG_SZ, typename ERR=aead_error>
    struct aead_t {
        using key_type = KEY;
        using nonce_type = NONCE;
        using error_type = ERR;
        static constexpr size_t tag_size = TAG_SZ;

        virtual ~aead_t() =default;
        virtual void encrypt(const key_type &key, const nonce_type &nonce, buffer aad, uint8_vector &data) const =0;
        // on failure, data is wiped and emptied before error_type is thrown
        virtual void decrypt(const key_type &key, const nonce_type &nonce, buffer aad, uint8_vector &data) const =0;
    };

    template<typename T>
    concept key_pair_c = requires(const T &kp, random::source_t &src)
    {
        typename T::public_key_type;
        { T::generate() } -> std::same_as<T>;
        { T::generate(src) } -> std::same_as<T>;
        { kp.public_key() } -> std::same_as<const typename T::public_key_type &>;
    };
}

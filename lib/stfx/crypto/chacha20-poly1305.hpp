#pragma once
/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <stfx/common/bytes.hpp>
#include "traits.hpp"

/*
 * ChaCha20-Poly1305 with the IETF sizing of RFC 8439: 32-byte key, 12-byte nonce, 16-byte tag.
 *
 * The caller must never encrypt two messages with the same (key, nonce) pair.
 * This module does not generate or track nonces and has no way to detect a repetition.
 * Reusing a nonce reveals the XOR of the two plaintexts and allows tag forgeries.
 */
namespace stfx::crypto::chacha20_poly1305
{
    struct key_tag;
    struct nonce_tag;

    using key_t = secure_byte_array<32, key_tag>;
    using nonce_t = byte_array<12, nonce_tag>;
    static constexpr size_t tag_size = 16;

    struct cipher: aead_t<key_t, nonce_t, tag_size> {
        void encrypt(const key_t &key, const nonce_t &nonce, buffer aad, uint8_vector &data) const override;
        void decrypt(const key_t &key, const nonce_t &nonce, buffer aad, uint8_vector &data) const override;
    };

    extern void encrypt(const key_t &key, const nonce_t &nonce, buffer aad, uint8_vector &data);
    extern void decrypt(const key_t &key, const nonce_t &nonce, buffer aad, uint8_vector &data);
}

/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include "chacha20-poly1305.hpp"
#include "sodium.hpp"

namespace stfx::crypto::chacha20_poly1305 {
    static_assert(sizeof(key_t) == crypto_aead_chacha20poly1305_ietf_KEYBYTES);
    static_assert(sizeof(nonce_t) == crypto_aead_chacha20poly1305_ietf_NPUBBYTES);
    static_assert(tag_size == crypto_aead_chacha20poly1305_ietf_ABYTES);

    void cipher::encrypt(const key_t &key, const nonce_t &nonce, const buffer aad, uint8_vector &data) const
    {
        sodium::ensure_initialized();
        const auto msg_size = data.size();
        data.resize(msg_size + tag_size);
        // libsodium supports in-place operation when the message and the ciphertext share the same address
        if (sodium::crypto_aead_chacha20poly1305_ietf_encrypt_detached(data.data(), data.data() + msg_size, nullptr,
                data.data(), msg_size, aad.data(), aad.size(), nullptr, nonce.data(), key.data()) != 0) [[unlikely]] {
            secure_clear(data);
            data.clear();
            throw error("ChaCha20-Poly1305 encryption failed");
        }
    }

    void cipher::decrypt(const key_t &key, const nonce_t &nonce, const buffer aad, uint8_vector &data) const
    {
        sodium::ensure_initialized();
        if (data.size() < tag_size) [[unlikely]] {
            secure_clear(data);
            data.clear();
            throw error_type {};
        }
        const auto msg_size = data.size() - tag_size;
        // the tag is verified before any plaintext is produced
        if (sodium::crypto_aead_chacha20poly1305_ietf_decrypt_detached(data.data(), nullptr, data.data(), msg_size,
                data.data() + msg_size, aad.data(), aad.size(), nonce.data(), key.data()) != 0) [[unlikely]] {
            secure_clear(data);
            data.clear();
            throw error_type {};
        }
        data.resize(msg_size);
    }

    void encrypt(const key_t &key, const nonce_t &nonce, const buffer aad, uint8_vector &data)
    {
        cipher {}.encrypt(key, nonce, aad, data);
    }

    void decrypt(const key_t &key, const nonce_t &nonce, const buffer aad, uint8_vector &data)
    {
        cipher {}.decrypt(key, nonce, aad, data);
    }
}

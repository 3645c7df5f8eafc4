/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include "ed25519.hpp"
#include "sodium.hpp"

namespace stfx::crypto::ed25519 {
    static_assert(sizeof(skey_t) == crypto_sign_SECRETKEYBYTES);
    static_assert(sizeof(seed_t) == crypto_sign_SEEDBYTES);
    static_assert(sizeof(vkey_t) == crypto_sign_PUBLICKEYBYTES);
    static_assert(sizeof(signature_t) == crypto_sign_BYTES);

    public_key_t::public_key_t(const vkey_t &vk):
        _vk { vk }
    {
    }

    bool public_key_t::verify(const buffer msg, const signature_t &sig) const
    {
        sodium::ensure_initialized();
        // libsodium compares the recomputed R in constant time and rejects non-canonical and small-order inputs
        return sodium::crypto_sign_verify_detached(sig.data(), msg.data(), msg.size(), _vk.data()) == 0;
    }

    bool public_key_t::verify(const buffer msg, const buffer sig) const
    {
        if (sig.size() != sizeof(signature_t))
            return false;
        return verify(msg, signature_t { sig });
    }

    key_pair_t key_pair_t::generate(random::source_t &src)
    {
        return key_pair_t { random::generate<seed_t>(src) };
    }

    key_pair_t::key_pair_t(const seed_t &sd)
    {
        sodium::ensure_initialized();
        vkey_t vk;
        if (sodium::crypto_sign_seed_keypair(vk.data(), _sk.data(), sd.data()) != 0) [[unlikely]]
            throw signing_error("failed to generate a cryptographic key pair!");
        _pk = public_key_t { vk };
    }

    signature_t key_pair_t::sign(const buffer msg) const
    {
        sodium::ensure_initialized();
        signature_t sig;
        if (sodium::crypto_sign_detached(sig.data(), nullptr, msg.data(), msg.size(), _sk.data()) != 0) [[unlikely]]
            throw signing_error("failed to sign a message!");
        return sig;
    }

    bool verify(const signature_t &sig, const buffer &msg, const vkey_t &vk)
    {
        return public_key_t { vk }.verify(msg, sig);
    }
}

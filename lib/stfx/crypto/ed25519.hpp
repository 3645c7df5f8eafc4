#pragma once
/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <stfx/common/bytes.hpp>
#include "random.hpp"
#include "traits.hpp"

namespace stfx::crypto::ed25519
{
    struct seed_tag;
    struct vkey_tag;

    using skey_t = secure_byte_array<64>;
    using seed_t = secure_byte_array<32, seed_tag>;
    using vkey_t = byte_array<32, vkey_tag>;
    using signature_t = byte_array<64>;

    // Verification needs only the public key.
    struct public_key_t: verifier_t<signature_t> {
        using verifier_t::verify;

        public_key_t() =default;
        explicit public_key_t(const vkey_t &vk);

        bool verify(buffer msg, const signature_t &sig) const override;
        // accepts signatures of unknown length: anything other than 64 bytes is a plain failure
        [[nodiscard]] bool verify(buffer msg, buffer sig) const;

        const vkey_t &bytes() const noexcept
        {
            return _vk;
        }

        bool operator==(const public_key_t &o) const noexcept
        {
            return _vk == o._vk;
        }
    private:
        vkey_t _vk {};
    };

    struct key_pair_t: signer_t<signature_t> {
        using public_key_type = public_key_t;

        // draws exactly sizeof(seed_t) bytes from src
        static key_pair_t generate(random::source_t &src=random::os_source());

        key_pair_t(const key_pair_t &) =delete;
        key_pair_t(key_pair_t &&) =default;
        key_pair_t &operator=(const key_pair_t &) =delete;

        // deterministic: no randomness is consumed
        signature_t sign(buffer msg) const override;

        const public_key_t &public_key() const noexcept
        {
            return _pk;
        }
    private:
        skey_t _sk;
        public_key_t _pk;

        explicit key_pair_t(const seed_t &sd);
    };

    extern bool verify(const signature_t &sig, const buffer &msg, const vkey_t &vk);
}

#pragma once
/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <stfx/common/bytes.hpp>
#include "random.hpp"
#include "traits.hpp"

namespace stfx::crypto::x25519
{
    struct skey_tag;
    struct pkey_tag;

    using skey_t = secure_byte_array<32, skey_tag>;
    using pkey_t = byte_array<32, pkey_tag>;

    // A Montgomery u-coordinate. Kept distinct from Ed25519 verifying keys of the same size.
    struct public_key_t {
        public_key_t() =default;
        explicit public_key_t(const pkey_t &pk);

        const pkey_t &bytes() const noexcept
        {
            return _pk;
        }

        bool operator==(const public_key_t &o) const noexcept
        {
            return _pk == o._pk;
        }
    private:
        pkey_t _pk {};
    };

    struct key_pair_t: key_agreement_t<public_key_t> {
        using public_key_type = public_key_t;

        // draws exactly sizeof(skey_t) bytes from src and clamps them
        static key_pair_t generate(random::source_t &src=random::os_source());

        key_pair_t(const key_pair_t &) =delete;
        key_pair_t(key_pair_t &&) =default;
        key_pair_t &operator=(const key_pair_t &) =delete;

        shared_secret_t diffie_hellman(const public_key_t &their_pk) const override;

        const public_key_t &public_key() const noexcept
        {
            return _pk;
        }
    private:
        skey_t _sk;
        public_key_t _pk;

        explicit key_pair_t(const skey_t &sk);
    };

    // RFC 7748 section 5 scalar clamping
    extern void clamp(std::span<uint8_t, 32> sk) noexcept;
    // true for the points whose multiples collapse into a small subgroup, including the identity
    extern bool has_small_order(const pkey_t &pk) noexcept;
}

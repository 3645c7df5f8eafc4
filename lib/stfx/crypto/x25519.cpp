/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include "x25519.hpp"
#include "sodium.hpp"

namespace stfx::crypto::x25519 {
    static_assert(sizeof(skey_t) == crypto_scalarmult_curve25519_SCALARBYTES);
    static_assert(sizeof(pkey_t) == crypto_scalarmult_curve25519_BYTES);
    static_assert(sizeof(shared_secret_t) == crypto_scalarmult_curve25519_BYTES);

    void clamp(const std::span<uint8_t, 32> sk) noexcept
    {
        sk[0] &= 248;
        sk[31] &= 127;
        sk[31] |= 64;
    }

    bool has_small_order(const pkey_t &pk) noexcept
    {
        // 0, 1, two points of order 8, and the non-canonical encodings p-1, p, p+1
        static const std::array<pkey_t, 7> blocklist {
            pkey_t::from_hex("0000000000000000000000000000000000000000000000000000000000000000"),
            pkey_t::from_hex("0100000000000000000000000000000000000000000000000000000000000000"),
            pkey_t::from_hex("E0EB7A7C3B41B8AE1656E3FAF19FC46ADA098DEB9C32B1FD866205165F49B800"),
            pkey_t::from_hex("5F9C95BCA3508C24B1D0B1559C83EF5B04445CC4581C8E86D8224EDDD09F1157"),
            pkey_t::from_hex("ECFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFF7F"),
            pkey_t::from_hex("EDFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFF7F"),
            pkey_t::from_hex("EEFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFF7F")
        };
        // the top bit of the u-coordinate is ignored by X25519
        bool found = false;
        for (const auto &bad: blocklist) {
            uint8_t diff = (pk[31] & 0x7F) ^ bad[31];
            for (size_t i = 0; i < 31; ++i)
                diff |= pk[i] ^ bad[i];
            found |= diff == 0;
        }
        return found;
    }

    public_key_t::public_key_t(const pkey_t &pk):
        _pk { pk }
    {
    }

    key_pair_t key_pair_t::generate(random::source_t &src)
    {
        return key_pair_t { random::generate<skey_t>(src) };
    }

    key_pair_t::key_pair_t(const skey_t &sk):
        _sk { sk }
    {
        sodium::ensure_initialized();
        clamp(_sk);
        pkey_t pk;
        if (sodium::crypto_scalarmult_curve25519_base(pk.data(), _sk.data()) != 0) [[unlikely]]
            throw key_agreement_error("failed to derive an X25519 public key!");
        _pk = public_key_t { pk };
    }

    shared_secret_t key_pair_t::diffie_hellman(const public_key_t &their_pk) const
    {
        if (has_small_order(their_pk.bytes())) [[unlikely]]
            throw key_agreement_error("the peer's public key is a low-order point");
        sodium::ensure_initialized();
        shared_secret_t ss;
        // libsodium also fails when the result is all zeros
        if (sodium::crypto_scalarmult_curve25519(ss.data(), _sk.data(), their_pk.bytes().data()) != 0) [[unlikely]]
            throw key_agreement_error("the peer's public key produced a degenerate shared secret");
        return ss;
    }
}

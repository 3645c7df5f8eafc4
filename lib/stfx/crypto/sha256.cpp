/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include "sha256.hpp"
#include "sodium.hpp"

namespace stfx::crypto::sha256 {
    hash_t hasher::hash(const buffer data) const
    {
        sodium::ensure_initialized();
        static_assert(sizeof(hash_t) == crypto_hash_sha256_BYTES);
        hash_t out;
        sodium::crypto_hash_sha256_state state;
        int res = sodium::crypto_hash_sha256_init(&state);
        if (res == 0)
            res = sodium::crypto_hash_sha256_update(&state, data.data(), data.size());
        if (res == 0)
            res = sodium::crypto_hash_sha256_final(&state, out.data());
        sodium::sodium_memzero(&state, sizeof(state));
        if (res != 0) [[unlikely]]
            throw error("SHA-256 computation failed!");
        return out;
    }

    void digest(const hash_span_t &out, const buffer &in)
    {
        const auto res = hasher {}.hash(in);
        std::copy(res.begin(), res.end(), out.begin());
    }
}

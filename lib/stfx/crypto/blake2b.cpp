/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include "blake2b.hpp"
#include "sodium.hpp"

namespace stfx::crypto::blake2b {
    hash_t hasher::hash(const buffer data) const
    {
        sodium::ensure_initialized();
        hash_t out;
        sodium::crypto_generichash_blake2b_state state;
        int res = sodium::crypto_generichash_blake2b_init(&state, nullptr, 0, out.size());
        if (res == 0)
            res = sodium::crypto_generichash_blake2b_update(&state, data.data(), data.size());
        if (res == 0)
            res = sodium::crypto_generichash_blake2b_final(&state, out.data(), out.size());
        sodium::sodium_memzero(&state, sizeof(state));
        if (res != 0) [[unlikely]]
            throw error("BLAKE2b computation failed!");
        return out;
    }

    void digest(const hash_span_t &out, const buffer &in)
    {
        const auto res = hasher {}.hash(in);
        std::copy(res.begin(), res.end(), out.begin());
    }
}

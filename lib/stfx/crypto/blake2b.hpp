#pragma once
/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <stfx/common/bytes.hpp>
#include "traits.hpp"

namespace stfx::crypto::blake2b
{
    using hash_t = digest_t;
    using hash_span_t = std::span<uint8_t, sizeof(hash_t)>;

    // BLAKE2b with a 256-bit output and no key
    struct hasher: hasher_t {
        hash_t hash(buffer data) const override;
    };

    extern void digest(const hash_span_t &out, const buffer &in);

    template<typename T=hash_t>
    T digest(const buffer &in)
    {
        static_assert(sizeof(T) == sizeof(hash_t));
        T out;
        digest(hash_span_t { out.data(), out.size() }, in);
        return out;
    }
}

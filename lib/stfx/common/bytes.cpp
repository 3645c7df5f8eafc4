/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <stfx/crypto/sodium.hpp>
#include "bytes.hpp"

namespace stfx {
    void secure_clear(std::span<uint8_t> store)
    {
        if (!store.empty())
            crypto::sodium::sodium_memzero(store.data(), store.size());
    }
}

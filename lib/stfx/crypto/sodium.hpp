#pragma once
/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <cstdlib>
#include <stfx/common/error.hpp>

namespace stfx::crypto::sodium
{
    typedef stfx::error error;

    extern "C" {
#       include <sodium.h>
    }

    // Thread-safe, calls sodium_init once per process.
    extern void ensure_initialized();
}

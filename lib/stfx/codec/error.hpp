#pragma once
/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <stfx/common/error.hpp>

namespace stfx::codec {
    // an input that is not the canonical encoding of any byte sequence
    struct decode_error: error {
        using error::error;
    };
}

#pragma once
/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <stfx/common/error.hpp>

namespace stfx::crypto {
    // Each capability reports failures through its own exception type.
    // None of them carry key material or details that distinguish failure causes.

    struct signing_error: error {
        using error::error;
    };

    struct verification_error: error {
        verification_error():
            error { "signature verification failed" }
        {
        }
    };

    struct key_agreement_error: error {
        using error::error;
    };

    struct aead_error: error {
        aead_error():
            error { "AEAD authentication failed" }
        {
        }
    };

    struct random_error: error {
        using error::error;
    };
}

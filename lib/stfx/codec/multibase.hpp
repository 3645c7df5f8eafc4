#pragma once
/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <string>
#include <stfx/common/bytes.hpp>
#include "error.hpp"

// Self-describing text: a single prefix character names the base of the rest of the string.
namespace stfx::codec::multibase {
    enum class base_t: char {
        base16 = 'f',
        base64url = 'u'
    };

    extern std::string encode(base_t base, buffer data);
    extern base_t base_of(std::string_view text);
    extern uint8_vector decode(std::string_view text);
}

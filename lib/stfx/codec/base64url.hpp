#pragma once
/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <string>
#include <stfx/common/bytes.hpp>
#include "error.hpp"

/*
 * Base64url without padding: RFC 4648 section 5 with the alphabet A-Z a-z 0-9 - _ and no '=' characters.
 * The encoding is canonical: decode accepts exactly the strings that encode produces and throws decode_error
 * for anything else, including padding, foreign characters, a length of 4n+1, and non-zero trailing bits.
 */
namespace stfx::codec::base64url {
    extern std::string encode(buffer data);
    extern uint8_vector decode(std::string_view text);
    extern size_t encoded_size(size_t data_size) noexcept;
}

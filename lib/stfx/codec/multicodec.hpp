#pragma once
/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <string_view>
#include <stfx/common/bytes.hpp>
#include "error.hpp"

// Binary values prefixed with an unsigned LEB128 varint that identifies their algorithm.
namespace stfx::codec::multicodec {
    enum class code_t: uint64_t {
        sha2_256 = 0x12,
        x25519_pub = 0xec,
        ed25519_pub = 0xed,
        blake2b_256 = 0xb220
    };

    // the multiformats limit for unsigned varints
    static constexpr size_t max_varint_size = 9;

    struct decoded_t {
        uint64_t code;
        // points into the decoded input
        buffer payload;
    };

    extern void encode_varint(uint8_vector &out, uint64_t val);
    extern uint64_t decode_varint(buffer &in);
    extern uint8_vector encode(code_t code, buffer payload);
    extern decoded_t decode(buffer data);
    extern std::string_view name(code_t code);
    extern code_t from_name(std::string_view name);
}

#pragma once
/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <iostream>
#include <stfx/codec/base64url.hpp>
#include <stfx/codec/json.hpp>
#include <stfx/common/cli.hpp>

namespace stfx::cli {
    // command results go to stdout, diagnostics go to the logger
    inline void print_json(const codec::json::value &jv)
    {
        std::cout << codec::json::serialize_pretty(jv) << '\n';
    }

    // strict UTF-8: no overlong forms, no surrogates, nothing above U+10FFFF
    inline bool is_utf8(const buffer bytes)
    {
        size_t i = 0;
        while (i < bytes.size()) {
            const uint8_t b = bytes[i];
            size_t len;
            uint32_t cp;
            if (b < 0x80) {
                ++i;
                continue;
            }
            if (b >= 0xC2 && b <= 0xDF) {
                len = 2;
                cp = b & 0x1FU;
            } else if (b >= 0xE0 && b <= 0xEF) {
                len = 3;
                cp = b & 0x0FU;
            } else if (b >= 0xF0 && b <= 0xF4) {
                len = 4;
                cp = b & 0x07U;
            } else {
                return false;
            }
            if (bytes.size() - i < len)
                return false;
            for (size_t j = 1; j < len; ++j) {
                const uint8_t c = bytes[i + j];
                if ((c & 0xC0U) != 0x80U)
                    return false;
                cp = (cp << 6U) | (c & 0x3FU);
            }
            if ((len == 3 && cp < 0x800) || (len == 4 && (cp < 0x10000 || cp > 0x10FFFF)) || (cp >= 0xD800 && cp <= 0xDFFF))
                return false;
            i += len;
        }
        return true;
    }

    template<typename T>
    T decode_b64u(const std::string_view text)
    {
        auto bytes = codec::base64url::decode(text);
        // the vector may hold secret material
        const T res { static_cast<buffer>(bytes) };
        secure_clear(bytes);
        return res;
    }
}

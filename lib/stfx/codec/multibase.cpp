/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include "base64url.hpp"
#include "multibase.hpp"

namespace stfx::codec::multibase {
    namespace {
        std::string encode_base16(const buffer data)
        {
            return fmt::format("{}", buffer_lowercase { data.data(), data.size() });
        }

        uint8_vector decode_base16(const std::string_view hex)
        {
            if (hex.size() % 2 != 0) [[unlikely]]
                throw decode_error(fmt::format("base16 text must have an even number of characters but got {}", hex.size()));
            uint8_vector res(hex.size() / 2);
            for (size_t i = 0; i < hex.size(); ++i) {
                const char k = hex[i];
                uint8_t nibble;
                if (k >= '0' && k <= '9')
                    nibble = k - '0';
                else if (k >= 'a' && k <= 'f')
                    nibble = k - 'a' + 10;
                else [[unlikely]]
                    throw decode_error(fmt::format("a character outside of the lowercase base16 alphabet at position {}", i));
                res[i / 2] |= i % 2 ? nibble : nibble << 4;
            }
            return res;
        }
    }

    std::string encode(const base_t base, const buffer data)
    {
        switch (base) {
            case base_t::base16:
                return fmt::format("{}{}", static_cast<char>(base), encode_base16(data));
            case base_t::base64url:
                return fmt::format("{}{}", static_cast<char>(base), base64url::encode(data));
            default:
                throw error(fmt::format("unsupported multibase base: {}", static_cast<int>(base)));
        }
    }

    base_t base_of(const std::string_view text)
    {
        if (text.empty()) [[unlikely]]
            throw decode_error("multibase text must start with a base prefix");
        switch (text.front()) {
            case static_cast<char>(base_t::base16): return base_t::base16;
            case static_cast<char>(base_t::base64url): return base_t::base64url;
            default: throw decode_error(fmt::format("unsupported multibase prefix: 0x{:02X}", static_cast<uint8_t>(text.front())));
        }
    }

    uint8_vector decode(const std::string_view text)
    {
        switch (base_of(text)) {
            case base_t::base16: return decode_base16(text.substr(1));
            case base_t::base64url: return base64url::decode(text.substr(1));
            default: throw decode_error("unsupported multibase base");
        }
    }
}

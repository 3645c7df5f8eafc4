/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <array>
#include <utility>
#include "multicodec.hpp"

namespace stfx::codec::multicodec {
    static constexpr std::array<std::pair<code_t, std::string_view>, 4> known_codes {{
        { code_t::sha2_256, "sha2-256" },
        { code_t::x25519_pub, "x25519-pub" },
        { code_t::ed25519_pub, "ed25519-pub" },
        { code_t::blake2b_256, "blake2b-256" }
    }};

    void encode_varint(uint8_vector &out, uint64_t val)
    {
        while (val >= 0x80) {
            out << static_cast<uint8_t>((val & 0x7F) | 0x80);
            val >>= 7;
        }
        out << static_cast<uint8_t>(val);
    }

    uint64_t decode_varint(buffer &in)
    {
        uint64_t val = 0;
        for (size_t i = 0; i < in.size() && i < max_varint_size; ++i) {
            const auto b = in[i];
            val |= static_cast<uint64_t>(b & 0x7F) << (7 * i);
            if (!(b & 0x80)) {
                if (b == 0 && i > 0) [[unlikely]]
                    throw decode_error("a varint is not minimally encoded");
                in = in.subbuf(i + 1);
                return val;
            }
        }
        if (in.size() >= max_varint_size) [[unlikely]]
            throw decode_error(fmt::format("a varint is longer than {} bytes", max_varint_size));
        throw decode_error("a truncated varint");
    }

    uint8_vector encode(const code_t code, const buffer payload)
    {
        uint8_vector res {};
        res.reserve(payload.size() + 3);
        encode_varint(res, static_cast<uint64_t>(code));
        res << payload;
        return res;
    }

    decoded_t decode(const buffer data)
    {
        buffer rest = data;
        const auto code = decode_varint(rest);
        return { code, rest };
    }

    std::string_view name(const code_t code)
    {
        for (const auto &[c, n]: known_codes) {
            if (c == code)
                return n;
        }
        throw error(fmt::format("unsupported multicodec code: 0x{:X}", static_cast<uint64_t>(code)));
    }

    code_t from_name(const std::string_view name)
    {
        for (const auto &[c, n]: known_codes) {
            if (n == name)
                return c;
        }
        throw error(fmt::format("unsupported multicodec name: {}", name));
    }
}

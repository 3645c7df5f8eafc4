/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <stfx/crypto/sodium.hpp>
#include "base64url.hpp"

namespace stfx::codec::base64url {
    namespace sodium = crypto::sodium;
    static constexpr int variant = sodium_base64_VARIANT_URLSAFE_NO_PADDING;

    size_t encoded_size(const size_t data_size) noexcept
    {
        return data_size / 3 * 4 + (data_size % 3 ? data_size % 3 + 1 : 0);
    }

    std::string encode(const buffer data)
    {
        sodium::ensure_initialized();
        // includes the terminating zero written by libsodium
        const size_t max_size = sodium_base64_ENCODED_LEN(data.size(), variant);
        std::string res(max_size, '\0');
        sodium::sodium_bin2base64(res.data(), res.size(), data.data(), data.size(), variant);
        res.resize(encoded_size(data.size()));
        return res;
    }

    uint8_vector decode(const std::string_view text)
    {
        if (text.size() % 4 == 1) [[unlikely]]
            throw decode_error(fmt::format("base64url text of {} characters cannot be decoded", text.size()));
        sodium::ensure_initialized();
        uint8_vector res(text.size() / 4 * 3 + 2);
        size_t res_size = 0;
        // without an end pointer libsodium rejects any unparsed character and non-zero trailing bits
        if (sodium::sodium_base642bin(res.data(), res.size(), text.data(), text.size(), nullptr, &res_size, nullptr, variant) != 0) [[unlikely]]
            throw decode_error("base64url text contains an invalid character or non-canonical trailing bits");
        res.resize(res_size);
        return res;
    }
}

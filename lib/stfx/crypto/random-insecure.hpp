#pragma once
/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <stfx/common/bytes.hpp>
#include "error.hpp"
#include "random.hpp"

/*
 * NOT FOR PRODUCTION USE.
 * Replays a caller-supplied byte sequence in place of randomness so that tests can reproduce
 * key pairs and compare them against fixed regression vectors.
 */
namespace stfx::crypto::random {
    struct insecure_fixed_source_t: source_t {
        explicit insecure_fixed_source_t(const buffer bytes):
            _bytes { bytes }
        {
        }

        ~insecure_fixed_source_t() override
        {
            secure_clear(_bytes);
        }

        void fill(const write_buffer out) override
        {
            if (out.size() > _bytes.size() - _next) [[unlikely]]
                throw random_error(fmt::format("the fixed source has {} bytes left but {} were requested", _bytes.size() - _next, out.size()));
            std::copy_n(_bytes.begin() + _next, out.size(), out.begin());
            _next += out.size();
        }

        size_t remaining() const noexcept
        {
            return _bytes.size() - _next;
        }
    private:
        uint8_vector _bytes;
        size_t _next = 0;
    };
}

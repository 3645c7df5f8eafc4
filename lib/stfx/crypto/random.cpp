/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include "error.hpp"
#include "random.hpp"
#include "sodium.hpp"

namespace stfx::crypto::random {
    namespace {
        struct os_source_t: source_t {
            os_source_t()
            {
                sodium::ensure_initialized();
            }

            void fill(const write_buffer out) override
            {
                if (!out.empty())
                    sodium::randombytes_buf(out.data(), out.size());
            }
        };

        struct disabled_source_t: source_t {
            void fill(const write_buffer out) override
            {
                throw random_error(fmt::format("random number generation is disabled; requested {} bytes", out.size()));
            }
        };
    }

    source_t &os_source()
    {
        static os_source_t src {};
        return src;
    }

    source_t &disabled_source()
    {
        static disabled_source_t src {};
        return src;
    }

    void fill(const write_buffer out)
    {
        os_source().fill(out);
    }

    uint8_vector bytes(const size_t sz)
    {
        uint8_vector res(sz);
        fill(res);
        return res;
    }
}

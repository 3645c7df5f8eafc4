#pragma once
/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <stfx/common/bytes.hpp>

namespace stfx::crypto::random {
    struct source_t {
        virtual ~source_t() =default;
        // fills the whole of out or throws random_error
        virtual void fill(write_buffer out) =0;
    };

    // The process-wide secure source backed by the operating system's entropy.
    // Safe for concurrent use without external locking.
    extern source_t &os_source();
    // Always throws random_error. For builds and components that must never generate keys.
    extern source_t &disabled_source();

    extern void fill(write_buffer out);
    extern uint8_vector bytes(size_t sz);

    template<typename T>
    T generate(source_t &src=os_source())
    {
        T res;
        src.fill(res);
        return res;
    }
}

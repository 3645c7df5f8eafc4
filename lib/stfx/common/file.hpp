#pragma once
/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <filesystem>
#include <string>
#include <string_view>
#include "bytes.hpp"

namespace stfx::file {
    extern std::string install_path(std::string_view rel_path);
    extern uint8_vector read(const std::string &path);
    extern void write(const std::string &path, buffer data);

    // A file path inside the system's temporary directory; the file is removed on destruction.
    struct tmp {
        explicit tmp(const std::string_view name);
        ~tmp();

        tmp(const tmp &) =delete;
        tmp &operator=(const tmp &) =delete;

        const std::string &path() const noexcept
        {
            return _path;
        }

        operator const std::string &() const noexcept
        {
            return _path;
        }
    private:
        std::string _path;
    };
}

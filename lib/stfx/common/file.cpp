/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <array>
#include <cstdio>
#include <memory>
#include "file.hpp"
#include "logger.hpp"

namespace stfx::file {
    std::string install_path(const std::string_view rel_path)
    {
        return fmt::format("./{}", rel_path);
    }

    uint8_vector read(const std::string &path)
    {
        std::unique_ptr<FILE, decltype(&fclose)> f { fopen(path.c_str(), "rb"), &fclose };
        if (!f) [[unlikely]]
            throw error_sys(fmt::format("failed to open {} for reading", path));
        uint8_vector data {};
        std::array<uint8_t, 0x4000> chunk;
        for (;;) {
            const auto num_read = fread(chunk.data(), 1, chunk.size(), f.get());
            data << buffer { chunk.data(), num_read };
            if (num_read < chunk.size()) {
                if (ferror(f.get())) [[unlikely]]
                    throw error_sys(fmt::format("failed to read from {}", path));
                break;
            }
        }
        return data;
    }

    void write(const std::string &path, const buffer data)
    {
        std::unique_ptr<FILE, decltype(&fclose)> f { fopen(path.c_str(), "wb"), &fclose };
        if (!f) [[unlikely]]
            throw error_sys(fmt::format("failed to open {} for writing", path));
        if (!data.empty() && fwrite(data.data(), 1, data.size(), f.get()) != data.size()) [[unlikely]]
            throw error_sys(fmt::format("failed to write {} bytes to {}", data.size(), path));
    }

    tmp::tmp(const std::string_view name):
        _path { (std::filesystem::temp_directory_path() / name).string() }
    {
    }

    tmp::~tmp()
    {
        std::error_code ec {};
        if (!std::filesystem::remove(_path, ec) && ec)
            logger::warn("failed to remove a temporary file {}: {}", _path, ec.message());
    }
}

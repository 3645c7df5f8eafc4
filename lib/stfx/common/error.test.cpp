/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <cerrno>
#include "test.hpp"
#include "error.hpp"

namespace {
    using namespace stfx;
}

suite stfx_common_error_suite = [] {
    "stfx::common::error"_test = [] {
        "message"_test = [] {
            const error err { fmt::format("Hello {}!", "world") };
            expect_equal(std::string_view { "Hello world!" }, std::string_view { err.what() });
        };
        "nested"_test = [] {
            const std::runtime_error cause { "low level" };
            const error err { "high level", cause };
            const std::string_view msg { err.what() };
            expect(msg.starts_with("high level caused by ")) << msg;
            expect(msg.ends_with(": low level")) << msg;
        };
        "sys"_test = [] {
            errno = ENOENT;
            const error_sys err { "open failed" };
            const std::string_view msg { err.what() };
            expect(msg.starts_with(fmt::format("open failed errno: {}", ENOENT))) << msg;
        };
        "hierarchy"_test = [] {
            expect(throws<std::exception>([] { throw error("base"); }));
            expect(throws<error>([] { throw error_sys("derived"); }));
        };
    };
};

/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#define ANKERL_NANOBENCH_IMPLEMENT 1
#include <iostream>
#include <stfx/common/benchmark.hpp>

int main(const int argc, const char **argv)
{
    using namespace stfx;
    if (argc >= 2) {
        std::cerr << fmt::format("using benchmark-filter mask: {}\n", argv[1]);
        boost::ut::cfg<boost::ut::override> = { .filter = argv[1] };
    }
    const bool res = boost::ut::cfg<boost::ut::override>.run();
    return res ? 1 : 0;
}

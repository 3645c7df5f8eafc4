/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include "test.hpp"
#include "cli.hpp"

namespace {
    using namespace stfx;
    using namespace stfx::cli;

    config make_config()
    {
        config cfg {};
        cfg.name = "test-cmd";
        cfg.args.expect({ "<a>", "[<b>]" });
        cfg.opts.try_emplace("mode", "an option with a default", "fast");
        cfg.opts.try_emplace("flag", "an option without a default");
        return cfg;
    }
}

suite stfx_common_cli_suite = [] {
    "stfx::common::cli"_test = [] {
        "argument bounds"_test = [] {
            argument_config args {};
            args.expect({ "<a>", "<b>", "[<c>]" });
            expect_equal(2ULL, args.min);
            expect(args.max && *args.max == 3);
            args.expect({ "<a>", "[<b> ...]" });
            expect_equal(1ULL, args.min);
            expect(!args.max);
        };
        "defaults"_test = [] {
            const auto cfg = make_config();
            arguments args { "x" };
            const auto opts = parse_options(cfg, args);
            expect_equal(1ULL, args.size());
            expect(opts.at("mode") == "fast");
            expect(!opts.at("flag"));
        };
        "named options"_test = [] {
            const auto cfg = make_config();
            arguments args { "--mode=slow", "x", "--flag", "y" };
            const auto opts = parse_options(cfg, args);
            expect(args == arguments { "x", "y" });
            expect(opts.at("mode") == "slow");
            expect(opts.at("flag") == "");
        };
        "invalid input"_test = [] {
            const auto cfg = make_config();
            arguments no_args {};
            expect(throws<error>([&] { parse_options(cfg, no_args); }));
            arguments too_many { "x", "y", "z" };
            expect(throws<error>([&] { parse_options(cfg, too_many); }));
            arguments unknown { "--verbose", "x" };
            expect(throws<error>([&] { parse_options(cfg, unknown); }));
        };
        "usage"_test = [] {
            expect_equal(std::string { "test-cmd [--flag] [--mode] <a> [<b>]" }, make_config().usage());
        };
        "unknown command"_test = [] {
            const char *argv[] { "stfx", "no-such-command" };
            expect_equal(1, cli::run(2, argv));
            expect_equal(1, cli::run(1, argv));
        };
    };
};

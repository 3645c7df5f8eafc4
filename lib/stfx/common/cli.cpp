/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <iostream>
#include "cli.hpp"

namespace stfx::cli {
    void argument_config::expect(const std::initializer_list<std::string> &args)
    {
        names = args;
        min = 0;
        max = 0;
        for (const auto &n: names) {
            if (n.ends_with("...]") || n.ends_with("...")) {
                max.reset();
            } else {
                if (!n.starts_with('['))
                    ++min;
                if (max)
                    ++(*max);
            }
        }
    }

    std::string config::usage() const
    {
        std::string res = fmt::format("{}", name);
        for (const auto &[opt_name, opt]: opts)
            res += fmt::format(" [--{}]", opt_name);
        for (const auto &arg_name: args.names)
            res += fmt::format(" {}", arg_name);
        return res;
    }

    static command::command_map &_registry()
    {
        static command::command_map commands {};
        return commands;
    }

    const command::command_map &command::registry()
    {
        return _registry();
    }

    command::ptr_type command::reg(const ptr_type &cmd)
    {
        config cfg {};
        cmd->configure(cfg);
        const auto [it, created] = _registry().try_emplace(cfg.name, cmd);
        if (!created) [[unlikely]]
            throw error(fmt::format("a command with name {} has already been registered!", cfg.name));
        return cmd;
    }

    options parse_options(const config &cmd, arguments &args)
    {
        options opts {};
        arguments positional {};
        for (const auto &arg: args) {
            if (arg.starts_with("--")) {
                const auto eq_pos = arg.find('=');
                const auto name = arg.substr(2, eq_pos == std::string::npos ? std::string::npos : eq_pos - 2);
                if (!cmd.opts.contains(name)) [[unlikely]]
                    throw error(fmt::format("unsupported option --{} for command {}", name, cmd.name));
                opts.insert_or_assign(name, eq_pos == std::string::npos ? std::string {} : arg.substr(eq_pos + 1));
            } else {
                positional.emplace_back(arg);
            }
        }
        for (const auto &[name, opt]: cmd.opts) {
            if (!opts.contains(name))
                opts.try_emplace(name, opt.default_value);
        }
        if (positional.size() < cmd.args.min || (cmd.args.max && positional.size() > *cmd.args.max)) [[unlikely]]
            throw error(fmt::format("invalid number of arguments: {}, usage: {}", positional.size(), cmd.usage()));
        args = std::move(positional);
        return opts;
    }

    static void print_usage(const char *prog)
    {
        std::cerr << fmt::format("Usage: {} <command> [<options>] [<arguments>]\nCommands:\n", prog);
        for (const auto &[name, cmd]: command::registry()) {
            config cfg {};
            cmd->configure(cfg);
            std::cerr << fmt::format("    {}\n        {}\n", cfg.usage(), cfg.desc);
        }
    }

    int run(const int argc, const char **argv)
    {
        if (argc < 2) {
            print_usage(argv[0]);
            return 1;
        }
        const std::string cmd_name { argv[1] };
        const auto it = command::registry().find(cmd_name);
        if (it == command::registry().end()) {
            std::cerr << fmt::format("Unknown command: {}\n", cmd_name);
            print_usage(argv[0]);
            return 1;
        }
        int res = 0;
        const auto ex = logger::run_log_errors([&] {
            config cfg {};
            it->second->configure(cfg);
            arguments args { argv + 2, argv + argc };
            const auto opts = parse_options(cfg, args);
            logger::debug("running command {} with {} arguments", cfg.name, args.size());
            it->second->run(args, opts);
        });
        if (ex)
            res = 1;
        return res;
    }
}

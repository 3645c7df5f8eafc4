#pragma once
/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <initializer_list>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "error.hpp"
#include "logger.hpp"

namespace stfx::cli {
    using arguments = std::vector<std::string>;
    using options = std::map<std::string, std::optional<std::string>>;

    struct option_config {
        std::string desc;
        std::optional<std::string> default_value {};

        option_config(const std::string_view d, const std::optional<std::string> &def={}):
            desc { d }, default_value { def }
        {
        }
    };

    struct argument_config {
        std::vector<std::string> names {};
        size_t min = 0;
        std::optional<size_t> max {};

        // names in square brackets are optional, a trailing "..." allows any number of extra arguments
        void expect(const std::initializer_list<std::string> &args);
    };

    struct config {
        std::string name {};
        std::string desc {};
        argument_config args {};
        std::map<std::string, option_config> opts {};

        std::string usage() const;
    };

    struct command {
        using ptr_type = std::shared_ptr<command>;
        using command_map = std::map<std::string, ptr_type>;

        static const command_map &registry();
        static ptr_type reg(const ptr_type &cmd);

        virtual ~command() =default;
        virtual void configure(config &cmd) const =0;

        virtual void run(const arguments &) const
        {
            throw error("command must override one of the run methods!");
        }

        virtual void run(const arguments &args, const options &) const
        {
            run(args);
        }
    };

    // parses --name=value and --name options, validates them against the command's config
    extern options parse_options(const config &cmd, arguments &args);
    extern int run(int argc, const char **argv);
}

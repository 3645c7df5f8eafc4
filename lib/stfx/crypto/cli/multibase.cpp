/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <stfx/codec/multibase.hpp>
#include <stfx/codec/multicodec.hpp>
#include "output.hpp"

namespace stfx::cli::multibase {
    struct cmd: command {
        void configure(config &cmd) const override
        {
            cmd.name = "multibase-encode";
            cmd.desc = "Prefix hex-encoded <hex> bytes with the multicodec <code> and encode them as multibase base64url";
            cmd.args.expect({ "<code>", "<hex>" });
        }

        void run(const arguments &args) const override
        {
            const auto code = codec::multicodec::from_name(args.at(0));
            const auto data = codec::multicodec::encode(code, uint8_vector::from_hex(args.at(1)));
            print_json(codec::json::object {
                { "code", codec::multicodec::name(code) },
                { "multibase", codec::multibase::encode(codec::multibase::base_t::base64url, data) }
            });
        }
    };
    static auto instance = command::reg(std::make_shared<cmd>());
}

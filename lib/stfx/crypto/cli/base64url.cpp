/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include "output.hpp"

namespace stfx::cli::base64url {
    struct encode_cmd: command {
        void configure(config &cmd) const override
        {
            cmd.name = "encode";
            cmd.desc = "Convert hex-encoded <hex> bytes into base64url text";
            cmd.args.expect({ "<hex>" });
        }

        void run(const arguments &args) const override
        {
            const auto data = uint8_vector::from_hex(args.at(0));
            print_json(codec::json::object {
                { "b64u", codec::base64url::encode(data) }
            });
        }
    };
    static auto encode_instance = command::reg(std::make_shared<encode_cmd>());

    struct decode_cmd: command {
        void configure(config &cmd) const override
        {
            cmd.name = "decode";
            cmd.desc = "Convert base64url text <b64u> into hex-encoded bytes";
            cmd.args.expect({ "<b64u>" });
        }

        void run(const arguments &args) const override
        {
            const auto data = codec::base64url::decode(args.at(0));
            print_json(codec::json::object {
                { "hex", fmt::format("{}", buffer_lowercase { data.data(), data.size() }) }
            });
        }
    };
    static auto decode_instance = command::reg(std::make_shared<decode_cmd>());
}

/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <stfx/crypto/ed25519.hpp>
#include "output.hpp"

namespace stfx::cli::sign {
    using namespace stfx::crypto;
    using codec::base64url::encode;

    static bool verify_and_print(const std::string_view pub_b64u, const std::string_view sig_b64u, const buffer msg)
    {
        const ed25519::public_key_t pk { decode_b64u<ed25519::vkey_t>(pub_b64u) };
        const auto sig = codec::base64url::decode(sig_b64u);
        const auto valid = pk.verify(msg, sig);
        print_json(codec::json::object {
            { "valid", valid }
        });
        return valid;
    }

    struct sign_cmd: command {
        void configure(config &cmd) const override
        {
            cmd.name = "sign";
            cmd.desc = "Sign <text> with a freshly generated Ed25519 key pair";
            cmd.args.expect({ "<text>" });
            cmd.opts.try_emplace("out", "also save the signed document as JSON to this path");
        }

        void run(const arguments &args, const options &opts) const override
        {
            const auto &msg = args.at(0);
            const auto kp = ed25519::key_pair_t::generate();
            logger::debug("signing {} bytes with an ephemeral key pair", msg.size());
            const codec::json::object doc {
                { "msg_b64u", encode(msg) },
                { "pub_b64u", encode(kp.public_key().bytes()) },
                { "sig_b64u", encode(kp.sign(msg)) }
            };
            if (const auto &out = opts.at("out"); out) {
                if (out->empty()) [[unlikely]]
                    throw error("--out requires a path");
                codec::json::save_pretty(*out, doc);
                logger::info("saved the signed document to {}", *out);
            }
            print_json(doc);
        }
    };
    static auto sign_instance = command::reg(std::make_shared<sign_cmd>());

    struct verify_cmd: command {
        void configure(config &cmd) const override
        {
            cmd.name = "verify";
            cmd.desc = "Check an Ed25519 signature <sig-b64u> of <text> against the public key <pub-b64u>";
            cmd.args.expect({ "<pub-b64u>", "<sig-b64u>", "<text>" });
        }

        void run(const arguments &args) const override
        {
            if (!verify_and_print(args.at(0), args.at(1), args.at(2)))
                throw verification_error {};
        }
    };
    static auto verify_instance = command::reg(std::make_shared<verify_cmd>());

    struct verify_file_cmd: command {
        void configure(config &cmd) const override
        {
            cmd.name = "verify-file";
            cmd.desc = "Check a signed JSON document at <path> as saved by sign --out";
            cmd.args.expect({ "<path>" });
        }

        void run(const arguments &args) const override
        {
            const auto &path = args.at(0);
            const auto doc = codec::json::load(path);
            if (!doc.is_object()) [[unlikely]]
                throw error(fmt::format("{} does not contain a JSON object", path));
            const auto &obj = doc.get_object();
            const auto field = [&](const std::string_view key) -> std::string_view {
                const auto *jv = obj.if_contains(key);
                if (!jv || !jv->is_string()) [[unlikely]]
                    throw error(fmt::format("{} lacks a string field {}", path, key));
                return jv->get_string();
            };
            const auto msg = codec::base64url::decode(field("msg_b64u"));
            if (!verify_and_print(field("pub_b64u"), field("sig_b64u"), msg))
                throw verification_error {};
        }
    };
    static auto verify_file_instance = command::reg(std::make_shared<verify_file_cmd>());
}

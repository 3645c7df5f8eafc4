/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <stfx/crypto/chacha20-poly1305.hpp>
#include "output.hpp"

namespace stfx::cli::seal {
    namespace aead = stfx::crypto::chacha20_poly1305;

    static void configure_aead(config &cmd)
    {
        cmd.opts.try_emplace("aad", "additional authenticated data", "");
    }

    struct seal_cmd: command {
        void configure(config &cmd) const override
        {
            cmd.name = "seal";
            cmd.desc = "Encrypt <text> with ChaCha20-Poly1305 under a 32-byte <key-b64u> and a 12-byte <nonce-b64u>";
            cmd.args.expect({ "<key-b64u>", "<nonce-b64u>", "<text>" });
            configure_aead(cmd);
        }

        void run(const arguments &args, const options &opts) const override
        {
            const auto key = decode_b64u<aead::key_t>(args.at(0));
            const auto nonce = decode_b64u<aead::nonce_t>(args.at(1));
            const auto aad = opts.at("aad").value_or("");
            uint8_vector data { args.at(2) };
            aead::encrypt(key, nonce, aad, data);
            print_json(codec::json::object {
                { "ciphertext_b64u", codec::base64url::encode(data) }
            });
        }
    };
    static auto seal_instance = command::reg(std::make_shared<seal_cmd>());

    struct open_cmd: command {
        void configure(config &cmd) const override
        {
            cmd.name = "open";
            cmd.desc = "Decrypt and authenticate ChaCha20-Poly1305 ciphertext <ct-b64u>";
            cmd.args.expect({ "<key-b64u>", "<nonce-b64u>", "<ct-b64u>" });
            configure_aead(cmd);
        }

        void run(const arguments &args, const options &opts) const override
        {
            const auto key = decode_b64u<aead::key_t>(args.at(0));
            const auto nonce = decode_b64u<aead::nonce_t>(args.at(1));
            const auto aad = opts.at("aad").value_or("");
            auto data = codec::base64url::decode(args.at(2));
            aead::decrypt(key, nonce, aad, data);
            codec::json::object res {
                { "plaintext_b64u", codec::base64url::encode(data) }
            };
            // JSON strings must be valid UTF-8
            if (is_utf8(data))
                res.emplace("plaintext", data.str());
            else
                logger::debug("the decrypted {} bytes are not UTF-8 text, printing base64url only", data.size());
            print_json(res);
        }
    };
    static auto open_instance = command::reg(std::make_shared<open_cmd>());
}

/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <stfx/crypto/chacha20-poly1305.hpp>
#include <stfx/crypto/ed25519.hpp>
#include <stfx/crypto/sha256.hpp>
#include <stfx/crypto/x25519.hpp>
#include "output.hpp"

namespace stfx::cli::demo {
    using namespace stfx::crypto;
    using codec::base64url::encode;

    struct cmd: command {
        void configure(config &cmd) const override
        {
            cmd.name = "demo";
            cmd.desc = "Walk through signing, key agreement and authenticated encryption with freshly generated keys";
        }

        void run(const arguments &) const override
        {
            {
                logger::info("Ed25519 signing");
                const auto kp = ed25519::key_pair_t::generate();
                const std::string_view msg { "hello TSP" };
                const auto sig = kp.sign(msg);
                kp.public_key().verify_or_throw(msg, sig);
                print_json(codec::json::object {
                    { "msg_b64u", encode(msg) },
                    { "pub_b64u", encode(kp.public_key().bytes()) },
                    { "sig_b64u", encode(sig) }
                });
            }
            {
                logger::info("X25519 key agreement");
                const auto alice = x25519::key_pair_t::generate();
                const auto bob = x25519::key_pair_t::generate();
                const auto shared_secret = alice.diffie_hellman(bob.public_key());
                if (shared_secret != bob.diffie_hellman(alice.public_key())) [[unlikely]]
                    throw error("the parties derived different shared secrets");
                print_json(codec::json::object {
                    { "shared_secret_b64u", encode(shared_secret) }
                });
            }
            {
                logger::info("ChaCha20-Poly1305 AEAD");
                const chacha20_poly1305::key_t key { sha256::digest("key material") };
                const chacha20_poly1305::nonce_t nonce {};
                const std::string_view aad { "envelope metadata" };
                const std::string_view plaintext { "secret payload" };
                uint8_vector data { plaintext };
                chacha20_poly1305::encrypt(key, nonce, aad, data);
                const auto ciphertext_b64u = encode(data);
                chacha20_poly1305::decrypt(key, nonce, aad, data);
                if (data.str() != plaintext) [[unlikely]]
                    throw error("the decrypted text differs from the plaintext");
                print_json(codec::json::object {
                    { "ciphertext_b64u", ciphertext_b64u },
                    { "tag_appended", true },
                    { "decrypted", data.str() }
                });
            }
        }
    };
    static auto instance = command::reg(std::make_shared<cmd>());
}

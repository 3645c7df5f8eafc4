/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <stfx/common/file.hpp>
#include <stfx/crypto/blake2b.hpp>
#include <stfx/crypto/sha256.hpp>
#include "output.hpp"

namespace stfx::cli::hash {
    using namespace stfx::crypto;

    static void configure_alg(config &cmd)
    {
        cmd.opts.try_emplace("alg", "the hash algorithm: sha256 or blake2b256", "sha256");
    }

    static void print_digest(const options &opts, const buffer data)
    {
        const auto alg = opts.at("alg").value_or("");
        std::unique_ptr<hasher_t> hasher {};
        if (alg == "sha256")
            hasher = std::make_unique<sha256::hasher>();
        else if (alg == "blake2b256")
            hasher = std::make_unique<blake2b::hasher>();
        else
            throw error(fmt::format("unsupported hash algorithm: {}", alg));
        logger::debug("hashing {} bytes with {}", data.size(), alg);
        print_json(codec::json::object {
            { "alg", alg },
            { "digest_b64u", codec::base64url::encode(hasher->hash(data)) }
        });
    }

    struct hash_cmd: command {
        void configure(config &cmd) const override
        {
            cmd.name = "hash";
            cmd.desc = "Compute a 32-byte digest of <text>";
            cmd.args.expect({ "<text>" });
            configure_alg(cmd);
        }

        void run(const arguments &args, const options &opts) const override
        {
            print_digest(opts, args.at(0));
        }
    };
    static auto hash_instance = command::reg(std::make_shared<hash_cmd>());

    struct hash_file_cmd: command {
        void configure(config &cmd) const override
        {
            cmd.name = "hash-file";
            cmd.desc = "Compute a 32-byte digest of the contents of the file at <path>";
            cmd.args.expect({ "<path>" });
            configure_alg(cmd);
        }

        void run(const arguments &args, const options &opts) const override
        {
            print_digest(opts, file::read(args.at(0)));
        }
    };
    static auto hash_file_instance = command::reg(std::make_shared<hash_file_cmd>());
}

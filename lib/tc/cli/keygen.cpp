/* This file is part of Treasure Core project.
 * Copyright (c) 2025 Treasure Core contributors
 * This code is distributed under the license specified in the LICENSE file. */
#include <filesystem>
#include <tc/ed25519.hpp>
#include <tc/file.hpp>
#include <tc/cli/common.hpp>

namespace treasure_core::cli::keygen {
    struct cmd: command {
        void configure(config &cmd) const override
        {
            cmd.name = "keygen";
            cmd.desc = "create a new ed25519 key pair, save its secret key to <key-file> and print its public key";
            cmd.args.expect({ "<key-file>" });
        }

        void run(const arguments &args) const override
        {
            const auto &key_path = args.at(0);
            if (std::filesystem::exists(key_path))
                throw error("key file {} already exists!", key_path);
            const auto [sk, vk] = ed25519::create();
            const auto sk_hex = fmt::format("{}\n", sk);
            file::write(key_path, sk_hex);
            logger::info("saved the secret key of {} to {}", vk, key_path);
            std::cout << fmt::format("{}\n", vk);
        }
    };
    static auto instance = command::reg(std::make_shared<cmd>());
}

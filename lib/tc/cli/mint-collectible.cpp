/* This file is part of Treasure Core project.
 * Copyright (c) 2025 Treasure Core contributors
 * This code is distributed under the license specified in the LICENSE file. */
#include <tc/ed25519.hpp>
#include <tc/cli/common.hpp>

namespace treasure_core::cli::mint_collectible {
    struct cmd: command {
        void configure(config &cmd) const override
        {
            cmd.name = "mint-collectible";
            cmd.desc = "issue a new collectible paid by the signer to <recipient> and print its asset address";
            cmd.args.expect({ "<state-file>", "<payer-key-file>", "<recipient>", "<title>", "<symbol>", "<uri>" });
        }

        void run(const arguments &args) const override
        {
            common::session s { args.at(0) };
            const auto payer = common::load_signer(args.at(1));
            const auto recipient = common::parse_address(args.at(2));
            const program::collectible::metadata meta { args.at(3), args.at(4), args.at(5) };
            const auto mint_target = ed25519::create().second;
            s.ep.mint_collectible(payer, recipient, mint_target, meta);
            s.save();
            std::cout << fmt::format("{}\n", mint_target);
        }
    };
    static auto instance = command::reg(std::make_shared<cmd>());
}

/* This file is part of Treasure Core project.
 * Copyright (c) 2025 Treasure Core contributors
 * This code is distributed under the license specified in the LICENSE file. */
#include <tc/ed25519.hpp>
#include <tc/cli/common.hpp>

namespace treasure_core::cli::mint_claim_collectible {
    struct cmd: command {
        void configure(config &cmd) const override
        {
            cmd.name = "mint-claim-collectible";
            cmd.desc = "issue the collectible of the claimed deposit at <record> to its depositor and print its asset address";
            cmd.args.expect({ "<state-file>", "<payer-key-file>", "<depositor>", "<record>", "<title>", "<symbol>", "<uri>" });
        }

        void run(const arguments &args) const override
        {
            common::session s { args.at(0) };
            const auto payer = common::load_signer(args.at(1));
            const auto depositor = common::parse_address(args.at(2));
            const auto record_addr = common::parse_address(args.at(3));
            const program::collectible::metadata meta { args.at(4), args.at(5), args.at(6) };
            const auto mint_target = ed25519::create().second;
            const auto receipt_addr = s.ep.mint_claim_collectible(payer, depositor, record_addr, mint_target, meta);
            s.save();
            logger::info("receipt of the collectible: {}", receipt_addr);
            std::cout << fmt::format("{}\n", mint_target);
        }
    };
    static auto instance = command::reg(std::make_shared<cmd>());
}

/* This file is part of Treasure Core project.
 * Copyright (c) 2025 Treasure Core contributors
 * This code is distributed under the license specified in the LICENSE file. */
#include <tc/cli/common.hpp>

namespace treasure_core::cli::burn {
    struct cmd: command {
        void configure(config &cmd) const override
        {
            cmd.name = "burn";
            cmd.desc = "burn <amount> base units of the supply-ledger asset from the signer's holding";
            cmd.args.expect({ "<state-file>", "<owner-key-file>", "<amount>" });
        }

        void run(const arguments &args) const override
        {
            common::session s { args.at(0) };
            const auto owner = common::load_signer(args.at(1));
            const auto amount = common::parse_u64(args.at(2));
            const auto asset_id = s.ep.supply().asset_id;
            s.ep.burn(asset_id, owner, s.tokens.holding_address(owner, asset_id), amount);
            s.save();
            logger::info("supply after the burn: {}", s.ep.supply());
        }
    };
    static auto instance = command::reg(std::make_shared<cmd>());
}

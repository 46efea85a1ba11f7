/* This file is part of Treasure Core project.
 * Copyright (c) 2025 Treasure Core contributors
 * This code is distributed under the license specified in the LICENSE file. */
#include <tc/cli/common.hpp>

namespace treasure_core::cli::mint {
    struct cmd: command {
        void configure(config &cmd) const override
        {
            cmd.name = "mint";
            cmd.desc = "mint <amount> base units of the supply-ledger asset to <recipient>";
            cmd.args.expect({ "<state-file>", "<recipient>", "<amount>" });
        }

        void run(const arguments &args) const override
        {
            common::session s { args.at(0) };
            const auto recipient = common::parse_address(args.at(1));
            const auto amount = common::parse_u64(args.at(2));
            s.mint(recipient, amount);
            s.save();
            logger::info("supply after the mint: {}", s.ep.supply());
        }
    };
    static auto instance = command::reg(std::make_shared<cmd>());
}

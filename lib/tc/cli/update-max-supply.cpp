/* This file is part of Treasure Core project.
 * Copyright (c) 2025 Treasure Core contributors
 * This code is distributed under the license specified in the LICENSE file. */
#include <tc/cli/common.hpp>

namespace treasure_core::cli::update_max_supply {
    struct cmd: command {
        void configure(config &cmd) const override
        {
            cmd.name = "update-max-supply";
            cmd.desc = "change the cap of the supply ledger, \"none\" removes it";
            cmd.args.expect({ "<state-file>", "<authority-key-file>", "<new-max-supply>" });
        }

        void run(const arguments &args) const override
        {
            common::session s { args.at(0) };
            const auto caller = common::load_signer(args.at(1));
            s.ep.update_max_supply(caller, common::parse_opt_u64(args.at(2)));
            s.save();
            logger::info("supply after the update: {}", s.ep.supply());
        }
    };
    static auto instance = command::reg(std::make_shared<cmd>());
}

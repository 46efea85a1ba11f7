/* This file is part of Treasure Core project.
 * Copyright (c) 2025 Treasure Core contributors
 * This code is distributed under the license specified in the LICENSE file. */
#include <tc/cli/common.hpp>

namespace treasure_core::cli::update_authority {
    struct cmd: command {
        void configure(config &cmd) const override
        {
            cmd.name = "update-authority";
            cmd.desc = "hand over the control of the supply ledger to <new-authority>";
            cmd.args.expect({ "<state-file>", "<authority-key-file>", "<new-authority>" });
        }

        void run(const arguments &args) const override
        {
            common::session s { args.at(0) };
            const auto caller = common::load_signer(args.at(1));
            s.ep.update_authority(caller, common::parse_address(args.at(2)));
            s.save();
        }
    };
    static auto instance = command::reg(std::make_shared<cmd>());
}

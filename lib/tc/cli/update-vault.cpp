/* This file is part of Treasure Core project.
 * Copyright (c) 2025 Treasure Core contributors
 * This code is distributed under the license specified in the LICENSE file. */
#include <tc/cli/common.hpp>

namespace treasure_core::cli::update_vault {
    struct cmd: command {
        void configure(config &cmd) const override
        {
            cmd.name = "update-vault";
            cmd.desc = "hand over the control of the vault to <new-authority>, keeps the current one when not given";
            cmd.args.expect({ "<state-file>", "<authority-key-file>", "[<new-authority>]" });
        }

        void run(const arguments &args) const override
        {
            common::session s { args.at(0) };
            const auto caller = common::load_signer(args.at(1));
            std::optional<pubkey> new_authority {};
            if (args.size() > 2)
                new_authority = common::parse_address(args.at(2));
            s.ep.update_vault(caller, new_authority);
            s.save();
            logger::info("vault after the update: {}", s.ep.vault());
        }
    };
    static auto instance = command::reg(std::make_shared<cmd>());
}

/* This file is part of Treasure Core project.
 * Copyright (c) 2025 Treasure Core contributors
 * This code is distributed under the license specified in the LICENSE file. */
#include <tc/cli/common.hpp>

namespace treasure_core::cli::whitelist {
    struct cmd: command {
        void configure(config &cmd) const override
        {
            cmd.name = "whitelist";
            cmd.desc = "mark <asset> as accepted by the vault and print the entry's address";
            cmd.args.expect({ "<state-file>", "<authority-key-file>", "<asset>" });
            cmd.opts.try_emplace("disable", "record the asset as no longer accepted");
        }

        void run(const arguments &args, const options &opts) const override
        {
            common::session s { args.at(0) };
            const auto caller = common::load_signer(args.at(1));
            const auto asset_id = common::parse_address(args.at(2));
            const auto entry_addr = s.ep.whitelist(caller, asset_id, !opts.contains("disable"));
            s.save();
            std::cout << fmt::format("{}\n", entry_addr);
        }
    };
    static auto instance = command::reg(std::make_shared<cmd>());
}

/* This file is part of Treasure Core project.
 * Copyright (c) 2025 Treasure Core contributors
 * This code is distributed under the license specified in the LICENSE file. */
#include <tc/cli/common.hpp>

namespace treasure_core::cli::init_supply {
    struct cmd: command {
        void configure(config &cmd) const override
        {
            cmd.name = "init-supply";
            cmd.desc = "create the supply ledger of <asset> controlled by the signer and print its address";
            cmd.args.expect({ "<state-file>", "<authority-key-file>", "<asset>", "<decimals>" });
            cmd.opts.try_emplace("max-supply", "the cap of the total minted amount, unlimited when not given");
        }

        void run(const arguments &args, const options &opts) const override
        {
            common::session s { args.at(0) };
            const auto authority = common::load_signer(args.at(1));
            const auto asset_id = common::parse_address(args.at(2));
            const auto decimals = common::parse_u64(args.at(3));
            if (decimals > std::numeric_limits<uint8_t>::max())
                throw error("decimals must fit into a byte but got {}", decimals);
            std::optional<amount_t> max_supply {};
            if (const auto opt_it = opts.find("max-supply"); opt_it != opts.end()) {
                if (!opt_it->second)
                    throw error("--max-supply requires a value");
                max_supply = common::parse_u64(*opt_it->second);
            }
            const auto supply_addr = s.ep.init_supply(asset_id, authority, static_cast<uint8_t>(decimals), max_supply);
            s.save();
            std::cout << fmt::format("{}\n", supply_addr);
        }
    };
    static auto instance = command::reg(std::make_shared<cmd>());
}

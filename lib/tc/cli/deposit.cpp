/* This file is part of Treasure Core project.
 * Copyright (c) 2025 Treasure Core contributors
 * This code is distributed under the license specified in the LICENSE file. */
#include <tc/cli/common.hpp>

namespace treasure_core::cli::deposit {
    struct cmd: command {
        void configure(config &cmd) const override
        {
            cmd.name = "deposit";
            cmd.desc = "lock <amount> base units of <asset> from the signer's holding in the vault and print the deposit record's address";
            cmd.args.expect({ "<state-file>", "<depositor-key-file>", "<asset>", "<amount>", "<nonce>" });
        }

        void run(const arguments &args) const override
        {
            common::session s { args.at(0) };
            const auto depositor = common::load_signer(args.at(1));
            const auto asset_id = common::parse_address(args.at(2));
            const auto amount = common::parse_u64(args.at(3));
            const auto nonce = common::parse_u64(args.at(4));
            const auto record_addr = s.deposit(depositor, asset_id, amount, nonce);
            s.save();
            logger::info("deposit record {}: {}", record_addr, s.ep.deposit_at(record_addr));
            std::cout << fmt::format("{}\n", record_addr);
        }
    };
    static auto instance = command::reg(std::make_shared<cmd>());
}

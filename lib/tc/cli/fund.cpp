/* This file is part of Treasure Core project.
 * Copyright (c) 2025 Treasure Core contributors
 * This code is distributed under the license specified in the LICENSE file. */
#include <tc/cli/common.hpp>

namespace treasure_core::cli::fund {
    struct cmd: command {
        void configure(config &cmd) const override
        {
            cmd.name = "fund";
            cmd.desc = "mint <amount> base units of <asset> to the holding of <owner> signed by the asset's mint authority";
            cmd.args.expect({ "<state-file>", "<mint-authority-key-file>", "<asset>", "<owner>", "<amount>" });
        }

        void run(const arguments &args) const override
        {
            common::session s { args.at(0) };
            const auto authority = common::load_signer(args.at(1));
            const auto asset_id = common::parse_address(args.at(2));
            const auto owner = common::parse_address(args.at(3));
            const auto amount = common::parse_u64(args.at(4));
            const auto holding = s.host.execute("fund", [&](ledger::context &ctx) {
                const auto h = s.tokens.open_holding(ctx.tx, owner, asset_id);
                ctx.assets.mint_to(ctx.tx, asset_id, h, amount, authority);
                return h;
            });
            s.save();
            logger::info("funded holding {} of {} with {} units of {}", holding, owner, amount, asset_id);
            std::cout << fmt::format("{}\n", holding);
        }
    };
    static auto instance = command::reg(std::make_shared<cmd>());
}

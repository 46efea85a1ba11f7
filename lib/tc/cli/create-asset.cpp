/* This file is part of Treasure Core project.
 * Copyright (c) 2025 Treasure Core contributors
 * This code is distributed under the license specified in the LICENSE file. */
#include <tc/ed25519.hpp>
#include <tc/cli/common.hpp>

namespace treasure_core::cli::create_asset {
    struct cmd: command {
        void configure(config &cmd) const override
        {
            cmd.name = "create-asset";
            cmd.desc = "create a new fungible asset with the signer as its mint authority and print its address";
            cmd.args.expect({ "<state-file>", "<signer-key-file>", "<decimals>" });
            cmd.opts.try_emplace("supply-authority", "make the program's supply ledger the mint authority");
        }

        void run(const arguments &args, const options &opts) const override
        {
            common::session s { args.at(0) };
            const auto signer = common::load_signer(args.at(1));
            const auto decimals = common::parse_u64(args.at(2));
            if (decimals > std::numeric_limits<uint8_t>::max())
                throw error("decimals must fit into a byte but got {}", decimals);
            const auto mint_authority = opts.contains("supply-authority") ? s.addrs.supply().addr : signer;
            const auto asset_id = ed25519::create().second;
            s.host.execute("create_asset", [&](ledger::context &ctx) {
                s.tokens.create_asset(ctx.tx, asset_id, static_cast<uint8_t>(decimals), mint_authority);
            });
            s.save();
            logger::info("created asset {} with {} decimals and mint authority {}", asset_id, decimals, mint_authority);
            std::cout << fmt::format("{}\n", asset_id);
        }
    };
    static auto instance = command::reg(std::make_shared<cmd>());
}

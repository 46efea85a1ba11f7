/* This file is part of Treasure Core project.
 * Copyright (c) 2025 Treasure Core contributors
 * This code is distributed under the license specified in the LICENSE file. */
#include <tc/cli/common.hpp>

namespace treasure_core::cli::search {
    struct cmd: command {
        void configure(config &cmd) const override
        {
            cmd.name = "search";
            cmd.desc = "record a search at the coordinates <x>, <y> and print the record's address";
            cmd.args.expect({ "<state-file>", "<searcher-key-file>", "<x>", "<y>", "<nonce>" });
        }

        void run(const arguments &args) const override
        {
            common::session s { args.at(0) };
            const auto searcher = common::load_signer(args.at(1));
            const auto x = common::parse_i32(args.at(2));
            const auto y = common::parse_i32(args.at(3));
            const auto nonce = common::parse_u64(args.at(4));
            const auto record_addr = s.ep.search(searcher, x, y, nonce);
            s.save();
            std::cout << fmt::format("{}\n", record_addr);
        }
    };
    static auto instance = command::reg(std::make_shared<cmd>());
}

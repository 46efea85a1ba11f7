/* This file is part of Treasure Core project.
 * Copyright (c) 2025 Treasure Core contributors
 * This code is distributed under the license specified in the LICENSE file. */
#include <tc/cli/common.hpp>

namespace treasure_core::cli::claim {
    struct cmd: command {
        void configure(config &cmd) const override
        {
            cmd.name = "claim";
            cmd.desc = "mark the deposit record at <record> as claimed by its depositor";
            cmd.args.expect({ "<state-file>", "<depositor-key-file>", "<record>" });
        }

        void run(const arguments &args) const override
        {
            common::session s { args.at(0) };
            const auto depositor = common::load_signer(args.at(1));
            const auto record_addr = common::parse_address(args.at(2));
            s.ep.claim(depositor, record_addr);
            s.save();
        }
    };
    static auto instance = command::reg(std::make_shared<cmd>());
}

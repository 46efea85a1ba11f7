/* This file is part of Treasure Core project.
 * Copyright (c) 2025 Treasure Core contributors
 * This code is distributed under the license specified in the LICENSE file. */
#include <tc/cli/common.hpp>

namespace treasure_core::cli::init_vault {
    struct cmd: command {
        void configure(config &cmd) const override
        {
            cmd.name = "init-vault";
            cmd.desc = "create the deposit vault controlled by the signer and print its address";
            cmd.args.expect({ "<state-file>", "<authority-key-file>" });
        }

        void run(const arguments &args) const override
        {
            common::session s { args.at(0) };
            const auto authority = common::load_signer(args.at(1));
            const auto vault_addr = s.ep.init_vault(authority);
            s.save();
            std::cout << fmt::format("{}\n", vault_addr);
        }
    };
    static auto instance = command::reg(std::make_shared<cmd>());
}

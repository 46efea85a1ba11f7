/* This file is part of Treasure Core project.
 * Copyright (c) 2025 Treasure Core contributors
 * This code is distributed under the license specified in the LICENSE file. */
#include <tc/json.hpp>
#include <tc/program/state.hpp>
#include <tc/cli/common.hpp>

namespace treasure_core::cli::inspect {
    struct cmd: command {
        void configure(config &cmd) const override
        {
            cmd.name = "inspect";
            cmd.desc = "print the slots of the state as JSON, only the slot at <address> when given";
            cmd.args.expect({ "<state-file>", "[<address>]" });
        }

        void run(const arguments &args) const override
        {
            const auto store = ledger::account_store::load(args.at(0));
            json::object res {};
            if (args.size() > 1) {
                const auto addr = common::parse_address(args.at(1));
                const auto data = store.find(addr);
                if (!data)
                    throw error("no slot at {}", addr);
                res.emplace(ledger::key_str(addr), _describe(*data));
            } else {
                for (const auto &[addr, data]: store.slots())
                    res.emplace(ledger::key_str(addr), _describe(data));
            }
            json::save_pretty(std::cout, res);
            std::cout << '\n';
        }
    private:
        static json::value _describe(const buffer data)
        {
            if (auto j = program::describe(data); j)
                return std::move(*j);
            if (auto j = ledger::describe(data); j)
                return std::move(*j);
            return json::object {
                { "type", "unknown" },
                { "size", data.size() },
                { "hex", fmt::format("{}", data) }
            };
        }
    };
    static auto instance = command::reg(std::make_shared<cmd>());
}

/* This file is part of Treasure Core project.
 * Copyright (c) 2025 Treasure Core contributors
 * This code is distributed under the license specified in the LICENSE file. */

#include <tc/program/test-env.hpp>

using namespace treasure_core;
using namespace treasure_core::program;
using treasure_core::ledger::error_code;

suite program_search_suite = [] {
    "program::search"_test = [] {
        "record"_test = [] {
            test_env env {};
            const auto addr = env.ep.search(env.player, -120, 45, 1);
            test_same(env.addrs.search(env.player, 1).addr, addr);
            const auto rec = env.ep.search_at(addr);
            test_same(env.player, rec.searcher);
            test_same(-120, rec.x);
            test_same(45, rec.y);
            test_same(1, rec.nonce);
            expect(!rec.found);
            test_same(env.addrs.search(env.player, 1).bump, rec.bump);
        };
        "duplicate nonce"_test = [] {
            test_env env {};
            env.ep.search(env.player, 1, 2, 5);
            const auto before = env.store;
            expect_program_error(error_code::duplicate_search, [&] { env.ep.search(env.player, 3, 4, 5); });
            expect(env.store == before);
            test_same(1, env.ep.search_at(env.addrs.search(env.player, 5).addr).x);
            const auto other = env.ep.search(env.other_player, 3, 4, 5);
            const auto next = env.ep.search(env.player, 3, 4, 6);
            expect(other != next);
            test_same(3, env.store.size());
        };
        "extreme coordinates"_test = [] {
            test_env env {};
            const auto addr = env.ep.search(env.player, std::numeric_limits<int32_t>::min(), std::numeric_limits<int32_t>::max(),
                std::numeric_limits<uint64_t>::max());
            const auto rec = env.ep.search_at(addr);
            test_same(std::numeric_limits<int32_t>::min(), rec.x);
            test_same(std::numeric_limits<int32_t>::max(), rec.y);
            test_same(std::numeric_limits<uint64_t>::max(), rec.nonce);
        };
        "search and deposit nonces are independent"_test = [] {
            test_env env {};
            expect(env.addrs.search(env.player, 1).addr != env.addrs.deposit(env.player, 1).addr);
        };
    };
};

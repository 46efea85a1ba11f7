/* This file is part of Treasure Core project.
 * Copyright (c) 2025 Treasure Core contributors
 * This code is distributed under the license specified in the LICENSE file. */

#include <tc/program/test-env.hpp>

using namespace treasure_core;
using namespace treasure_core::program;
using treasure_core::ledger::error_code;

suite program_supply_suite = [] {
    "program::supply"_test = [] {
        "init"_test = [] {
            test_env env {};
            expect_program_error(error_code::invalid_mint, [&] { env.ep.init_supply(env.new_address(), env.admin, 6, {}); });
            const auto wrong_authority = env.create_asset(6, env.faucet);
            expect_program_error(error_code::invalid_mint, [&] { env.ep.init_supply(wrong_authority, env.admin, 6, {}); });
            const auto asset_id = env.create_reward_asset(6);
            expect_program_error(error_code::invalid_mint, [&] { env.ep.init_supply(asset_id, env.admin, 9, {}); });
            expect_program_error(error_code::not_initialized, [&] { env.ep.supply(); });
            const auto addr = env.ep.init_supply(asset_id, env.admin, 6, 1'000'000);
            test_same(env.addrs.supply().addr, addr);
            const auto st = env.ep.supply();
            test_same(asset_id, st.asset_id);
            test_same(env.admin, st.authority);
            test_same(0, st.total_minted);
            test_same(0, st.total_burned);
            test_same(std::optional<amount_t> { 1'000'000 }, st.max_supply);
            test_same(env.addrs.supply().bump, st.bump);
            expect_program_error(error_code::already_initialized, [&] { env.ep.init_supply(asset_id, env.admin, 6, {}); });
        };
        "mint, cap and burn"_test = [] {
            test_env env {};
            const auto asset_id = env.create_reward_asset(6);
            env.ep.init_supply(asset_id, env.admin, 6, 1'000'000'000'000ULL);
            const auto holding = env.open_holding(env.player, asset_id);
            env.ep.mint(asset_id, env.player, holding, 500'000'000'000ULL);
            test_same(500'000'000'000ULL, env.ep.supply().total_minted);
            test_same(500'000'000'000ULL, env.balance(holding));
            const auto before = env.store;
            expect_program_error(error_code::max_supply_exceeded, [&] { env.ep.mint(asset_id, env.player, holding, 600'000'000'000ULL); });
            expect(env.store == before);
            test_same(500'000'000'000ULL, env.ep.supply().total_minted);
            env.ep.burn(asset_id, env.player, holding, 200'000'000'000ULL);
            const auto st = env.ep.supply();
            test_same(200'000'000'000ULL, st.total_burned);
            test_same(300'000'000'000ULL, st.net_supply());
            test_same(300'000'000'000ULL, env.balance(holding));
            test_same(300'000'000'000ULL, env.asset_supply(asset_id));
        };
        "the cap is never exceeded"_test = [] {
            test_env env {};
            const auto asset_id = env.create_reward_asset(0);
            env.ep.init_supply(asset_id, env.admin, 0, 10);
            const auto holding = env.open_holding(env.player, asset_id);
            for (amount_t amount: { 3, 3, 3 })
                env.ep.mint(asset_id, env.player, holding, amount);
            expect_program_error(error_code::max_supply_exceeded, [&] { env.ep.mint(asset_id, env.player, holding, 2); });
            env.ep.mint(asset_id, env.player, holding, 1);
            expect_program_error(error_code::max_supply_exceeded, [&] { env.ep.mint(asset_id, env.player, holding, 1); });
            test_same(10, env.ep.supply().total_minted);
            // burning does not free room under the cap
            env.ep.burn(asset_id, env.player, holding, 5);
            expect_program_error(error_code::max_supply_exceeded, [&] { env.ep.mint(asset_id, env.player, holding, 1); });
        };
        "overflow"_test = [] {
            test_env env {};
            const auto asset_id = env.create_reward_asset(0);
            env.ep.init_supply(asset_id, env.admin, 0, {});
            const auto holding = env.open_holding(env.player, asset_id);
            env.ep.mint(asset_id, env.player, holding, std::numeric_limits<amount_t>::max());
            expect_program_error(error_code::arithmetic_overflow, [&] { env.ep.mint(asset_id, env.player, holding, 1); });
            test_same(std::numeric_limits<amount_t>::max(), env.ep.supply().total_minted);
        };
        "mint validation"_test = [] {
            test_env env {};
            const auto asset_id = env.create_reward_asset(6);
            const auto other_asset = env.create_asset(6, env.faucet);
            env.ep.init_supply(asset_id, env.admin, 6, {});
            const auto holding = env.open_holding(env.player, asset_id);
            const auto other_holding = env.open_holding(env.player, other_asset);
            expect_program_error(error_code::invalid_mint, [&] { env.ep.mint(other_asset, env.player, other_holding, 1); });
            expect_program_error(error_code::invalid_mint, [&] { env.ep.mint(asset_id, env.player, other_holding, 1); });
            expect_program_error(error_code::invalid_holding_account, [&] { env.ep.mint(asset_id, env.other_player, holding, 1); });
            expect_program_error(error_code::record_not_found, [&] { env.ep.mint(asset_id, env.player, env.new_address(), 1); });
            test_same(0, env.ep.supply().total_minted);
        };
        "burn validation"_test = [] {
            test_env env {};
            const auto asset_id = env.create_reward_asset(6);
            const auto other_asset = env.create_asset(6, env.faucet);
            env.ep.init_supply(asset_id, env.admin, 6, {});
            const auto holding = env.open_holding(env.player, asset_id);
            const auto other_holding = env.fund(env.player, other_asset, 100);
            env.ep.mint(asset_id, env.player, holding, 100);
            expect_program_error(error_code::invalid_holding_account, [&] { env.ep.burn(asset_id, env.other_player, holding, 1); });
            expect_program_error(error_code::invalid_mint, [&] { env.ep.burn(asset_id, env.player, other_holding, 1); });
            expect_program_error(error_code::invalid_mint, [&] { env.ep.burn(other_asset, env.player, other_holding, 1); });
            expect_program_error(error_code::insufficient_funds, [&] { env.ep.burn(asset_id, env.player, holding, 101); });
            test_same(0, env.ep.supply().total_burned);
            test_same(100, env.balance(holding));
        };
        "update_authority"_test = [] {
            test_env env {};
            const auto asset_id = env.create_reward_asset(6);
            env.ep.init_supply(asset_id, env.admin, 6, {});
            expect_program_error(error_code::unauthorized, [&] { env.ep.update_authority(env.player, env.player); });
            env.ep.update_authority(env.admin, env.other_player);
            test_same(env.other_player, env.ep.supply().authority);
            expect_program_error(error_code::unauthorized, [&] { env.ep.update_authority(env.admin, env.admin); });
            expect_program_error(error_code::unauthorized, [&] { env.ep.update_max_supply(env.admin, 5); });
            env.ep.update_max_supply(env.other_player, 5);
            test_same(std::optional<amount_t> { 5 }, env.ep.supply().max_supply);
        };
        "update_max_supply"_test = [] {
            test_env env {};
            const auto asset_id = env.create_reward_asset(0);
            env.ep.init_supply(asset_id, env.admin, 0, 100);
            const auto holding = env.open_holding(env.player, asset_id);
            env.ep.mint(asset_id, env.player, holding, 50);
            expect_program_error(error_code::cannot_decrease_max_supply, [&] { env.ep.update_max_supply(env.admin, 99); });
            env.ep.update_max_supply(env.admin, 100);
            env.ep.update_max_supply(env.admin, 200);
            test_same(std::optional<amount_t> { 200 }, env.ep.supply().max_supply);
            env.ep.update_max_supply(env.admin, {});
            test_same(std::optional<amount_t> {}, env.ep.supply().max_supply);
            // an unlimited supply accepts any cap that is not below the minted total
            expect_program_error(error_code::cannot_decrease_max_supply, [&] { env.ep.update_max_supply(env.admin, 49); });
            env.ep.update_max_supply(env.admin, 60);
            test_same(std::optional<amount_t> { 60 }, env.ep.supply().max_supply);
            env.ep.update_max_supply(env.admin, {});
            expect(!env.ep.supply().max_supply);
        };
    };
};

/* This file is part of Treasure Core project.
 * Copyright (c) 2025 Treasure Core contributors
 * This code is distributed under the license specified in the LICENSE file. */

#include <tc/common/test.hpp>
#include <tc/ed25519.hpp>
#include <tc/file.hpp>
#include <tc/cli/common.hpp>

using namespace treasure_core;
using namespace treasure_core::cli;

suite cli_common_suite = [] {
    "cli::common"_test = [] {
        "parse numbers"_test = [] {
            test_same(12345, common::parse_u64("12345"));
            test_same(std::numeric_limits<uint64_t>::max(), common::parse_u64("18446744073709551615"));
            test_same(-7, common::parse_i32("-7"));
            expect(throws<error>([] { common::parse_u64("18446744073709551616"); }));
            expect(throws<error>([] { common::parse_u64("-1"); }));
            expect(throws<error>([] { common::parse_u64("12abc"); }));
            expect(throws<error>([] { common::parse_i32("2147483648"); }));
            expect(!common::parse_opt_u64("none"));
            expect(common::parse_opt_u64("10") == std::optional<uint64_t> { 10 });
        };
        "parse_address"_test = [] {
            const auto addr = common::parse_address("7E57000000000000000000000000000000000000000000000000000000000001");
            test_same(0x7E, addr[0]);
            test_same(0x01, addr[31]);
            expect(throws<error>([] { common::parse_address("7E57"); }));
        };
        "load_signer"_test = [] {
            const file::tmp key_file { "tc-cli-signer.key" };
            const auto [sk, vk] = ed25519::create();
            const auto sk_hex = fmt::format("{}\n", sk);
            file::write(key_file.path(), sk_hex);
            test_same(vk, common::load_signer(key_file.path()));
            file::write(key_file.path(), std::string_view { "ABCD" });
            expect(throws<error>([&] { common::load_signer(key_file.path()); }));
        };
        "session persists only on save"_test = [] {
            const file::tmp state_file { "tc-cli-session.bin" };
            const auto authority = ed25519::create().second;
            {
                common::session s { state_file.path() };
                test_same(0, s.store.size());
                s.ep.init_vault(authority);
            }
            expect(!std::filesystem::exists(state_file.path()));
            {
                common::session s { state_file.path() };
                s.ep.init_vault(authority);
                s.save();
            }
            common::session s { state_file.path() };
            test_same(1, s.store.size());
            test_same(authority, s.ep.vault().authority);
        };
        "deposit opens the vault holding in the same transaction"_test = [] {
            const file::tmp state_file { "tc-cli-session-deposit.bin" };
            common::session s { state_file.path() };
            const auto faucet = ed25519::create().second;
            const auto player = ed25519::create().second;
            const auto asset_id = ed25519::create().second;
            s.host.execute("fund", [&](ledger::context &ctx) {
                s.tokens.create_asset(ctx.tx, asset_id, 6, faucet);
                const auto h = s.tokens.open_holding(ctx.tx, player, asset_id);
                ctx.assets.mint_to(ctx.tx, asset_id, h, 1'000'000'000, faucet);
            });
            s.ep.init_vault(player);
            const auto vault_holding = s.tokens.holding_address(s.addrs.vault().addr, asset_id);
            const auto before = s.store;
            expect(throws<ledger::program_error>([&] { s.deposit(player, asset_id, 99'999'999, 1); }));
            expect(s.store == before);
            expect(!s.store.contains(vault_holding));
            const auto record_addr = s.deposit(player, asset_id, 100'000'000, 1);
            expect(s.store.contains(vault_holding));
            test_same(1, s.ep.deposit_at(record_addr).tier);
            test_same(100'000'000, s.ep.vault().total_deposited);
        };
        "mint opens the recipient holding in the same transaction"_test = [] {
            const file::tmp state_file { "tc-cli-session-mint.bin" };
            common::session s { state_file.path() };
            const auto authority = ed25519::create().second;
            const auto player = ed25519::create().second;
            const auto asset_id = ed25519::create().second;
            s.host.execute("create_asset", [&](ledger::context &ctx) {
                s.tokens.create_asset(ctx.tx, asset_id, 6, s.addrs.supply().addr);
            });
            s.ep.init_supply(asset_id, authority, 6, 1'000);
            const auto holding = s.tokens.holding_address(player, asset_id);
            const auto before = s.store;
            expect(throws<ledger::program_error>([&] { s.mint(player, 1'001); }));
            expect(s.store == before);
            expect(!s.store.contains(holding));
            s.mint(player, 1'000);
            test_same(1'000, s.ep.supply().total_minted);
            expect(s.store.contains(holding));
        };
    };
};

/* This file is part of Treasure Core project.
 * Copyright (c) 2025 Treasure Core contributors
 * This code is distributed under the license specified in the LICENSE file. */

#include <tc/common/test.hpp>
#include <tc/ed25519.hpp>
#include <tc/ledger/token-ledger.hpp>

using namespace treasure_core;
using namespace treasure_core::ledger;

namespace {
    template<typename F>
    void expect_code(const error_code code, const F &f, const std::source_location &loc=std::source_location::current())
    {
        try {
            f();
            expect(false, loc) << "no exception has been thrown";
        } catch (const program_error &ex) {
            expect(ex.code() == code, loc) << fmt::format("expected {} but got {}", code, ex.code());
        }
    }
}

suite ledger_token_ledger_suite = [] {
    "ledger::token_ledger"_test = [] {
        const auto token_program = address::from_hex("00000000000000000000000000000000000000000000000000000000000000AA");
        const auto asset_id = address::from_hex("00000000000000000000000000000000000000000000000000000000000000A1");
        const auto other_asset_id = address::from_hex("00000000000000000000000000000000000000000000000000000000000000A2");
        const auto issuer = ed25519::create().second;
        const auto alice = ed25519::create().second;
        const auto bob = ed25519::create().second;
        "holdings"_test = [&] {
            account_store st {};
            token_ledger tokens { token_program };
            transaction tx { st };
            tokens.create_asset(tx, asset_id, 6, issuer);
            expect_code(error_code::already_initialized, [&] { tokens.create_asset(tx, asset_id, 6, issuer); });
            const auto h = tokens.open_holding(tx, alice, asset_id);
            test_same(tokens.holding_address(alice, asset_id), h);
            test_same(h, tokens.open_holding(tx, alice, asset_id));
            expect(tokens.holding_address(bob, asset_id) != h);
            const auto info = tokens.holding(tx, h);
            test_same(asset_id, info.asset);
            test_same(alice, info.owner);
            test_same(0, info.balance);
            expect_code(error_code::record_not_found, [&] { tokens.open_holding(tx, alice, other_asset_id); });
        };
        "describe"_test = [&] {
            account_store st {};
            token_ledger tokens { token_program };
            transaction tx { st };
            tokens.create_asset(tx, asset_id, 6, issuer);
            const auto h = tokens.open_holding(tx, alice, asset_id);
            const auto adesc = describe(*tx.read(asset_id));
            expect(adesc.has_value());
            test_same(std::string_view { "AssetInfo" }, static_cast<std::string_view>(adesc->at("type").as_string()));
            const auto hdesc = describe(*tx.read(h));
            expect(hdesc.has_value());
            test_same(std::string_view { "Holding" }, static_cast<std::string_view>(hdesc->at("type").as_string()));
            test_same(key_str(alice), static_cast<std::string_view>(hdesc->at("data").as_object().at("owner").as_string()));
            expect(!describe(uint8_vector::from_hex("0011")));
        };
        "mint, transfer and burn"_test = [&] {
            account_store st {};
            token_ledger tokens { token_program };
            transaction tx { st };
            tokens.create_asset(tx, asset_id, 6, issuer);
            const auto ha = tokens.open_holding(tx, alice, asset_id);
            const auto hb = tokens.open_holding(tx, bob, asset_id);
            expect_code(error_code::unauthorized, [&] { tokens.mint_to(tx, asset_id, ha, 1000, alice); });
            tokens.mint_to(tx, asset_id, ha, 1000, issuer);
            test_same(1000, tokens.asset(tx, asset_id).supply);
            test_same(1000, tokens.holding(tx, ha).balance);
            expect_code(error_code::unauthorized, [&] { tokens.transfer(tx, ha, hb, 10, bob); });
            expect_code(error_code::insufficient_funds, [&] { tokens.transfer(tx, ha, hb, 1001, alice); });
            tokens.transfer(tx, ha, hb, 400, alice);
            test_same(600, tokens.holding(tx, ha).balance);
            test_same(400, tokens.holding(tx, hb).balance);
            tokens.transfer(tx, ha, ha, 600, alice);
            test_same(600, tokens.holding(tx, ha).balance);
            expect_code(error_code::unauthorized, [&] { tokens.burn(tx, asset_id, hb, 1, alice); });
            expect_code(error_code::insufficient_funds, [&] { tokens.burn(tx, asset_id, hb, 401, bob); });
            tokens.burn(tx, asset_id, hb, 100, bob);
            test_same(300, tokens.holding(tx, hb).balance);
            test_same(900, tokens.asset(tx, asset_id).supply);
        };
        "asset mismatch"_test = [&] {
            account_store st {};
            token_ledger tokens { token_program };
            transaction tx { st };
            tokens.create_asset(tx, asset_id, 6, issuer);
            tokens.create_asset(tx, other_asset_id, 0, issuer);
            const auto ha = tokens.open_holding(tx, alice, asset_id);
            const auto hb = tokens.open_holding(tx, bob, other_asset_id);
            tokens.mint_to(tx, asset_id, ha, 10, issuer);
            expect_code(error_code::invalid_mint, [&] { tokens.mint_to(tx, other_asset_id, ha, 1, issuer); });
            expect_code(error_code::invalid_asset, [&] { tokens.transfer(tx, ha, hb, 1, alice); });
            expect_code(error_code::invalid_mint, [&] { tokens.burn(tx, other_asset_id, ha, 1, alice); });
        };
    };
    "ledger::collectible_registry"_test = [] {
        const auto token_program = address::from_hex("00000000000000000000000000000000000000000000000000000000000000AA");
        const auto collectible_program = address::from_hex("00000000000000000000000000000000000000000000000000000000000000BB");
        const auto mint_target = address::from_hex("00000000000000000000000000000000000000000000000000000000000000C1");
        const auto payer = ed25519::create().second;
        const auto alice = ed25519::create().second;
        "issue and metadata"_test = [&] {
            account_store st {};
            token_ledger tokens { token_program };
            collectible_registry registry { tokens, collectible_program };
            transaction tx { st };
            registry.issue(tx, mint_target, alice, 1, payer);
            const auto asset = tokens.asset(tx, mint_target);
            test_same(0, asset.decimals);
            test_same(1, asset.supply);
            test_same(payer, asset.mint_authority);
            test_same(1, tokens.holding(tx, tokens.holding_address(alice, mint_target)).balance);
            expect(!registry.metadata(tx, mint_target));
            registry.create_metadata(tx, mint_target, metadata_params { "Treasure", "DOTTY", "https://example.com/t.json" }, payer);
            const auto meta = registry.metadata(tx, mint_target);
            expect(static_cast<bool>(meta));
            if (meta) {
                test_same(std::string { "Treasure" }, meta->name);
                test_same(std::string { "DOTTY" }, meta->symbol);
                test_same(0, meta->royalty_bp);
                expect(!meta->is_mutable);
                test_same(payer, meta->update_authority);
            }
            expect_code(error_code::already_initialized, [&] { registry.issue(tx, mint_target, alice, 1, payer); });
            expect_code(error_code::already_initialized, [&] {
                registry.create_metadata(tx, mint_target, metadata_params { "Other", "X", "" }, payer);
            });
        };
        "metadata limits"_test = [&] {
            account_store st {};
            token_ledger tokens { token_program };
            collectible_registry registry { tokens, collectible_program };
            transaction tx { st };
            registry.issue(tx, mint_target, alice, 1, payer);
            expect_code(error_code::invalid_metadata, [&] {
                registry.create_metadata(tx, mint_target, metadata_params { std::string(33, 'n'), "S", "" }, payer);
            });
            expect_code(error_code::invalid_metadata, [&] {
                registry.create_metadata(tx, mint_target, metadata_params { "N", std::string(11, 's'), "" }, payer);
            });
            expect_code(error_code::invalid_metadata, [&] {
                registry.create_metadata(tx, mint_target, metadata_params { "N", "S", std::string(201, 'u') }, payer);
            });
            expect_code(error_code::invalid_metadata, [&] {
                registry.create_metadata(tx, mint_target, metadata_params { "N", "S", "", 10001 }, payer);
            });
            registry.create_metadata(tx, mint_target, metadata_params { std::string(32, 'n'), std::string(10, 's'), std::string(200, 'u') }, payer);
            test_same(std::string(200, 'u'), registry.metadata(tx, mint_target)->uri);
        };
        "metadata requires an asset"_test = [&] {
            account_store st {};
            token_ledger tokens { token_program };
            collectible_registry registry { tokens, collectible_program };
            transaction tx { st };
            expect_code(error_code::record_not_found, [&] {
                registry.create_metadata(tx, mint_target, metadata_params { "N", "S", "" }, payer);
            });
        };
    };
};

/* This file is part of Treasure Core project.
 * Copyright (c) 2025 Treasure Core contributors
 * This code is distributed under the license specified in the LICENSE file. */

#include <tc/common/test.hpp>
#include <tc/ed25519.hpp>
#include <tc/ledger/host.hpp>
#include <tc/ledger/token-ledger.hpp>

using namespace treasure_core;
using namespace treasure_core::ledger;

suite ledger_host_suite = [] {
    "ledger::host"_test = [] {
        const auto cfg = program_config::from_json(json::object {
            { "programId", "0000000000000000000000000000000000000000000000000000000000000001" },
            { "tokenProgramId", "0000000000000000000000000000000000000000000000000000000000000002" },
            { "collectibleProgramId", "0000000000000000000000000000000000000000000000000000000000000003" }
        });
        const auto asset_id = address::from_hex("00000000000000000000000000000000000000000000000000000000000000A1");
        const auto issuer = ed25519::create().second;
        const auto alice = ed25519::create().second;
        "program_config"_test = [&] {
            test_same(program_config::default_min_deposit_tokens, cfg.min_deposit_tokens);
            test_same(address::from_hex("0000000000000000000000000000000000000000000000000000000000000002"), cfg.token_program_id);
            const auto cfg2 = program_config::from_json(json::object {
                { "programId", "0000000000000000000000000000000000000000000000000000000000000001" },
                { "tokenProgramId", "0000000000000000000000000000000000000000000000000000000000000002" },
                { "collectibleProgramId", "0000000000000000000000000000000000000000000000000000000000000003" },
                { "minDepositTokens", 250 }
            });
            test_same(250, cfg2.min_deposit_tokens);
            expect(throws<error>([] {
                program_config::from_json(json::object {
                    { "programId", "0000000000000000000000000000000000000000000000000000000000000001" },
                    { "tokenProgramId", "0000000000000000000000000000000000000000000000000000000000000002" }
                });
            }));
            expect(throws<error>([] {
                program_config::from_json(json::object {
                    { "programId", "0000000000000000000000000000000000000000000000000000000000000001" },
                    { "tokenProgramId", "0000000000000000000000000000000000000000000000000000000000000001" },
                    { "collectibleProgramId", "0000000000000000000000000000000000000000000000000000000000000003" }
                });
            }));
            expect(throws<error>([] {
                program_config::from_json(json::object {
                    { "programId", "XYZ" },
                    { "tokenProgramId", "0000000000000000000000000000000000000000000000000000000000000002" },
                    { "collectibleProgramId", "0000000000000000000000000000000000000000000000000000000000000003" }
                });
            }));
        };
        "commit on success"_test = [&] {
            account_store st {};
            token_ledger tokens { cfg.token_program_id };
            collectible_registry collectibles { tokens, cfg.collectible_program_id };
            host h { st, cfg, tokens, collectibles };
            const auto holding = h.execute("setup", [&](context &ctx) {
                tokens.create_asset(ctx.tx, asset_id, 6, issuer);
                const auto addr = tokens.open_holding(ctx.tx, alice, asset_id);
                ctx.assets.mint_to(ctx.tx, asset_id, addr, 500, issuer);
                return addr;
            });
            test_same(3, st.size());
            test_same(500, h.query([&](const transaction &tx) { return tokens.holding(tx, holding).balance; }));
        };
        "rollback on failure"_test = [&] {
            account_store st {};
            token_ledger tokens { cfg.token_program_id };
            collectible_registry collectibles { tokens, cfg.collectible_program_id };
            host h { st, cfg, tokens, collectibles };
            const auto holding = h.execute("setup", [&](context &ctx) {
                tokens.create_asset(ctx.tx, asset_id, 6, issuer);
                const auto addr = tokens.open_holding(ctx.tx, alice, asset_id);
                ctx.assets.mint_to(ctx.tx, asset_id, addr, 500, issuer);
                return addr;
            });
            const auto before = st;
            expect(throws<program_error>([&] {
                h.execute("mint-then-fail", [&](context &ctx) {
                    ctx.assets.mint_to(ctx.tx, asset_id, holding, 100, issuer);
                    ctx.assets.burn(ctx.tx, asset_id, holding, 1000, alice);
                });
            }));
            expect(st == before);
            test_same(500, h.query([&](const transaction &tx) { return tokens.holding(tx, holding).balance; }));
            test_same(500, h.query([&](const transaction &tx) { return tokens.asset(tx, asset_id).supply; }));
        };
        "non-program errors roll back too"_test = [&] {
            account_store st {};
            token_ledger tokens { cfg.token_program_id };
            collectible_registry collectibles { tokens, cfg.collectible_program_id };
            host h { st, cfg, tokens, collectibles };
            expect(throws<error>([&] {
                h.execute("usage-error", [&](context &ctx) {
                    tokens.create_asset(ctx.tx, asset_id, 6, issuer);
                    throw error("bad arguments");
                });
            }));
            test_same(0, st.size());
        };
    };
};

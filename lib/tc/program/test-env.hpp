/* This file is part of Treasure Core project.
 * Copyright (c) 2025 Treasure Core contributors
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef TREASURE_CORE_PROGRAM_TEST_ENV_HPP
#define TREASURE_CORE_PROGRAM_TEST_ENV_HPP

#include <tc/common/test.hpp>
#include <tc/ed25519.hpp>
#include <tc/sha2.hpp>
#include <tc/ledger/token-ledger.hpp>
#include <tc/program/addresses.hpp>
#include <tc/program/entrypoints.hpp>

namespace treasure_core::program {
    inline ledger::program_config test_config()
    {
        ledger::program_config cfg {};
        cfg.program_id = address::from_hex("7E57000000000000000000000000000000000000000000000000000000000001");
        cfg.token_program_id = address::from_hex("7E57000000000000000000000000000000000000000000000000000000000002");
        cfg.collectible_program_id = address::from_hex("7E57000000000000000000000000000000000000000000000000000000000003");
        return cfg;
    }

    // A complete in-memory deployment: store, reference services, host and a few keys
    struct test_env {
        const ledger::program_config cfg = test_config();
        ledger::account_store store {};
        ledger::token_ledger tokens { cfg.token_program_id };
        ledger::collectible_registry collectibles { tokens, cfg.collectible_program_id };
        ledger::host host { store, cfg, tokens, collectibles };
        entrypoints ep { host };
        const addresses addrs { cfg.program_id };
        const pubkey admin = ed25519::create().second;
        const pubkey faucet = ed25519::create().second;
        const pubkey player = ed25519::create().second;
        const pubkey other_player = ed25519::create().second;

        test_env() =default;
        test_env(const test_env &) =delete;
        test_env &operator=(const test_env &) =delete;

        address new_address()
        {
            return sha2::digest(std::string_view { fmt::format("test-address-{}", ++_next_id) });
        }

        address create_asset(const uint8_t decimals, const pubkey &mint_authority)
        {
            const auto asset_id = new_address();
            host.execute("create_asset", [&](ledger::context &ctx) {
                tokens.create_asset(ctx.tx, asset_id, decimals, mint_authority);
            });
            return asset_id;
        }

        // an asset with the supply ledger's address as its mint authority
        address create_reward_asset(const uint8_t decimals=6)
        {
            return create_asset(decimals, addrs.supply().addr);
        }

        address open_holding(const pubkey &owner, const address &asset_id)
        {
            return host.execute("open_holding", [&](ledger::context &ctx) {
                return tokens.open_holding(ctx.tx, owner, asset_id);
            });
        }

        // mints an asset whose mint authority is the faucet
        address fund(const pubkey &owner, const address &asset_id, const amount_t amount)
        {
            return host.execute("fund", [&](ledger::context &ctx) {
                const auto holding = tokens.open_holding(ctx.tx, owner, asset_id);
                tokens.mint_to(ctx.tx, asset_id, holding, amount, faucet);
                return holding;
            });
        }

        amount_t balance(const address &holding)
        {
            return host.query([&](const ledger::transaction &tx) {
                return tokens.holding(tx, holding).balance;
            });
        }

        amount_t asset_supply(const address &asset_id)
        {
            return host.query([&](const ledger::transaction &tx) {
                return tokens.asset(tx, asset_id).supply;
            });
        }
    private:
        size_t _next_id = 0;
    };

    template<typename F>
    void expect_program_error(const ledger::error_code code, const F &f, const std::source_location &loc=std::source_location::current())
    {
        try {
            f();
            expect(false, loc) << fmt::format("no exception has been thrown, expected {}", code);
        } catch (const ledger::program_error &ex) {
            expect(ex.code() == code, loc) << fmt::format("expected {} but got {}", code, ex.code());
        }
    }
}

#endif // !TREASURE_CORE_PROGRAM_TEST_ENV_HPP

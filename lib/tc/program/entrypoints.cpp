/* This file is part of Treasure Core project.
 * Copyright (c) 2025 Treasure Core contributors
 * This code is distributed under the license specified in the LICENSE file. */

#include <tc/program/entrypoints.hpp>
#include <tc/program/search.hpp>
#include <tc/program/supply.hpp>
#include <tc/program/vault.hpp>
#include <tc/program/whitelist.hpp>

namespace treasure_core::program {
    using ledger::context;

    address entrypoints::init_supply(const address &asset_id, const pubkey &authority, const uint8_t decimals, const std::optional<amount_t> max_supply)
    {
        return _host.execute("init_supply", [&](context &ctx) {
            return supply::init(ctx, asset_id, authority, decimals, max_supply);
        });
    }

    void entrypoints::mint(const address &asset_id, const pubkey &recipient, const address &recipient_holding, const amount_t amount)
    {
        _host.execute("mint", [&](context &ctx) {
            supply::mint(ctx, asset_id, recipient, recipient_holding, amount);
        });
    }

    void entrypoints::burn(const address &asset_id, const pubkey &owner, const address &holding, const amount_t amount)
    {
        _host.execute("burn", [&](context &ctx) {
            supply::burn(ctx, asset_id, owner, holding, amount);
        });
    }

    void entrypoints::update_authority(const pubkey &caller, const pubkey &new_authority)
    {
        _host.execute("update_authority", [&](context &ctx) {
            supply::update_authority(ctx, caller, new_authority);
        });
    }

    void entrypoints::update_max_supply(const pubkey &caller, const std::optional<amount_t> new_max_supply)
    {
        _host.execute("update_max_supply", [&](context &ctx) {
            supply::update_max_supply(ctx, caller, new_max_supply);
        });
    }

    address entrypoints::init_vault(const pubkey &authority)
    {
        return _host.execute("init_vault", [&](context &ctx) {
            return vault::init(ctx, authority);
        });
    }

    address entrypoints::deposit(const pubkey &depositor, const address &depositor_holding, const address &vault_holding,
        const amount_t amount, const uint64_t nonce)
    {
        return _host.execute("deposit", [&](context &ctx) {
            return vault::deposit(ctx, depositor, depositor_holding, vault_holding, amount, nonce);
        });
    }

    void entrypoints::claim(const pubkey &depositor, const address &record_addr)
    {
        _host.execute("claim", [&](context &ctx) {
            vault::claim(ctx, depositor, record_addr);
        });
    }

    address entrypoints::whitelist(const pubkey &caller, const address &asset_id, const bool enabled)
    {
        return _host.execute("whitelist", [&](context &ctx) {
            return whitelist::set(ctx, caller, asset_id, enabled);
        });
    }

    void entrypoints::update_vault(const pubkey &caller, const std::optional<pubkey> &new_authority)
    {
        _host.execute("update_vault", [&](context &ctx) {
            vault::update_authority(ctx, caller, new_authority);
        });
    }

    address entrypoints::search(const pubkey &searcher, const int32_t x, const int32_t y, const uint64_t nonce)
    {
        return _host.execute("search", [&](context &ctx) {
            return search::record(ctx, searcher, x, y, nonce);
        });
    }

    void entrypoints::mint_collectible(const pubkey &payer, const pubkey &recipient, const address &mint_target, const collectible::metadata &meta)
    {
        _host.execute("mint_collectible", [&](context &ctx) {
            collectible::mint(ctx, payer, recipient, mint_target, meta);
        });
    }

    address entrypoints::mint_claim_collectible(const pubkey &payer, const pubkey &depositor, const address &record_addr,
        const address &mint_target, const collectible::metadata &meta)
    {
        return _host.execute("mint_claim_collectible", [&](context &ctx) {
            return collectible::mint_for_claim(ctx, payer, depositor, record_addr, mint_target, meta);
        });
    }

    supply_state entrypoints::supply() const
    {
        return _host.query([&](const ledger::transaction &tx) {
            return supply::load(tx, _host.config());
        });
    }

    vault_state entrypoints::vault() const
    {
        return _host.query([&](const ledger::transaction &tx) {
            return vault::load(tx, _host.config());
        });
    }

    deposit_record entrypoints::deposit_at(const address &record_addr) const
    {
        return _host.query([&](const ledger::transaction &tx) {
            return tx.get<deposit_record>(record_addr);
        });
    }

    search_record entrypoints::search_at(const address &record_addr) const
    {
        return _host.query([&](const ledger::transaction &tx) {
            return tx.get<search_record>(record_addr);
        });
    }

    bool entrypoints::is_whitelisted(const address &asset_id) const
    {
        return _host.query([&](const ledger::transaction &tx) {
            return whitelist::is_whitelisted(tx, _host.config(), asset_id);
        });
    }
}

/* This file is part of Treasure Core project.
 * Copyright (c) 2025 Treasure Core contributors
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef TREASURE_CORE_PROGRAM_ENTRYPOINTS_HPP
#define TREASURE_CORE_PROGRAM_ENTRYPOINTS_HPP

#include <tc/program/collectible.hpp>
#include <tc/program/state.hpp>

namespace treasure_core::program {
    // The operation surface of the program. Every call runs as one host transaction.
    struct entrypoints {
        explicit entrypoints(ledger::host &h): _host { h }
        {
        }

        address init_supply(const address &asset_id, const pubkey &authority, uint8_t decimals, std::optional<amount_t> max_supply);
        void mint(const address &asset_id, const pubkey &recipient, const address &recipient_holding, amount_t amount);
        void burn(const address &asset_id, const pubkey &owner, const address &holding, amount_t amount);
        void update_authority(const pubkey &caller, const pubkey &new_authority);
        void update_max_supply(const pubkey &caller, std::optional<amount_t> new_max_supply);
        address init_vault(const pubkey &authority);
        address deposit(const pubkey &depositor, const address &depositor_holding, const address &vault_holding, amount_t amount, uint64_t nonce);
        void claim(const pubkey &depositor, const address &record_addr);
        address whitelist(const pubkey &caller, const address &asset_id, bool enabled=true);
        void update_vault(const pubkey &caller, const std::optional<pubkey> &new_authority);
        address search(const pubkey &searcher, int32_t x, int32_t y, uint64_t nonce);
        void mint_collectible(const pubkey &payer, const pubkey &recipient, const address &mint_target, const collectible::metadata &meta);
        address mint_claim_collectible(const pubkey &payer, const pubkey &depositor, const address &record_addr,
            const address &mint_target, const collectible::metadata &meta);

        supply_state supply() const;
        vault_state vault() const;
        deposit_record deposit_at(const address &record_addr) const;
        search_record search_at(const address &record_addr) const;
        bool is_whitelisted(const address &asset_id) const;
    private:
        ledger::host &_host;
    };
}

#endif // !TREASURE_CORE_PROGRAM_ENTRYPOINTS_HPP

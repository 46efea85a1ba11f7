/* This file is part of Treasure Core project.
 * Copyright (c) 2025 Treasure Core contributors
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef TREASURE_CORE_PROGRAM_VAULT_HPP
#define TREASURE_CORE_PROGRAM_VAULT_HPP

#include <tc/ledger/host.hpp>
#include <tc/program/state.hpp>

namespace treasure_core::program::vault {
    using ledger::context;

    // Classifies a deposit by its size in whole tokens: 4 from 100 000, 3 from 10 000, 2 from 1 000, otherwise 1
    extern uint8_t tier_of(amount_t amount, uint8_t decimals=6);

    extern address init(context &ctx, const pubkey &authority);
    // Moves the amount from the depositor's holding into the vault's custody and records it
    // at the address derived from the depositor and the nonce. Returns that address.
    extern address deposit(context &ctx, const pubkey &depositor, const address &depositor_holding, const address &vault_holding,
        amount_t amount, uint64_t nonce);
    extern void claim(context &ctx, const pubkey &depositor, const address &record_addr);
    extern void update_authority(context &ctx, const pubkey &caller, const std::optional<pubkey> &new_authority);
    extern vault_state load(const ledger::transaction &tx, const ledger::program_config &cfg);
}

#endif // !TREASURE_CORE_PROGRAM_VAULT_HPP

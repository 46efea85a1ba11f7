/* This file is part of Treasure Core project.
 * Copyright (c) 2025 Treasure Core contributors
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef TREASURE_CORE_PROGRAM_SUPPLY_HPP
#define TREASURE_CORE_PROGRAM_SUPPLY_HPP

#include <tc/ledger/host.hpp>
#include <tc/program/state.hpp>

namespace treasure_core::program::supply {
    using ledger::context;

    // Creates the supply ledger of the reward token. The asset must already exist,
    // have the given number of decimals and use the ledger's address as its mint authority.
    extern address init(context &ctx, const address &asset_id, const pubkey &authority, uint8_t decimals,
        std::optional<amount_t> max_supply);
    // Mints new reward tokens into the recipient's holding. The mint is authorized by the ledger itself.
    extern void mint(context &ctx, const address &asset_id, const pubkey &recipient, const address &recipient_holding, amount_t amount);
    extern void burn(context &ctx, const address &asset_id, const pubkey &owner, const address &holding, amount_t amount);
    extern void update_authority(context &ctx, const pubkey &caller, const pubkey &new_authority);
    extern void update_max_supply(context &ctx, const pubkey &caller, std::optional<amount_t> new_max_supply);
    extern supply_state load(const ledger::transaction &tx, const ledger::program_config &cfg);
}

#endif // !TREASURE_CORE_PROGRAM_SUPPLY_HPP

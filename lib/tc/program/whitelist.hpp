/* This file is part of Treasure Core project.
 * Copyright (c) 2025 Treasure Core contributors
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef TREASURE_CORE_PROGRAM_WHITELIST_HPP
#define TREASURE_CORE_PROGRAM_WHITELIST_HPP

#include <tc/ledger/host.hpp>
#include <tc/program/state.hpp>

namespace treasure_core::program::whitelist {
    using ledger::context;

    // Creates or rewrites the approval flag of an asset; only the vault authority may do so
    extern address set(context &ctx, const pubkey &caller, const address &asset_id, bool enabled=true);
    extern bool is_whitelisted(const ledger::transaction &tx, const ledger::program_config &cfg, const address &asset_id);
}

#endif // !TREASURE_CORE_PROGRAM_WHITELIST_HPP

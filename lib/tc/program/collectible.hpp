/* This file is part of Treasure Core project.
 * Copyright (c) 2025 Treasure Core contributors
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef TREASURE_CORE_PROGRAM_COLLECTIBLE_HPP
#define TREASURE_CORE_PROGRAM_COLLECTIBLE_HPP

#include <tc/ledger/host.hpp>
#include <tc/program/state.hpp>

namespace treasure_core::program::collectible {
    using ledger::context;

    struct metadata {
        std::string title {};
        std::string symbol {};
        std::string uri {};
    };

    // Issues one unit of a new asset at mint_target to the recipient and attaches immutable metadata
    extern void mint(context &ctx, const pubkey &payer, const pubkey &recipient, const address &mint_target, const metadata &meta);
    // The same for a claimed deposit; at most one collectible is issued per deposit. Returns the receipt address.
    extern address mint_for_claim(context &ctx, const pubkey &payer, const pubkey &depositor, const address &record_addr,
        const address &mint_target, const metadata &meta);
}

#endif // !TREASURE_CORE_PROGRAM_COLLECTIBLE_HPP

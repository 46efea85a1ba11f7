/* This file is part of Treasure Core project.
 * Copyright (c) 2025 Treasure Core contributors
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef TREASURE_CORE_PROGRAM_SEARCH_HPP
#define TREASURE_CORE_PROGRAM_SEARCH_HPP

#include <tc/ledger/host.hpp>
#include <tc/program/state.hpp>

namespace treasure_core::program::search {
    using ledger::context;

    // Records a coordinate query at the address derived from the searcher and the nonce
    extern address record(context &ctx, const pubkey &searcher, int32_t x, int32_t y, uint64_t nonce);
}

#endif // !TREASURE_CORE_PROGRAM_SEARCH_HPP

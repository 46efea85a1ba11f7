/* This file is part of Treasure Core project.
 * Copyright (c) 2025 Treasure Core contributors
 * This code is distributed under the license specified in the LICENSE file. */

#include <tc/program/addresses.hpp>
#include <tc/program/search.hpp>

namespace treasure_core::program::search {
    address record(context &ctx, const pubkey &searcher, const int32_t x, const int32_t y, const uint64_t nonce)
    {
        const auto [addr, bump] = addresses { ctx.cfg.program_id }.search(searcher, nonce);
        logger::info("{} is searching for treasure at ({}, {})", searcher, x, y);
        if (!ctx.tx.create(addr, search_record { searcher, x, y, nonce, false, bump }))
            throw ledger::program_error(ledger::error_code::duplicate_search, "searcher {} already used nonce {}", searcher, nonce);
        logger::info("search recorded at ({}, {}) id: {}", x, y, addr);
        return addr;
    }
}

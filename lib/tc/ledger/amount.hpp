/* This file is part of Treasure Core project.
 * Copyright (c) 2025 Treasure Core contributors
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef TREASURE_CORE_LEDGER_AMOUNT_HPP
#define TREASURE_CORE_LEDGER_AMOUNT_HPP

#include <limits>
#include <tc/ledger/error.hpp>

namespace treasure_core::ledger {
    // token amounts are counted in the smallest units of an asset
    using amount_t = uint64_t;

    inline amount_t checked_add(const amount_t a, const amount_t b)
    {
        if (b > std::numeric_limits<amount_t>::max() - a) [[unlikely]]
            throw program_error(error_code::arithmetic_overflow, "{} + {}", a, b);
        return a + b;
    }

    inline amount_t checked_mul(const amount_t a, const amount_t b)
    {
        if (a != 0 && b > std::numeric_limits<amount_t>::max() / a) [[unlikely]]
            throw program_error(error_code::arithmetic_overflow, "{} * {}", a, b);
        return a * b;
    }

    inline amount_t pow10(const uint8_t exp)
    {
        amount_t res = 1;
        for (uint8_t i = 0; i < exp; ++i)
            res = checked_mul(res, 10);
        return res;
    }
}

#endif // !TREASURE_CORE_LEDGER_AMOUNT_HPP

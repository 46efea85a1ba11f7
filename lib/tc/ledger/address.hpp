/* This file is part of Treasure Core project.
 * Copyright (c) 2025 Treasure Core contributors
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef TREASURE_CORE_LEDGER_ADDRESS_HPP
#define TREASURE_CORE_LEDGER_ADDRESS_HPP

#include <functional>
#include <tc/array.hpp>
#include <tc/container.hpp>

namespace treasure_core::ledger {
    using pubkey = byte_array<32>;
    using address = pubkey;

    struct derived_address {
        address addr {};
        uint8_t bump = 0;

        bool operator==(const derived_address &o) const =default;
    };

    // returns true when an address can be used as a derived one
    using address_filter = std::function<bool(const address &)>;

    static constexpr size_t max_seed_size = 32;
    static constexpr size_t max_seeds = 15;

    extern bool off_curve(const address &addr);

    // Searches bumps from 255 down to 0 and returns the first address accepted by the filter.
    // Throws program_error(address_derivation_exhausted) when none is.
    extern derived_address derive(const address &program_id, std::string_view ns, const vector<buffer> &seeds,
        const address_filter &viable);

    inline derived_address derive(const address &program_id, const std::string_view ns, const vector<buffer> &seeds)
    {
        return derive(program_id, ns, seeds, off_curve);
    }
}

#endif // !TREASURE_CORE_LEDGER_ADDRESS_HPP

/* This file is part of Treasure Core project.
 * Copyright (c) 2025 Treasure Core contributors
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef TREASURE_CORE_PROGRAM_ADDRESSES_HPP
#define TREASURE_CORE_PROGRAM_ADDRESSES_HPP

#include <tc/ledger/address.hpp>

namespace treasure_core::program {
    using ledger::address;
    using ledger::derived_address;
    using ledger::pubkey;

    // Derivation rules of every record owned by the program
    struct addresses {
        explicit addresses(const address &program_id): _program_id { program_id }
        {
        }

        derived_address supply() const;
        derived_address vault() const;
        derived_address deposit(const pubkey &depositor, uint64_t nonce) const;
        derived_address search(const pubkey &searcher, uint64_t nonce) const;
        derived_address whitelist(const address &asset_id) const;
        derived_address receipt(const address &deposit_record) const;
    private:
        const address _program_id;
    };
}

#endif // !TREASURE_CORE_PROGRAM_ADDRESSES_HPP

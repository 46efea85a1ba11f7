/* This file is part of Treasure Core project.
 * Copyright (c) 2025 Treasure Core contributors
 * This code is distributed under the license specified in the LICENSE file. */

#include <tc/ledger/codec.hpp>
#include <tc/program/addresses.hpp>

namespace treasure_core::program {
    static uint8_vector _nonce_seed(const uint64_t nonce)
    {
        ledger::record_writer w { sizeof(nonce) };
        w.uint(nonce);
        return w.take();
    }

    derived_address addresses::supply() const
    {
        return ledger::derive(_program_id, "supply", {});
    }

    derived_address addresses::vault() const
    {
        return ledger::derive(_program_id, "vault", {});
    }

    derived_address addresses::deposit(const pubkey &depositor, const uint64_t nonce) const
    {
        return ledger::derive(_program_id, "deposit", { depositor, _nonce_seed(nonce) });
    }

    derived_address addresses::search(const pubkey &searcher, const uint64_t nonce) const
    {
        return ledger::derive(_program_id, "search", { searcher, _nonce_seed(nonce) });
    }

    derived_address addresses::whitelist(const address &asset_id) const
    {
        return ledger::derive(_program_id, "whitelist", { asset_id });
    }

    derived_address addresses::receipt(const address &deposit_record) const
    {
        return ledger::derive(_program_id, "collectible", { deposit_record });
    }
}

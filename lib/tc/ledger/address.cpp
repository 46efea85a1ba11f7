/* This file is part of Treasure Core project.
 * Copyright (c) 2025 Treasure Core contributors
 * This code is distributed under the license specified in the LICENSE file. */

#include <tc/ed25519.hpp>
#include <tc/logger.hpp>
#include <tc/sha2.hpp>
#include <tc/ledger/address.hpp>
#include <tc/ledger/error.hpp>

namespace treasure_core::ledger {
    static constexpr std::string_view derivation_marker { "ProgramDerivedAddress" };

    bool off_curve(const address &addr)
    {
        return !ed25519::is_valid_point(addr);
    }

    derived_address derive(const address &program_id, const std::string_view ns, const vector<buffer> &seeds,
        const address_filter &viable)
    {
        if (ns.size() > max_seed_size)
            throw error("a namespace tag must not exceed {} bytes but got {}: {}", max_seed_size, ns.size(), ns);
        if (seeds.size() > max_seeds)
            throw error("at most {} seeds are allowed but got {}", max_seeds, seeds.size());
        uint8_vector preimage {};
        preimage << static_cast<uint8_t>(ns.size()) << buffer { ns };
        for (const auto &s: seeds) {
            if (s.size() > max_seed_size)
                throw error("a seed must not exceed {} bytes but got {}", max_seed_size, s.size());
            preimage << static_cast<uint8_t>(s.size()) << s;
        }
        const auto bump_pos = preimage.size();
        preimage << uint8_t { 0 } << static_cast<buffer>(program_id) << buffer { derivation_marker };
        for (int bump = 255; bump >= 0; --bump) {
            preimage[bump_pos] = static_cast<uint8_t>(bump);
            const address addr = sha2::digest(preimage);
            if (viable(addr))
                return { addr, static_cast<uint8_t>(bump) };
        }
        logger::warn("address derivation exhausted for namespace {} and {} seeds", ns, seeds.size());
        throw program_error(error_code::address_derivation_exhausted, "namespace: {}", ns);
    }
}

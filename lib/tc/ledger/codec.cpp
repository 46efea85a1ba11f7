/* This file is part of Treasure Core project.
 * Copyright (c) 2025 Treasure Core contributors
 * This code is distributed under the license specified in the LICENSE file. */

#include <tc/sha2.hpp>
#include <tc/ledger/codec.hpp>

namespace treasure_core::ledger {
    discriminator discriminator_of(const std::string_view type_name)
    {
        const auto hash = sha2::digest(std::string { "account:" } + std::string { type_name });
        return discriminator { static_cast<buffer>(hash).subbuf(0, sizeof(discriminator)) };
    }
}

/* This file is part of Treasure Core project.
 * Copyright (c) 2025 Treasure Core contributors
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef TREASURE_CORE_SHA2_HPP
#define TREASURE_CORE_SHA2_HPP

extern "C" {
#   include <sodium.h>
};
#include <tc/array.hpp>
#include <tc/ed25519.hpp>

namespace treasure_core::sha2
{
    using hash_256 = byte_array<crypto_hash_sha256_BYTES>;

    inline void digest(const std::span<uint8_t> &out, const buffer &in)
    {
        if (out.size() != sizeof(hash_256))
            throw error("output size must be {} but got {}", sizeof(hash_256), out.size());
        ed25519::ensure_initialized();
        if (crypto_hash_sha256(out.data(), in.data(), in.size()) != 0)
            throw error("sha2 computation hash failed!");
    }

    inline hash_256 digest(const buffer &in)
    {
        hash_256 out;
        digest(out, in);
        return out;
    }
}

#endif // !TREASURE_CORE_SHA2_HPP

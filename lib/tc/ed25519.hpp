/* This file is part of Treasure Core project.
 * Copyright (c) 2025 Treasure Core contributors
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef TREASURE_CORE_ED25519_HPP
#define TREASURE_CORE_ED25519_HPP

#include <tc/array.hpp>

namespace treasure_core::ed25519 {
    using vkey = byte_array<32>;
    using skey = byte_array<64>;
    using seed = byte_array<32>;

    extern void ensure_initialized();
    extern void create(const std::span<uint8_t> &sk, const std::span<uint8_t> &vk);
    extern std::pair<skey, vkey> create();
    extern std::pair<skey, vkey> create_from_seed(const buffer &seed);
    extern vkey extract_vk(const buffer &sk);
    // true when the 32-byte encoding decodes to a point on the curve
    extern bool is_valid_point(const buffer &p);
}

#endif // !TREASURE_CORE_ED25519_HPP

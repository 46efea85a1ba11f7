/* This file is part of Treasure Core project.
 * Copyright (c) 2025 Treasure Core contributors
 * This code is distributed under the license specified in the LICENSE file. */

extern "C" {
#   include <sodium.h>
};
#include <tc/ed25519.hpp>

namespace treasure_core::ed25519 {
    struct sodium_initializer {
        sodium_initializer() {
            if (sodium_init() == -1)
                throw error("Failed to initialize libsodium!");
        }
    };

    void ensure_initialized()
    {
        // will be initialized on the first call, after that do nothing
        static sodium_initializer init {};
    }

    void create(const std::span<uint8_t> &sk, const std::span<uint8_t> &vk)
    {
        if (sk.size() != sizeof(skey))
            throw error("private key must have {} bytes but got: {}!", sizeof(skey), sk.size());
        if (vk.size() != sizeof(vkey))
            throw error("verification key must have {} bytes but got: {}!", sizeof(vkey), vk.size());
        ensure_initialized();
        if (crypto_sign_keypair(vk.data(), sk.data()) != 0)
            throw error("failed to generate a cryptographic key pair!");
    }

    std::pair<skey, vkey> create()
    {
        skey sk {};
        vkey vk {};
        create(sk, vk);
        return std::make_pair(sk, vk);
    }

    std::pair<skey, vkey> create_from_seed(const buffer &sd)
    {
        if (sd.size() != sizeof(seed))
            throw error("seed must have {} bytes but got: {}!", sizeof(seed), sd.size());
        skey sk {};
        vkey vk {};
        ensure_initialized();
        if (crypto_sign_seed_keypair(vk.data(), sk.data(), sd.data()) != 0)
            throw error("failed to generate a cryptographic key pair!");
        return std::make_pair(sk, vk);
    }

    vkey extract_vk(const buffer &sk)
    {
        if (sk.size() != sizeof(skey))
            throw error("private key must have {} bytes but got: {}!", sizeof(skey), sk.size());
        vkey vk {};
        ensure_initialized();
        if (crypto_sign_ed25519_sk_to_pk(vk.data(), sk.data()) != 0)
            throw error("failed to extract the verification key from a secret key!");
        return vk;
    }

    bool is_valid_point(const buffer &p)
    {
        if (p.size() != crypto_core_ed25519_BYTES)
            throw error("a curve point must have {} bytes but got: {}!", crypto_core_ed25519_BYTES, p.size());
        ensure_initialized();
        return crypto_core_ed25519_is_valid_point(p.data()) == 1;
    }
}

/* This file is part of Treasure Core project.
 * Copyright (c) 2025 Treasure Core contributors
 * This code is distributed under the license specified in the LICENSE file. */

#ifndef TREASURE_CORE_CLI_COMMON_HPP
#define TREASURE_CORE_CLI_COMMON_HPP

#include <tc/cli.hpp>
#include <tc/ledger/token-ledger.hpp>
#include <tc/program/addresses.hpp>
#include <tc/program/entrypoints.hpp>

namespace treasure_core::cli {
    using ledger::address;
    using ledger::amount_t;
    using ledger::pubkey;
}

namespace treasure_core::cli::common {
    // A snapshot of the account store together with the services and the program bound to it.
    // Changes reach the state file only through save().
    struct session {
        explicit session(const std::string &state_path);
        session(const session &) =delete;
        session &operator=(const session &) =delete;

        void save() const;

        // open the recipient's or the vault's holding when missing and run the operation in the same transaction
        void mint(const pubkey &recipient, amount_t amount);
        address deposit(const pubkey &depositor, const address &asset_id, amount_t amount, uint64_t nonce);

        const std::string state_path;
        const ledger::program_config &cfg;
        ledger::account_store store;
        ledger::token_ledger tokens;
        ledger::collectible_registry collectibles;
        ledger::host host;
        program::entrypoints ep;
        program::addresses addrs;
    };

    // the public key of a secret key file created by the keygen command
    extern pubkey load_signer(const std::string &key_path);
    extern address parse_address(const std::string &hex);
    extern uint64_t parse_u64(const std::string &val);
    extern int32_t parse_i32(const std::string &val);
    // "none" maps to an empty optional
    extern std::optional<uint64_t> parse_opt_u64(const std::string &val);
}

#endif // !TREASURE_CORE_CLI_COMMON_HPP

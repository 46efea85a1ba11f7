/* This file is part of Treasure Core project.
 * Copyright (c) 2025 Treasure Core contributors
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef TREASURE_CORE_PROGRAM_STATE_HPP
#define TREASURE_CORE_PROGRAM_STATE_HPP

#include <tc/ledger/amount.hpp>
#include <tc/ledger/codec.hpp>

namespace treasure_core::program {
    using ledger::address;
    using ledger::amount_t;
    using ledger::pubkey;
    using ledger::record_reader;
    using ledger::record_writer;

    struct supply_state {
        static constexpr std::string_view type_name { "SupplyState" };
        static constexpr size_t serialized_size = 98;

        address asset_id {};
        pubkey authority {};
        amount_t total_minted = 0;
        amount_t total_burned = 0;
        std::optional<amount_t> max_supply {};
        uint8_t bump = 0;

        static supply_state decode(record_reader &r);
        void encode(record_writer &w) const;
        json::object to_json() const;

        // the circulating amount is never stored
        amount_t net_supply() const noexcept
        {
            return total_minted - total_burned;
        }

        bool operator==(const supply_state &) const =default;
    };

    struct vault_state {
        static constexpr std::string_view type_name { "Vault" };
        static constexpr size_t serialized_size = 57;

        pubkey authority {};
        amount_t total_deposited = 0;
        uint64_t total_claimed_count = 0;
        uint8_t bump = 0;

        static vault_state decode(record_reader &r);
        void encode(record_writer &w) const;
        json::object to_json() const;
        bool operator==(const vault_state &) const =default;
    };

    struct deposit_record {
        static constexpr std::string_view type_name { "DepositRecord" };
        static constexpr size_t serialized_size = 59;

        pubkey depositor {};
        amount_t amount = 0;
        uint64_t nonce = 0;
        bool claimed = false;
        uint8_t tier = 1;
        uint8_t bump = 0;

        static deposit_record decode(record_reader &r);
        void encode(record_writer &w) const;
        json::object to_json() const;
        bool operator==(const deposit_record &) const =default;
    };

    struct whitelist_entry {
        static constexpr std::string_view type_name { "WhitelistEntry" };
        static constexpr size_t serialized_size = 42;

        address asset_id {};
        bool enabled = false;
        uint8_t bump = 0;

        static whitelist_entry decode(record_reader &r);
        void encode(record_writer &w) const;
        json::object to_json() const;
        bool operator==(const whitelist_entry &) const =default;
    };

    struct search_record {
        static constexpr std::string_view type_name { "SearchRecord" };
        static constexpr size_t serialized_size = 58;

        pubkey searcher {};
        int32_t x = 0;
        int32_t y = 0;
        uint64_t nonce = 0;
        bool found = false;
        uint8_t bump = 0;

        static search_record decode(record_reader &r);
        void encode(record_writer &w) const;
        json::object to_json() const;
        bool operator==(const search_record &) const =default;
    };

    // links a claimed deposit to the collectible issued for it
    struct collectible_receipt {
        static constexpr std::string_view type_name { "CollectibleReceipt" };
        static constexpr size_t serialized_size = 73;

        address deposit_record {};
        address collectible {};
        uint8_t bump = 0;

        static collectible_receipt decode(record_reader &r);
        void encode(record_writer &w) const;
        json::object to_json() const;
        bool operator==(const collectible_receipt &) const =default;
    };

    // renders a slot of any program record type, returns an empty optional for unknown slots
    extern std::optional<json::object> describe(buffer data);
}

#endif // !TREASURE_CORE_PROGRAM_STATE_HPP

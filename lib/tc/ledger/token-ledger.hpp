/* This file is part of Treasure Core project.
 * Copyright (c) 2025 Treasure Core contributors
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef TREASURE_CORE_LEDGER_TOKEN_LEDGER_HPP
#define TREASURE_CORE_LEDGER_TOKEN_LEDGER_HPP

#include <tc/ledger/services.hpp>

namespace treasure_core::ledger {
    struct asset_record {
        static constexpr std::string_view type_name { "AssetInfo" };
        static constexpr size_t serialized_size = 8 + 1 + 32 + 8;

        uint8_t decimals = 0;
        pubkey mint_authority {};
        amount_t supply = 0;

        static asset_record decode(record_reader &r);
        void encode(record_writer &w) const;
        json::object to_json() const;
        bool operator==(const asset_record &) const =default;
    };

    struct holding_record {
        static constexpr std::string_view type_name { "Holding" };
        static constexpr size_t serialized_size = 8 + 32 + 32 + 8;

        address asset {};
        pubkey owner {};
        amount_t balance = 0;

        static holding_record decode(record_reader &r);
        void encode(record_writer &w) const;
        json::object to_json() const;
        bool operator==(const holding_record &) const =default;
    };

    struct metadata_record {
        static constexpr std::string_view type_name { "CollectibleMetadata" };
        static constexpr size_t max_name_size = 32;
        static constexpr size_t max_symbol_size = 10;
        static constexpr size_t max_uri_size = 200;
        static constexpr uint16_t max_royalty_bp = 10000;
        static constexpr size_t serialized_size = 8 + 32 + max_name_size + max_symbol_size + max_uri_size + 2 + 1 + 32;

        address asset {};
        std::string name {};
        std::string symbol {};
        std::string uri {};
        uint16_t royalty_bp = 0;
        bool is_mutable = false;
        pubkey update_authority {};

        static metadata_record decode(record_reader &r);
        void encode(record_writer &w) const;
        json::object to_json() const;
        bool operator==(const metadata_record &) const =default;
    };

    // renders a slot of the reference services, returns an empty optional for unknown slots
    extern std::optional<json::object> describe(buffer data);

    // An in-memory fungible-asset ledger keeping its records in the shared account store
    struct token_ledger: asset_service {
        explicit token_ledger(const address &program_id): _program_id { program_id }
        {
        }

        const address &program_id() const noexcept
        {
            return _program_id;
        }

        address holding_address(const pubkey &owner, const address &asset_id) const;
        void create_asset(transaction &tx, const address &asset_id, uint8_t decimals, const pubkey &mint_authority);
        // returns the address of the owner's holding and creates it when missing
        address open_holding(transaction &tx, const pubkey &owner, const address &asset_id);
    private:
        const address _program_id;

        asset_info _asset_impl(const transaction &tx, const address &asset_id) const override;
        holding_info _holding_impl(const transaction &tx, const address &holding_addr) const override;
        void _transfer_impl(transaction &tx, const address &from, const address &to, amount_t amount, const pubkey &authorized_by) override;
        void _mint_to_impl(transaction &tx, const address &asset_id, const address &to, amount_t amount, const pubkey &authorized_by) override;
        void _burn_impl(transaction &tx, const address &asset_id, const address &from, amount_t amount, const pubkey &authorized_by) override;
    };

    // An in-memory collectible service that issues single-unit assets through a token_ledger
    struct collectible_registry: collectible_service {
        collectible_registry(token_ledger &tokens, const address &program_id):
            _tokens { tokens }, _program_id { program_id }
        {
        }

        address metadata_address(const address &asset_id) const;
        std::optional<metadata_record> metadata(const transaction &tx, const address &asset_id) const;
    private:
        token_ledger &_tokens;
        const address _program_id;

        void _issue_impl(transaction &tx, const address &mint_target, const pubkey &to, amount_t amount, const pubkey &authorized_by) override;
        void _create_metadata_impl(transaction &tx, const address &asset_id, const metadata_params &params, const pubkey &update_authority) override;
    };
}

#endif // !TREASURE_CORE_LEDGER_TOKEN_LEDGER_HPP

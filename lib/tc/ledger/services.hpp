/* This file is part of Treasure Core project.
 * Copyright (c) 2025 Treasure Core contributors
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef TREASURE_CORE_LEDGER_SERVICES_HPP
#define TREASURE_CORE_LEDGER_SERVICES_HPP

#include <tc/ledger/amount.hpp>
#include <tc/ledger/store.hpp>

namespace treasure_core::ledger {
    struct asset_info {
        uint8_t decimals = 0;
        pubkey mint_authority {};
        amount_t supply = 0;
    };

    struct holding_info {
        address asset {};
        pubkey owner {};
        amount_t balance = 0;
    };

    struct metadata_params {
        std::string name {};
        std::string symbol {};
        std::string uri {};
        uint16_t royalty_bp = 0;
        bool is_mutable = false;
        bool update_authority_is_signer = true;
    };

    // The fungible-asset primitive. All effects are written through the given transaction.
    struct asset_service {
        virtual ~asset_service() =default;

        asset_info asset(const transaction &tx, const address &asset_id) const
        {
            return _asset_impl(tx, asset_id);
        }

        holding_info holding(const transaction &tx, const address &holding_addr) const
        {
            return _holding_impl(tx, holding_addr);
        }

        void transfer(transaction &tx, const address &from, const address &to, const amount_t amount, const pubkey &authorized_by)
        {
            _transfer_impl(tx, from, to, amount, authorized_by);
        }

        void mint_to(transaction &tx, const address &asset_id, const address &to, const amount_t amount, const pubkey &authorized_by)
        {
            _mint_to_impl(tx, asset_id, to, amount, authorized_by);
        }

        void burn(transaction &tx, const address &asset_id, const address &from, const amount_t amount, const pubkey &authorized_by)
        {
            _burn_impl(tx, asset_id, from, amount, authorized_by);
        }
    private:
        virtual asset_info _asset_impl(const transaction &, const address &) const =0;
        virtual holding_info _holding_impl(const transaction &, const address &) const =0;
        virtual void _transfer_impl(transaction &, const address &, const address &, amount_t, const pubkey &) =0;
        virtual void _mint_to_impl(transaction &, const address &, const address &, amount_t, const pubkey &) =0;
        virtual void _burn_impl(transaction &, const address &, const address &, amount_t, const pubkey &) =0;
    };

    // The non-fungible issuance and metadata service
    struct collectible_service {
        virtual ~collectible_service() =default;

        void issue(transaction &tx, const address &mint_target, const pubkey &to, const amount_t amount, const pubkey &authorized_by)
        {
            _issue_impl(tx, mint_target, to, amount, authorized_by);
        }

        void create_metadata(transaction &tx, const address &asset_id, const metadata_params &params, const pubkey &update_authority)
        {
            _create_metadata_impl(tx, asset_id, params, update_authority);
        }
    private:
        virtual void _issue_impl(transaction &, const address &, const pubkey &, amount_t, const pubkey &) =0;
        virtual void _create_metadata_impl(transaction &, const address &, const metadata_params &, const pubkey &) =0;
    };
}

#endif // !TREASURE_CORE_LEDGER_SERVICES_HPP

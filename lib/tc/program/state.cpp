/* This file is part of Treasure Core project.
 * Copyright (c) 2025 Treasure Core contributors
 * This code is distributed under the license specified in the LICENSE file. */

#include <tc/program/state.hpp>

namespace treasure_core::program {
    using ledger::key_str;

    supply_state supply_state::decode(record_reader &r)
    {
        supply_state res {};
        res.asset_id = r.key();
        res.authority = r.key();
        res.total_minted = r.uint<uint64_t>();
        res.total_burned = r.uint<uint64_t>();
        res.max_supply = r.opt_u64();
        res.bump = r.uint<uint8_t>();
        return res;
    }

    void supply_state::encode(record_writer &w) const
    {
        w.key(asset_id).key(authority).uint<uint64_t>(total_minted).uint<uint64_t>(total_burned).opt_u64(max_supply).uint(bump);
    }

    json::object supply_state::to_json() const
    {
        json::object j {
            { "assetId", key_str(asset_id) },
            { "authority", key_str(authority) },
            { "totalMinted", total_minted },
            { "totalBurned", total_burned },
            { "netSupply", net_supply() },
            { "bump", bump }
        };
        if (max_supply)
            j.emplace("maxSupply", *max_supply);
        else
            j.emplace("maxSupply", nullptr);
        return j;
    }

    vault_state vault_state::decode(record_reader &r)
    {
        vault_state res {};
        res.authority = r.key();
        res.total_deposited = r.uint<uint64_t>();
        res.total_claimed_count = r.uint<uint64_t>();
        res.bump = r.uint<uint8_t>();
        return res;
    }

    void vault_state::encode(record_writer &w) const
    {
        w.key(authority).uint<uint64_t>(total_deposited).uint<uint64_t>(total_claimed_count).uint(bump);
    }

    json::object vault_state::to_json() const
    {
        return json::object {
            { "authority", key_str(authority) },
            { "totalDeposited", total_deposited },
            { "totalClaimedCount", total_claimed_count },
            { "bump", bump }
        };
    }

    deposit_record deposit_record::decode(record_reader &r)
    {
        deposit_record res {};
        res.depositor = r.key();
        res.amount = r.uint<uint64_t>();
        res.nonce = r.uint<uint64_t>();
        res.claimed = r.boolean();
        res.tier = r.uint<uint8_t>();
        if (res.tier < 1 || res.tier > 4)
            throw error("a deposit tier must be within 1..4 but got {}", res.tier);
        res.bump = r.uint<uint8_t>();
        return res;
    }

    void deposit_record::encode(record_writer &w) const
    {
        w.key(depositor).uint<uint64_t>(amount).uint<uint64_t>(nonce).boolean(claimed).uint(tier).uint(bump);
    }

    json::object deposit_record::to_json() const
    {
        return json::object {
            { "depositor", key_str(depositor) },
            { "amount", amount },
            { "nonce", nonce },
            { "claimed", claimed },
            { "tier", tier },
            { "bump", bump }
        };
    }

    whitelist_entry whitelist_entry::decode(record_reader &r)
    {
        whitelist_entry res {};
        res.asset_id = r.key();
        res.enabled = r.boolean();
        res.bump = r.uint<uint8_t>();
        return res;
    }

    void whitelist_entry::encode(record_writer &w) const
    {
        w.key(asset_id).boolean(enabled).uint(bump);
    }

    json::object whitelist_entry::to_json() const
    {
        return json::object {
            { "assetId", key_str(asset_id) },
            { "enabled", enabled },
            { "bump", bump }
        };
    }

    search_record search_record::decode(record_reader &r)
    {
        search_record res {};
        res.searcher = r.key();
        res.x = r.i32();
        res.y = r.i32();
        res.nonce = r.uint<uint64_t>();
        res.found = r.boolean();
        res.bump = r.uint<uint8_t>();
        return res;
    }

    void search_record::encode(record_writer &w) const
    {
        w.key(searcher).i32(x).i32(y).uint<uint64_t>(nonce).boolean(found).uint(bump);
    }

    json::object search_record::to_json() const
    {
        return json::object {
            { "searcher", key_str(searcher) },
            { "x", x },
            { "y", y },
            { "nonce", nonce },
            { "found", found },
            { "bump", bump }
        };
    }

    collectible_receipt collectible_receipt::decode(record_reader &r)
    {
        collectible_receipt res {};
        res.deposit_record = r.key();
        res.collectible = r.key();
        res.bump = r.uint<uint8_t>();
        return res;
    }

    void collectible_receipt::encode(record_writer &w) const
    {
        w.key(deposit_record).key(collectible).uint(bump);
    }

    json::object collectible_receipt::to_json() const
    {
        return json::object {
            { "depositRecord", key_str(deposit_record) },
            { "collectible", key_str(collectible) },
            { "bump", bump }
        };
    }

    std::optional<json::object> describe(const buffer data)
    {
        std::optional<json::object> res {};
        ledger::describe_as<supply_state>(res, data)
            || ledger::describe_as<vault_state>(res, data)
            || ledger::describe_as<deposit_record>(res, data)
            || ledger::describe_as<whitelist_entry>(res, data)
            || ledger::describe_as<search_record>(res, data)
            || ledger::describe_as<collectible_receipt>(res, data);
        return res;
    }
}

/* This file is part of Treasure Core project.
 * Copyright (c) 2025 Treasure Core contributors
 * This code is distributed under the license specified in the LICENSE file. */

#include <tc/logger.hpp>
#include <tc/ledger/token-ledger.hpp>

namespace treasure_core::ledger {
    asset_record asset_record::decode(record_reader &r)
    {
        asset_record res {};
        res.decimals = r.uint<uint8_t>();
        res.mint_authority = r.key();
        res.supply = r.uint<uint64_t>();
        return res;
    }

    void asset_record::encode(record_writer &w) const
    {
        w.uint(decimals).key(mint_authority).uint<uint64_t>(supply);
    }

    json::object asset_record::to_json() const
    {
        return json::object {
            { "decimals", decimals },
            { "mintAuthority", key_str(mint_authority) },
            { "supply", supply }
        };
    }

    holding_record holding_record::decode(record_reader &r)
    {
        holding_record res {};
        res.asset = r.key();
        res.owner = r.key();
        res.balance = r.uint<uint64_t>();
        return res;
    }

    void holding_record::encode(record_writer &w) const
    {
        w.key(asset).key(owner).uint<uint64_t>(balance);
    }

    json::object holding_record::to_json() const
    {
        return json::object {
            { "asset", key_str(asset) },
            { "owner", key_str(owner) },
            { "balance", balance }
        };
    }

    metadata_record metadata_record::decode(record_reader &r)
    {
        metadata_record res {};
        res.asset = r.key();
        res.name = r.padded_string(max_name_size);
        res.symbol = r.padded_string(max_symbol_size);
        res.uri = r.padded_string(max_uri_size);
        res.royalty_bp = r.uint<uint16_t>();
        res.is_mutable = r.boolean();
        res.update_authority = r.key();
        return res;
    }

    void metadata_record::encode(record_writer &w) const
    {
        w.key(asset)
            .padded(std::string_view { name }, max_name_size)
            .padded(std::string_view { symbol }, max_symbol_size)
            .padded(std::string_view { uri }, max_uri_size)
            .uint(royalty_bp)
            .boolean(is_mutable)
            .key(update_authority);
    }

    json::object metadata_record::to_json() const
    {
        return json::object {
            { "asset", key_str(asset) },
            { "name", name },
            { "symbol", symbol },
            { "uri", uri },
            { "royaltyBasisPoints", royalty_bp },
            { "mutable", is_mutable },
            { "updateAuthority", key_str(update_authority) }
        };
    }

    std::optional<json::object> describe(const buffer data)
    {
        std::optional<json::object> res {};
        describe_as<asset_record>(res, data)
            || describe_as<holding_record>(res, data)
            || describe_as<metadata_record>(res, data);
        return res;
    }

    address token_ledger::holding_address(const pubkey &owner, const address &asset_id) const
    {
        return derive(_program_id, "holding", { owner, asset_id }).addr;
    }

    void token_ledger::create_asset(transaction &tx, const address &asset_id, const uint8_t decimals, const pubkey &mint_authority)
    {
        if (!tx.create(asset_id, asset_record { decimals, mint_authority, 0 }))
            throw program_error(error_code::already_initialized, "asset slot {} is occupied", asset_id);
        logger::info("created asset {} with {} decimals and mint authority {}", asset_id, decimals, mint_authority);
    }

    address token_ledger::open_holding(transaction &tx, const pubkey &owner, const address &asset_id)
    {
        // fails if the asset does not exist
        tx.get<asset_record>(asset_id);
        const auto addr = holding_address(owner, asset_id);
        if (tx.create(addr, holding_record { asset_id, owner, 0 }))
            logger::debug("opened holding {} of {} for {}", addr, asset_id, owner);
        return addr;
    }

    asset_info token_ledger::_asset_impl(const transaction &tx, const address &asset_id) const
    {
        const auto rec = tx.get<asset_record>(asset_id);
        return { rec.decimals, rec.mint_authority, rec.supply };
    }

    holding_info token_ledger::_holding_impl(const transaction &tx, const address &holding_addr) const
    {
        const auto rec = tx.get<holding_record>(holding_addr);
        return { rec.asset, rec.owner, rec.balance };
    }

    void token_ledger::_transfer_impl(transaction &tx, const address &from, const address &to, const amount_t amount, const pubkey &authorized_by)
    {
        auto src = tx.get<holding_record>(from);
        auto dst = tx.get<holding_record>(to);
        if (src.owner != authorized_by)
            throw program_error(error_code::unauthorized, "{} may not transfer from {}", authorized_by, from);
        if (src.asset != dst.asset)
            throw program_error(error_code::invalid_asset, "cannot transfer {} into a holding of {}", src.asset, dst.asset);
        if (src.balance < amount)
            throw program_error(error_code::insufficient_funds, "balance {} is below {}", src.balance, amount);
        if (from == to)
            return;
        src.balance -= amount;
        dst.balance = checked_add(dst.balance, amount);
        tx.update(from, src);
        tx.update(to, dst);
        logger::debug("transferred {} of {} from {} to {}", amount, src.asset, from, to);
    }

    void token_ledger::_mint_to_impl(transaction &tx, const address &asset_id, const address &to, const amount_t amount, const pubkey &authorized_by)
    {
        auto asset = tx.get<asset_record>(asset_id);
        auto dst = tx.get<holding_record>(to);
        if (asset.mint_authority != authorized_by)
            throw program_error(error_code::unauthorized, "{} is not the mint authority of {}", authorized_by, asset_id);
        if (dst.asset != asset_id)
            throw program_error(error_code::invalid_mint, "holding {} does not hold {}", to, asset_id);
        asset.supply = checked_add(asset.supply, amount);
        dst.balance = checked_add(dst.balance, amount);
        tx.update(asset_id, asset);
        tx.update(to, dst);
        logger::debug("minted {} of {} to {}", amount, asset_id, to);
    }

    void token_ledger::_burn_impl(transaction &tx, const address &asset_id, const address &from, const amount_t amount, const pubkey &authorized_by)
    {
        auto asset = tx.get<asset_record>(asset_id);
        auto src = tx.get<holding_record>(from);
        if (src.owner != authorized_by)
            throw program_error(error_code::unauthorized, "{} may not burn from {}", authorized_by, from);
        if (src.asset != asset_id)
            throw program_error(error_code::invalid_mint, "holding {} does not hold {}", from, asset_id);
        if (src.balance < amount)
            throw program_error(error_code::insufficient_funds, "balance {} is below {}", src.balance, amount);
        src.balance -= amount;
        asset.supply -= amount;
        tx.update(asset_id, asset);
        tx.update(from, src);
        logger::debug("burned {} of {} from {}", amount, asset_id, from);
    }

    address collectible_registry::metadata_address(const address &asset_id) const
    {
        return derive(_program_id, "metadata", { asset_id }).addr;
    }

    std::optional<metadata_record> collectible_registry::metadata(const transaction &tx, const address &asset_id) const
    {
        return tx.find<metadata_record>(metadata_address(asset_id));
    }

    void collectible_registry::_issue_impl(transaction &tx, const address &mint_target, const pubkey &to, const amount_t amount, const pubkey &authorized_by)
    {
        if (tx.exists(mint_target))
            throw program_error(error_code::already_initialized, "mint target {} is occupied", mint_target);
        _tokens.create_asset(tx, mint_target, 0, authorized_by);
        const auto holding = _tokens.open_holding(tx, to, mint_target);
        _tokens.mint_to(tx, mint_target, holding, amount, authorized_by);
    }

    void collectible_registry::_create_metadata_impl(transaction &tx, const address &asset_id, const metadata_params &params, const pubkey &update_authority)
    {
        // fails if the asset does not exist
        _tokens.asset(tx, asset_id);
        if (params.name.size() > metadata_record::max_name_size)
            throw program_error(error_code::invalid_metadata, "name is longer than {} bytes", metadata_record::max_name_size);
        if (params.symbol.size() > metadata_record::max_symbol_size)
            throw program_error(error_code::invalid_metadata, "symbol is longer than {} bytes", metadata_record::max_symbol_size);
        if (params.uri.size() > metadata_record::max_uri_size)
            throw program_error(error_code::invalid_metadata, "uri is longer than {} bytes", metadata_record::max_uri_size);
        if (params.royalty_bp > metadata_record::max_royalty_bp)
            throw program_error(error_code::invalid_metadata, "royalty of {} basis points is above {}", params.royalty_bp, metadata_record::max_royalty_bp);
        const metadata_record meta { asset_id, params.name, params.symbol, params.uri, params.royalty_bp, params.is_mutable, update_authority };
        if (!tx.create(metadata_address(asset_id), meta))
            throw program_error(error_code::already_initialized, "metadata of {} already exists", asset_id);
        logger::info("created metadata for {}: {}", asset_id, meta);
    }
}

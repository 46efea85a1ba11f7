/* This file is part of Treasure Core project.
 * Copyright (c) 2025 Treasure Core contributors
 * This code is distributed under the license specified in the LICENSE file. */

#include <tc/program/addresses.hpp>
#include <tc/program/supply.hpp>

namespace treasure_core::program::supply {
    using ledger::error_code;
    using ledger::program_error;

    supply_state load(const ledger::transaction &tx, const ledger::program_config &cfg)
    {
        const auto state = tx.find<supply_state>(addresses { cfg.program_id }.supply().addr);
        if (!state)
            throw program_error(error_code::not_initialized, "the supply ledger");
        return *state;
    }

    address init(context &ctx, const address &asset_id, const pubkey &authority, const uint8_t decimals,
        const std::optional<amount_t> max_supply)
    {
        const auto [addr, bump] = addresses { ctx.cfg.program_id }.supply();
        if (ctx.tx.exists(addr))
            throw program_error(error_code::already_initialized, "the supply ledger at {}", addr);
        ledger::asset_info asset {};
        try {
            asset = ctx.assets.asset(ctx.tx, asset_id);
        } catch (const program_error &ex) {
            if (ex.code() != error_code::record_not_found)
                throw;
            throw program_error(error_code::invalid_mint, "asset {} does not exist", asset_id);
        }
        if (asset.decimals != decimals)
            throw program_error(error_code::invalid_mint, "asset {} has {} decimals but {} were requested", asset_id, asset.decimals, decimals);
        if (asset.mint_authority != addr)
            throw program_error(error_code::invalid_mint, "the mint authority of {} must be the supply ledger {}", asset_id, addr);
        const supply_state state { asset_id, authority, 0, 0, max_supply, bump };
        if (!ctx.tx.create(addr, state))
            throw program_error(error_code::already_initialized, "the supply ledger at {}", addr);
        logger::info("reward token initialized: asset: {} authority: {} decimals: {} max supply: {}",
            asset_id, authority, decimals, max_supply ? fmt::format("{}", *max_supply) : std::string { "unlimited" });
        return addr;
    }

    void mint(context &ctx, const address &asset_id, const pubkey &recipient, const address &recipient_holding, const amount_t amount)
    {
        const auto addr = addresses { ctx.cfg.program_id }.supply().addr;
        auto state = load(ctx.tx, ctx.cfg);
        if (asset_id != state.asset_id)
            throw program_error(error_code::invalid_mint, "{} is not the reward token {}", asset_id, state.asset_id);
        const auto holding = ctx.assets.holding(ctx.tx, recipient_holding);
        if (holding.owner != recipient)
            throw program_error(error_code::invalid_holding_account, "holding {} is not owned by {}", recipient_holding, recipient);
        if (holding.asset != state.asset_id)
            throw program_error(error_code::invalid_mint, "holding {} does not hold {}", recipient_holding, state.asset_id);
        const auto new_total = ledger::checked_add(state.total_minted, amount);
        if (state.max_supply && new_total > *state.max_supply)
            throw program_error(error_code::max_supply_exceeded, "minting {} would bring the total to {} above the cap {}", amount, new_total, *state.max_supply);
        logger::info("minting {} reward tokens for {}", amount, recipient);
        ctx.assets.mint_to(ctx.tx, state.asset_id, recipient_holding, amount, addr);
        state.total_minted = new_total;
        ctx.tx.update(addr, state);
        logger::info("minted {} reward tokens, total minted: {}", amount, state.total_minted);
    }

    void burn(context &ctx, const address &asset_id, const pubkey &owner, const address &holding_addr, const amount_t amount)
    {
        const auto addr = addresses { ctx.cfg.program_id }.supply().addr;
        auto state = load(ctx.tx, ctx.cfg);
        if (asset_id != state.asset_id)
            throw program_error(error_code::invalid_mint, "{} is not the reward token {}", asset_id, state.asset_id);
        const auto holding = ctx.assets.holding(ctx.tx, holding_addr);
        if (holding.owner != owner)
            throw program_error(error_code::invalid_holding_account, "holding {} is not owned by {}", holding_addr, owner);
        if (holding.asset != state.asset_id)
            throw program_error(error_code::invalid_mint, "holding {} does not hold {}", holding_addr, state.asset_id);
        const auto new_total = ledger::checked_add(state.total_burned, amount);
        logger::info("burning {} reward tokens from {}", amount, owner);
        ctx.assets.burn(ctx.tx, state.asset_id, holding_addr, amount, owner);
        state.total_burned = new_total;
        ctx.tx.update(addr, state);
        logger::info("burned {} reward tokens, total burned: {} net supply: {}", amount, state.total_burned, state.net_supply());
    }

    void update_authority(context &ctx, const pubkey &caller, const pubkey &new_authority)
    {
        const auto addr = addresses { ctx.cfg.program_id }.supply().addr;
        auto state = load(ctx.tx, ctx.cfg);
        if (caller != state.authority)
            throw program_error(error_code::unauthorized, "{} is not the supply authority", caller);
        logger::info("updating the supply authority from {} to {}", state.authority, new_authority);
        state.authority = new_authority;
        ctx.tx.update(addr, state);
    }

    void update_max_supply(context &ctx, const pubkey &caller, const std::optional<amount_t> new_max_supply)
    {
        const auto addr = addresses { ctx.cfg.program_id }.supply().addr;
        auto state = load(ctx.tx, ctx.cfg);
        if (caller != state.authority)
            throw program_error(error_code::unauthorized, "{} is not the supply authority", caller);
        if (new_max_supply) {
            if (state.max_supply && *new_max_supply < *state.max_supply)
                throw program_error(error_code::cannot_decrease_max_supply, "{} is below the current cap {}", *new_max_supply, *state.max_supply);
            // a cap set over an unlimited supply still cannot go below what has been minted
            if (*new_max_supply < state.total_minted)
                throw program_error(error_code::cannot_decrease_max_supply, "{} is below the total minted {}", *new_max_supply, state.total_minted);
            logger::info("updating the max supply to {}", *new_max_supply);
        } else {
            logger::info("removing the max supply limit");
        }
        state.max_supply = new_max_supply;
        ctx.tx.update(addr, state);
    }
}

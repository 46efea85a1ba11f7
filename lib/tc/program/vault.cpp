/* This file is part of Treasure Core project.
 * Copyright (c) 2025 Treasure Core contributors
 * This code is distributed under the license specified in the LICENSE file. */

#include <tc/program/addresses.hpp>
#include <tc/program/vault.hpp>

namespace treasure_core::program::vault {
    using ledger::error_code;
    using ledger::program_error;

    uint8_t tier_of(const amount_t amount, const uint8_t decimals)
    {
        const auto tokens = amount / ledger::pow10(decimals);
        if (tokens >= 100'000)
            return 4;
        if (tokens >= 10'000)
            return 3;
        if (tokens >= 1'000)
            return 2;
        return 1;
    }

    vault_state load(const ledger::transaction &tx, const ledger::program_config &cfg)
    {
        const auto state = tx.find<vault_state>(addresses { cfg.program_id }.vault().addr);
        if (!state)
            throw program_error(error_code::not_initialized, "the vault");
        return *state;
    }

    address init(context &ctx, const pubkey &authority)
    {
        const auto [addr, bump] = addresses { ctx.cfg.program_id }.vault();
        if (!ctx.tx.create(addr, vault_state { authority, 0, 0, bump }))
            throw program_error(error_code::already_initialized, "the vault at {}", addr);
        logger::info("treasure vault initialized at {} with authority {}", addr, authority);
        return addr;
    }

    address deposit(context &ctx, const pubkey &depositor, const address &depositor_holding, const address &vault_holding,
        const amount_t amount, const uint64_t nonce)
    {
        const addresses addrs { ctx.cfg.program_id };
        const auto vault_addr = addrs.vault().addr;
        auto vault = load(ctx.tx, ctx.cfg);
        const auto src = ctx.assets.holding(ctx.tx, depositor_holding);
        const auto dst = ctx.assets.holding(ctx.tx, vault_holding);
        const auto asset = ctx.assets.asset(ctx.tx, src.asset);
        const auto min_amount = ledger::checked_mul(ctx.cfg.min_deposit_tokens, ledger::pow10(asset.decimals));
        if (amount < min_amount)
            throw program_error(error_code::insufficient_deposit, "{} is below the minimum of {}", amount, min_amount);
        if (src.owner != depositor)
            throw program_error(error_code::invalid_holding_account, "holding {} is not owned by {}", depositor_holding, depositor);
        if (dst.owner != vault_addr)
            throw program_error(error_code::invalid_holding_account, "holding {} is not owned by the vault {}", vault_holding, vault_addr);
        if (src.asset != dst.asset)
            throw program_error(error_code::invalid_asset, "cannot deposit {} into a holding of {}", src.asset, dst.asset);
        const auto [record_addr, bump] = addrs.deposit(depositor, nonce);
        const deposit_record rec { depositor, amount, nonce, false, tier_of(amount, asset.decimals), bump };
        if (!ctx.tx.create(record_addr, rec))
            throw program_error(error_code::duplicate_deposit, "depositor {} already used nonce {}", depositor, nonce);
        vault.total_deposited = ledger::checked_add(vault.total_deposited, amount);
        logger::info("{} is hiding {} tokens as treasure", depositor, amount);
        ctx.assets.transfer(ctx.tx, depositor_holding, vault_holding, amount, depositor);
        ctx.tx.update(vault_addr, vault);
        logger::info("treasure recorded at {} tier: {}", record_addr, rec.tier);
        return record_addr;
    }

    void claim(context &ctx, const pubkey &depositor, const address &record_addr)
    {
        const auto vault_addr = addresses { ctx.cfg.program_id }.vault().addr;
        auto vault = load(ctx.tx, ctx.cfg);
        auto rec = ctx.tx.get<deposit_record>(record_addr);
        if (rec.depositor != depositor)
            throw program_error(error_code::unauthorized, "deposit {} does not belong to {}", record_addr, depositor);
        if (rec.claimed)
            throw program_error(error_code::already_claimed, "deposit {}", record_addr);
        rec.claimed = true;
        vault.total_claimed_count = ledger::checked_add(vault.total_claimed_count, 1);
        ctx.tx.update(record_addr, rec);
        ctx.tx.update(vault_addr, vault);
        logger::info("{} claimed the treasure of tier {}, total claims: {}", depositor, rec.tier, vault.total_claimed_count);
    }

    void update_authority(context &ctx, const pubkey &caller, const std::optional<pubkey> &new_authority)
    {
        const auto vault_addr = addresses { ctx.cfg.program_id }.vault().addr;
        auto vault = load(ctx.tx, ctx.cfg);
        if (caller != vault.authority)
            throw program_error(error_code::unauthorized, "{} is not the vault authority", caller);
        if (!new_authority) {
            logger::info("the vault authority {} stays unchanged", vault.authority);
            return;
        }
        vault.authority = *new_authority;
        ctx.tx.update(vault_addr, vault);
        logger::info("the vault authority has been updated to {}", vault.authority);
    }
}

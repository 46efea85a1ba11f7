/* This file is part of Treasure Core project.
 * Copyright (c) 2025 Treasure Core contributors
 * This code is distributed under the license specified in the LICENSE file. */

#include <tc/program/addresses.hpp>
#include <tc/program/vault.hpp>
#include <tc/program/whitelist.hpp>

namespace treasure_core::program::whitelist {
    using ledger::error_code;
    using ledger::program_error;

    address set(context &ctx, const pubkey &caller, const address &asset_id, const bool enabled)
    {
        if (caller != vault::load(ctx.tx, ctx.cfg).authority)
            throw program_error(error_code::unauthorized, "{} is not the vault authority", caller);
        const auto [addr, bump] = addresses { ctx.cfg.program_id }.whitelist(asset_id);
        const whitelist_entry entry { asset_id, enabled, bump };
        if (!ctx.tx.create(addr, entry))
            ctx.tx.update(addr, entry);
        logger::info("asset {} whitelisted: {}", asset_id, enabled);
        return addr;
    }

    bool is_whitelisted(const ledger::transaction &tx, const ledger::program_config &cfg, const address &asset_id)
    {
        const auto entry = tx.find<whitelist_entry>(addresses { cfg.program_id }.whitelist(asset_id).addr);
        return entry && entry->enabled;
    }
}

/* This file is part of Treasure Core project.
 * Copyright (c) 2025 Treasure Core contributors
 * This code is distributed under the license specified in the LICENSE file. */

#include <tc/program/addresses.hpp>
#include <tc/program/collectible.hpp>

namespace treasure_core::program::collectible {
    using ledger::error_code;
    using ledger::program_error;

    void mint(context &ctx, const pubkey &payer, const pubkey &recipient, const address &mint_target, const metadata &meta)
    {
        logger::info("minting collectible {} title: {} uri: {}", mint_target, meta.title, meta.uri);
        ctx.collectibles.issue(ctx.tx, mint_target, recipient, 1, payer);
        ctx.collectibles.create_metadata(ctx.tx, mint_target, ledger::metadata_params { meta.title, meta.symbol, meta.uri, 0, false, true }, payer);
        logger::info("collectible {} issued to {}", mint_target, recipient);
    }

    address mint_for_claim(context &ctx, const pubkey &payer, const pubkey &depositor, const address &record_addr,
        const address &mint_target, const metadata &meta)
    {
        const auto rec = ctx.tx.get<deposit_record>(record_addr);
        if (rec.depositor != depositor)
            throw program_error(error_code::unauthorized, "deposit {} does not belong to {}", record_addr, depositor);
        if (!rec.claimed)
            throw program_error(error_code::claim_required, "deposit {}", record_addr);
        const auto [receipt_addr, bump] = addresses { ctx.cfg.program_id }.receipt(record_addr);
        if (!ctx.tx.create(receipt_addr, collectible_receipt { record_addr, mint_target, bump }))
            throw program_error(error_code::collectible_already_issued, "deposit {}", record_addr);
        mint(ctx, payer, depositor, mint_target, meta);
        return receipt_addr;
    }
}

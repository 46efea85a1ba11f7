/* This file is part of Treasure Core project.
 * Copyright (c) 2025 Treasure Core contributors
 * This code is distributed under the license specified in the LICENSE file. */

#include <cctype>
#include <charconv>
#include <filesystem>
#include <tc/ed25519.hpp>
#include <tc/file.hpp>
#include <tc/program/supply.hpp>
#include <tc/program/vault.hpp>
#include <tc/cli/common.hpp>

namespace treasure_core::cli::common {
    static ledger::account_store _load_store(const std::string &path)
    {
        if (!std::filesystem::exists(path)) {
            logger::info("state file {} does not exist, starting with an empty store", path);
            return {};
        }
        return ledger::account_store::load(path);
    }

    session::session(const std::string &path):
        state_path { path },
        cfg { ledger::program_config::get() },
        store { _load_store(path) },
        tokens { cfg.token_program_id },
        collectibles { tokens, cfg.collectible_program_id },
        host { store, cfg, tokens, collectibles },
        ep { host },
        addrs { cfg.program_id }
    {
    }

    void session::save() const
    {
        store.save(state_path);
        logger::info("saved {} slots to {}", store.size(), state_path);
    }

    void session::mint(const pubkey &recipient, const amount_t amount)
    {
        host.execute("mint", [&](ledger::context &ctx) {
            const auto asset_id = program::supply::load(ctx.tx, ctx.cfg).asset_id;
            const auto holding = tokens.open_holding(ctx.tx, recipient, asset_id);
            program::supply::mint(ctx, asset_id, recipient, holding, amount);
        });
    }

    address session::deposit(const pubkey &depositor, const address &asset_id, const amount_t amount, const uint64_t nonce)
    {
        return host.execute("deposit", [&](ledger::context &ctx) {
            const auto vault_holding = tokens.open_holding(ctx.tx, addrs.vault().addr, asset_id);
            return program::vault::deposit(ctx, depositor, tokens.holding_address(depositor, asset_id), vault_holding, amount, nonce);
        });
    }

    pubkey load_signer(const std::string &key_path)
    {
        const auto data = file::read(key_path);
        std::string_view hex { data.str() };
        while (!hex.empty() && std::isspace(static_cast<unsigned char>(hex.back())))
            hex.remove_suffix(1);
        const auto sk = ed25519::skey::from_hex(hex);
        return ed25519::extract_vk(sk);
    }

    address parse_address(const std::string &hex)
    {
        return address::from_hex(hex);
    }

    template<typename T>
    static T _parse_int(const std::string &val)
    {
        T res {};
        const auto [ptr, ec] = std::from_chars(val.data(), val.data() + val.size(), res);
        if (ec != std::errc {} || ptr != val.data() + val.size())
            throw error("not a valid {}-bit integer: '{}'", sizeof(T) * 8, val);
        return res;
    }

    uint64_t parse_u64(const std::string &val)
    {
        return _parse_int<uint64_t>(val);
    }

    int32_t parse_i32(const std::string &val)
    {
        return _parse_int<int32_t>(val);
    }

    std::optional<uint64_t> parse_opt_u64(const std::string &val)
    {
        if (val == "none")
            return {};
        return parse_u64(val);
    }
}

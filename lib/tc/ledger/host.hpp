/* This file is part of Treasure Core project.
 * Copyright (c) 2025 Treasure Core contributors
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef TREASURE_CORE_LEDGER_HOST_HPP
#define TREASURE_CORE_LEDGER_HOST_HPP

#include <tc/config.hpp>
#include <tc/logger.hpp>
#include <tc/mutex.hpp>
#include <tc/timer.hpp>
#include <tc/ledger/services.hpp>

namespace treasure_core::ledger {
    struct program_config {
        static constexpr uint64_t default_min_deposit_tokens = 100;

        address program_id {};
        address token_program_id {};
        address collectible_program_id {};
        uint64_t min_deposit_tokens = default_min_deposit_tokens;

        static program_config from_json(const json::object &j);
        // the "program" configuration of configs_dir::get()
        static const program_config &get();

        bool operator==(const program_config &) const =default;
    };

    // Everything a single operation may touch
    struct context {
        transaction &tx;
        const program_config &cfg;
        asset_service &assets;
        collectible_service &collectibles;
    };

    // Runs operations one at a time, each in its own transaction that is committed only on success
    struct host {
        host(account_store &store, const program_config &cfg, asset_service &assets, collectible_service &collectibles):
            _store { store }, _cfg { cfg }, _assets { assets }, _collectibles { collectibles }
        {
        }

        const program_config &config() const noexcept
        {
            return _cfg;
        }

        const account_store &store() const noexcept
        {
            return _store;
        }

        template<typename F>
        auto execute(const std::string_view name, const F &op)
        {
            mutex::scoped_lock lk { _mutex };
            timer t { fmt::format("operation {}", name), logger::level::debug };
            transaction tx { _store };
            context ctx { tx, _cfg, _assets, _collectibles };
            try {
                if constexpr (std::is_void_v<decltype(op(ctx))>) {
                    op(ctx);
                    tx.commit();
                } else {
                    auto res = op(ctx);
                    tx.commit();
                    return res;
                }
            } catch (const std::exception &ex) {
                logger::warn("operation {} failed and has been rolled back: {}", name, ex.what());
                throw;
            }
        }

        // a read-only view of the committed state
        template<typename F>
        auto query(const F &op) const
        {
            mutex::scoped_lock lk { _mutex };
            const transaction tx { _store };
            return op(tx);
        }
    private:
        account_store &_store;
        const program_config &_cfg;
        asset_service &_assets;
        collectible_service &_collectibles;
        mutable std::mutex _mutex alignas(mutex::padding) {};
    };
}

#endif // !TREASURE_CORE_LEDGER_HOST_HPP

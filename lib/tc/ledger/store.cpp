/* This file is part of Treasure Core project.
 * Copyright (c) 2025 Treasure Core contributors
 * This code is distributed under the license specified in the LICENSE file. */

#include <tc/logger.hpp>
#include <tc/zpp.hpp>
#include <tc/ledger/store.hpp>

namespace treasure_core::ledger {
    struct slot_snapshot {
        std::array<uint8_t, sizeof(address)> addr {};
        std::vector<uint8_t> data {};

        constexpr static auto serialize(auto &archive, auto &self)
        {
            return archive(self.addr, self.data);
        }
    };

    struct store_snapshot {
        static constexpr uint32_t current_version = 1;

        uint32_t version = current_version;
        std::vector<slot_snapshot> slots {};

        constexpr static auto serialize(auto &archive, auto &self)
        {
            return archive(self.version, self.slots);
        }
    };

    account_store account_store::load(const std::string &path)
    {
        const auto snap = zpp::load<store_snapshot>(path);
        if (snap.version != store_snapshot::current_version)
            throw error("unsupported snapshot version {} in {}", snap.version, path);
        account_store st {};
        for (const auto &s: snap.slots) {
            address addr {};
            std::copy(s.addr.begin(), s.addr.end(), addr.begin());
            if (!st._slots.try_emplace(addr, buffer { s.data.data(), s.data.size() }).second)
                throw error("snapshot {} contains a duplicate slot {}", path, addr);
        }
        logger::debug("loaded {} slots from {}", st.size(), path);
        return st;
    }

    void account_store::save(const std::string &path) const
    {
        store_snapshot snap {};
        snap.slots.reserve(_slots.size());
        for (const auto &[addr, data]: _slots) {
            auto &s = snap.slots.emplace_back();
            std::copy(addr.begin(), addr.end(), s.addr.begin());
            s.data.assign(data.begin(), data.end());
        }
        zpp::save(path, snap);
        logger::debug("saved {} slots to {}", snap.slots.size(), path);
    }

    bool transaction::create_raw(const address &addr, const buffer data)
    {
        if (exists(addr))
            return false;
        _writes.emplace(addr, uint8_vector { data });
        return true;
    }

    void transaction::update_raw(const address &addr, const buffer data)
    {
        if (!exists(addr))
            throw program_error(error_code::record_not_found, "cannot update a missing slot {}", addr);
        _writes.insert_or_assign(addr, uint8_vector { data });
    }

    void transaction::commit()
    {
        if (_committed)
            throw error("the transaction has already been committed");
        for (const auto &[addr, data]: _writes)
            _store.put(addr, data);
        _committed = true;
        logger::trace("committed {} slot writes", _writes.size());
    }
}

/* This file is part of Treasure Core project.
 * Copyright (c) 2025 Treasure Core contributors
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef TREASURE_CORE_LEDGER_STORE_HPP
#define TREASURE_CORE_LEDGER_STORE_HPP

#include <tc/container.hpp>
#include <tc/ledger/codec.hpp>
#include <tc/ledger/error.hpp>

namespace treasure_core::ledger {
    // The committed state: a map of slots keyed by their addresses
    struct account_store {
        using slot_map = map<address, uint8_vector>;

        static account_store load(const std::string &path);

        bool contains(const address &addr) const
        {
            return _slots.contains(addr);
        }

        std::optional<buffer> find(const address &addr) const
        {
            if (const auto it = _slots.find(addr); it != _slots.end())
                return static_cast<buffer>(it->second);
            return {};
        }

        void put(const address &addr, const buffer data)
        {
            _slots.insert_or_assign(addr, uint8_vector { data });
        }

        size_t size() const noexcept
        {
            return _slots.size();
        }

        const slot_map &slots() const noexcept
        {
            return _slots;
        }

        void save(const std::string &path) const;

        bool operator==(const account_store &o) const
        {
            return _slots == o._slots;
        }
    private:
        slot_map _slots {};
    };

    // A write overlay over an account_store. Writes become visible in the store only after commit;
    // destroying an uncommitted transaction discards them.
    struct transaction {
        explicit transaction(account_store &store): _store { store }
        {
        }

        transaction(const transaction &) =delete;
        transaction &operator=(const transaction &) =delete;

        bool exists(const address &addr) const
        {
            return _writes.find(addr) != _writes.end() || _store.contains(addr);
        }

        std::optional<buffer> read(const address &addr) const
        {
            if (const auto it = _writes.find(addr); it != _writes.end())
                return static_cast<buffer>(it->second);
            return _store.find(addr);
        }

        // insert-if-absent: returns false and changes nothing when the slot is occupied
        [[nodiscard]] bool create_raw(const address &addr, buffer data);
        void update_raw(const address &addr, buffer data);

        template<record_c T>
        std::optional<T> find(const address &addr) const
        {
            if (const auto data = read(addr); data)
                return from_bytes<T>(*data);
            return {};
        }

        template<record_c T>
        T get(const address &addr) const
        {
            const auto data = read(addr);
            if (!data)
                throw program_error(error_code::record_not_found, "{} at {}", T::type_name, addr);
            return from_bytes<T>(*data);
        }

        template<record_c T>
        [[nodiscard]] bool create(const address &addr, const T &v)
        {
            return create_raw(addr, to_bytes(v));
        }

        template<record_c T>
        void update(const address &addr, const T &v)
        {
            update_raw(addr, to_bytes(v));
        }

        size_t num_writes() const noexcept
        {
            return _writes.size();
        }

        bool committed() const noexcept
        {
            return _committed;
        }

        void commit();
    private:
        account_store &_store;
        flat_map<address, uint8_vector> _writes {};
        bool _committed = false;
    };
}

#endif // !TREASURE_CORE_LEDGER_STORE_HPP

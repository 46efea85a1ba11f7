/* This file is part of Treasure Core project.
 * Copyright (c) 2025 Treasure Core contributors
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef TREASURE_CORE_LEDGER_CODEC_HPP
#define TREASURE_CORE_LEDGER_CODEC_HPP

#include <concepts>
#include <optional>
#include <tc/json.hpp>
#include <tc/ledger/address.hpp>

namespace treasure_core::ledger {
    using discriminator = byte_array<8>;

    // the first 8 bytes of sha256("account:<type_name>")
    extern discriminator discriminator_of(std::string_view type_name);

    // Fixed-width little-endian writer of persisted records
    struct record_writer {
        explicit record_writer(const size_t reserve=0)
        {
            _data.reserve(reserve);
        }

        record_writer &bytes(const buffer b)
        {
            _data << b;
            return *this;
        }

        template<std::unsigned_integral T>
        record_writer &uint(const T val)
        {
            for (size_t i = 0; i < sizeof(T); ++i)
                _data << static_cast<uint8_t>(static_cast<uint64_t>(val) >> (i * 8));
            return *this;
        }

        record_writer &i32(const int32_t val)
        {
            return uint(static_cast<uint32_t>(val));
        }

        record_writer &boolean(const bool val)
        {
            return uint(static_cast<uint8_t>(val ? 1 : 0));
        }

        record_writer &key(const pubkey &k)
        {
            return bytes(k);
        }

        // one tag byte followed by the value; a missing value is written as zeros to keep the width fixed
        record_writer &opt_u64(const std::optional<uint64_t> &val)
        {
            boolean(val.has_value());
            return uint<uint64_t>(val.value_or(0));
        }

        // writes exactly sz bytes, zero-padding the remainder
        record_writer &padded(const buffer b, const size_t sz)
        {
            if (b.size() > sz)
                throw error("a value of {} bytes does not fit into a field of {} bytes", b.size(), sz);
            _data << b;
            _data.resize(_data.size() + sz - b.size());
            return *this;
        }

        const uint8_vector &data() const noexcept
        {
            return _data;
        }

        uint8_vector take()
        {
            return std::move(_data);
        }
    private:
        uint8_vector _data {};
    };

    struct record_reader {
        explicit record_reader(const buffer data): _data { data }
        {
        }

        buffer bytes(const size_t sz)
        {
            const auto res = _data.subbuf(_pos, sz);
            _pos += sz;
            return res;
        }

        template<std::unsigned_integral T>
        T uint()
        {
            const auto b = bytes(sizeof(T));
            uint64_t val = 0;
            for (size_t i = 0; i < sizeof(T); ++i)
                val |= static_cast<uint64_t>(b[i]) << (i * 8);
            return static_cast<T>(val);
        }

        int32_t i32()
        {
            return static_cast<int32_t>(uint<uint32_t>());
        }

        bool boolean()
        {
            switch (const auto v = uint<uint8_t>(); v) {
                case 0: return false;
                case 1: return true;
                default: throw error("invalid boolean encoding: {}", v);
            }
        }

        pubkey key()
        {
            return pubkey { bytes(sizeof(pubkey)) };
        }

        std::optional<uint64_t> opt_u64()
        {
            const auto present = boolean();
            const auto val = uint<uint64_t>();
            if (present)
                return val;
            return {};
        }

        // returns the value without the zero padding
        std::string padded_string(const size_t sz)
        {
            const auto sv = bytes(sz).string_view();
            return std::string { sv.substr(0, sv.find('\0')) };
        }

        size_t remaining() const noexcept
        {
            return _data.size() - _pos;
        }
    private:
        buffer _data;
        size_t _pos = 0;
    };

    template<typename T>
    concept record_c = requires(const T &v, record_writer &w, record_reader &r)
    {
        { T::type_name } -> std::convertible_to<std::string_view>;
        { T::serialized_size } -> std::convertible_to<size_t>;
        { v.encode(w) };
        { T::decode(r) } -> std::same_as<T>;
        { v.to_json() } -> std::same_as<json::object>;
    };

    template<record_c T>
    uint8_vector to_bytes(const T &v)
    {
        record_writer w { T::serialized_size };
        w.bytes(discriminator_of(T::type_name));
        v.encode(w);
        if (w.data().size() != T::serialized_size) [[unlikely]]
            throw error("{} must be encoded into {} bytes but got {}", T::type_name, T::serialized_size, w.data().size());
        return w.take();
    }

    template<record_c T>
    bool has_type(const buffer data)
    {
        return data.size() == T::serialized_size && data.subbuf(0, sizeof(discriminator)) == static_cast<buffer>(discriminator_of(T::type_name));
    }

    template<record_c T>
    T from_bytes(const buffer data)
    {
        if (data.size() != T::serialized_size)
            throw error("{} must have {} bytes but got {}", T::type_name, T::serialized_size, data.size());
        record_reader r { data };
        if (const auto disc = r.bytes(sizeof(discriminator)); disc != static_cast<buffer>(discriminator_of(T::type_name)))
            throw error("unexpected discriminator {} for {}", disc, T::type_name);
        return T::decode(r);
    }

    // fills res with the type name and the fields of a slot when it holds a T
    template<record_c T>
    bool describe_as(std::optional<json::object> &res, const buffer data)
    {
        if (!has_type<T>(data))
            return false;
        auto &j = res.emplace();
        j.emplace("type", T::type_name);
        j.emplace("data", from_bytes<T>(data).to_json());
        return true;
    }

    inline std::string key_str(const pubkey &k)
    {
        return fmt::format("{}", k);
    }
}

namespace fmt {
    template<treasure_core::ledger::record_c T>
    struct formatter<T>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            return fmt::format_to(ctx.out(), "{}{}", T::type_name, boost::json::serialize(v.to_json()));
        }
    };
}

#endif // !TREASURE_CORE_LEDGER_CODEC_HPP

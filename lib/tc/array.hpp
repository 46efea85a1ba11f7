/* This file is part of Treasure Core project.
 * Copyright (c) 2025 Treasure Core contributors
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef TREASURE_CORE_ARRAY_HPP
#define TREASURE_CORE_ARRAY_HPP

#include <array>
#include <cstring>
#include <initializer_list>
#include <span>
#include <tc/common/error.hpp>
#include <tc/common/format.hpp>
#include <tc/common/bytes.hpp>

namespace treasure_core {
    template<size_t SZ>
    struct byte_array: std::array<uint8_t, SZ> {
        using base_type = std::array<uint8_t, SZ>;

        static byte_array<SZ> from_hex(const std::string_view hex)
        {
            byte_array<SZ> data;
            init_from_hex(data, hex);
            return data;
        }

        byte_array(): base_type {}
        {
        }

        byte_array(const std::initializer_list<uint8_t> s) {
            if (s.size() != SZ) [[unlikely]]
                throw error("span must be of size {} but got {}", SZ, s.size());
            std::copy(s.begin(), s.end(), base_type::begin());
        }

        byte_array(const buffer s)
        {
            if (s.size() != SZ) [[unlikely]]
                throw error("buffer must be of size {} but got {}", SZ, s.size());
            memcpy(base_type::data(), s.data(), SZ);
        }

        byte_array &operator=(const buffer s)
        {
            if (s.size() != SZ) [[unlikely]]
                throw error("buffer must be of size {} but got {}", SZ, s.size());
            memcpy(base_type::data(), s.data(), SZ);
            return *this;
        }

        operator buffer() const noexcept
        {
            return { base_type::data(), SZ };
        }

        explicit operator std::string_view() const noexcept
        {
            return { reinterpret_cast<const char *>(base_type::data()), base_type::size() };
        }
    };
}

namespace fmt {
    template<size_t SZ>
    struct formatter<treasure_core::byte_array<SZ>>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out())
        {
            return fmt::format_to(ctx.out(), "{}", std::span<const uint8_t>(v.data(), v.size()));
        }
    };
}

#endif // !TREASURE_CORE_ARRAY_HPP

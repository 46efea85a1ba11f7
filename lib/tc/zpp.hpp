/* This file is part of Treasure Core project.
 * Copyright (c) 2025 Treasure Core contributors
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef TREASURE_CORE_ZPP_HPP
#define TREASURE_CORE_ZPP_HPP

#include <zpp_bits.h>
#include <tc/file.hpp>

namespace treasure_core::zpp {
    template<typename T>
    void deserialize(T &v, const buffer zpp_data)
    {
        ::zpp::bits::in in { zpp_data };
        in(v).or_throw();
    }

    template<typename T>
    T load(const std::string &path)
    {
        T v;
        const auto zpp_data = file::read(path);
        ::zpp::bits::in in { zpp_data };
        in(v).or_throw();
        return v;
    }

    template<typename T>
    uint8_vector serialize(const T &v)
    {
        uint8_vector zpp_data {};
        ::zpp::bits::out out { zpp_data };
        out(v).or_throw();
        return zpp_data;
    }

    template<typename T>
    void save(const std::string &path, const T &v)
    {
        file::write(path, serialize(v));
    }
}

#endif // !TREASURE_CORE_ZPP_HPP

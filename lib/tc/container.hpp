/* This file is part of Treasure Core project.
 * Copyright (c) 2025 Treasure Core contributors
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef TREASURE_CORE_CONTAINER_HPP
#define TREASURE_CORE_CONTAINER_HPP

#include <map>
#include <set>
#include <vector>
#include <boost/container/flat_map.hpp>
#include <tc/common/format.hpp>

namespace treasure_core {
    template<typename T>
    using vector = std::vector<T>;

    template<typename K, typename V>
    using map = std::map<K, V>;

    template<typename T, typename C=std::less<T>>
    using set = std::set<T, C>;

    template<typename K, typename V>
    struct flat_map: boost::container::flat_map<K, V> {
        using base_type = boost::container::flat_map<K, V>;
        using base_type::base_type;

        const typename base_type::value_type &at(const size_t idx) const
        {
            if (const auto it = base_type::nth(idx); it != base_type::end()) [[likely]]
                return *it;
            throw error("flat_map index out of range: {} >= {}", idx, base_type::size());
        }
    };
}

#endif // !TREASURE_CORE_CONTAINER_HPP

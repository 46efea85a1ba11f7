/* This file is part of Treasure Core project.
 * Copyright (c) 2025 Treasure Core contributors
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef TREASURE_CORE_FILE_HPP
#define TREASURE_CORE_FILE_HPP

#include <filesystem>
#include <string>
#include <tc/common/bytes.hpp>

namespace treasure_core::file {
    extern void read(const std::string &path, uint8_vector &buf);
    extern uint8_vector read(const std::string &path);
    // writes to a temporary file first and renames it to make the update atomic
    extern void write(const std::string &path, const buffer &data);

    struct tmp {
        explicit tmp(const std::string_view name);
        ~tmp();

        const std::string &path() const noexcept
        {
            return _path;
        }

        operator const std::string &() const noexcept
        {
            return _path;
        }
    private:
        std::string _path;
    };
}

#endif // !TREASURE_CORE_FILE_HPP

/* This file is part of Treasure Core project.
 * Copyright (c) 2025 Treasure Core contributors
 * This code is distributed under the license specified in the LICENSE file. */

#include <fstream>
#include <tc/file.hpp>
#include <tc/logger.hpp>

namespace treasure_core::file {
    void read(const std::string &path, uint8_vector &buf)
    {
        std::ifstream is { path, std::ios::binary | std::ios::ate };
        if (!is)
            throw error_sys(fmt::format("failed to open file {} for reading", path));
        const auto sz = static_cast<size_t>(is.tellg());
        buf.resize(sz);
        is.seekg(0, std::ios::beg);
        if (sz > 0 && !is.read(reinterpret_cast<char *>(buf.data()), static_cast<std::streamsize>(sz)))
            throw error_sys(fmt::format("failed to read {} bytes from {}", sz, path));
    }

    uint8_vector read(const std::string &path)
    {
        uint8_vector buf {};
        read(path, buf);
        return buf;
    }

    void write(const std::string &path, const buffer &data)
    {
        const std::filesystem::path target { path };
        if (target.has_parent_path())
            std::filesystem::create_directories(target.parent_path());
        const auto tmp_path = fmt::format("{}.tmp", path);
        {
            std::ofstream os { tmp_path, std::ios::binary | std::ios::trunc };
            if (!os)
                throw error_sys(fmt::format("failed to open file {} for writing", tmp_path));
            if (!os.write(reinterpret_cast<const char *>(data.data()), static_cast<std::streamsize>(data.size())))
                throw error_sys(fmt::format("failed to write {} bytes to {}", data.size(), tmp_path));
        }
        std::filesystem::rename(tmp_path, target);
        logger::trace("wrote {} bytes to {}", data.size(), path);
    }

    tmp::tmp(const std::string_view name):
        _path { (std::filesystem::temp_directory_path() / name).string() }
    {
    }

    tmp::~tmp()
    {
        std::error_code ec {};
        std::filesystem::remove(_path, ec);
        std::filesystem::remove(_path + ".tmp", ec);
    }
}

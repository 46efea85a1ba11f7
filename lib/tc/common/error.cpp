/* This file is part of Treasure Core project.
 * Copyright (c) 2025 Treasure Core contributors
 * This code is distributed under the license specified in the LICENSE file. */

#ifdef __APPLE__
#   define _GNU_SOURCE 1
#endif
#include <cerrno>
#include <cstring>
#include <boost/stacktrace.hpp>
#include "error.hpp"
#include "format.hpp"

namespace treasure_core {
    base_error::base_error(const std::string_view msg):
        _msg { msg }
    {
        // skips top 3 frames: safe_dump, base_error, and error
        boost::stacktrace::safe_dump_to(3, _trace.data(), _trace.size());
    }

    const char *base_error::what() const noexcept
    {
        return _msg.c_str();
    }

    std::string base_error::stacktrace() const
    {
        return boost::stacktrace::to_string(boost::stacktrace::stacktrace::from_dump(_trace.data(), _trace.size()));
    }

    error::error(const std::string_view msg)
        : base_error { msg }
    {
    }

    error_sys::error_sys(const std::string_view msg)
        : error { std::string_view { fmt::format("{} errno: {} strerror: {}", msg, errno, std::strerror(errno)) } }
    {
    }
}

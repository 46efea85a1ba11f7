/* This file is part of Treasure Core project.
 * Copyright (c) 2025 Treasure Core contributors
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef TREASURE_CORE_COMMON_ERROR_HPP
#define TREASURE_CORE_COMMON_ERROR_HPP

#include <array>
#include <stdexcept>
#include <string>
#include <string_view>
#include <fmt/core.h>

namespace treasure_core {
    struct base_error: std::exception {
        static constexpr size_t stacktrace_depth = 0x20;

        explicit base_error(std::string_view msg);
        const char *what() const noexcept override;
        // the call stack at the point of construction, rendered on request
        std::string stacktrace() const;
    private:
        std::string _msg;
        std::array<std::byte, sizeof(void*) * stacktrace_depth> _trace {};
    };

    struct error: base_error {
        explicit error(std::string_view msg);

        template<typename ...Args>
        explicit error(fmt::format_string<Args...> fmt, Args&&... a):
            error { std::string_view { fmt::format(fmt, std::forward<Args>(a)...) } }
        {
        }
    };

    struct error_sys: error {
        explicit error_sys(std::string_view msg);
    };
}

#endif // !TREASURE_CORE_COMMON_ERROR_HPP

/* This file is part of Treasure Core project.
 * Copyright (c) 2025 Treasure Core contributors
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef TREASURE_CORE_TIMER_HPP
#define TREASURE_CORE_TIMER_HPP

#include <chrono>
#include <exception>
#include <tc/logger.hpp>

namespace treasure_core {
    struct timer {
        explicit timer(const std::string_view &title, const logger::level lev=logger::level::trace)
            : _title { title }, _level { lev }, _start_time { std::chrono::system_clock::now() }
        {
        }

        ~timer() {
            print();
        }

        void print()
        {
            if (!_printed) {
                _printed = true;
                if (std::uncaught_exceptions() == 0)
                    logger::log(_level, "{} took {:0.3f} secs", _title, duration());
                else
                    logger::log(_level, "{} failed after {:0.3f} secs", _title, duration());
            }
        }

        double duration() const
        {
            const std::chrono::duration<double> elapsed_seconds = std::chrono::system_clock::now() - _start_time;
            return elapsed_seconds.count();
        }
    private:
        const std::string _title;
        const logger::level _level;
        const std::chrono::time_point<std::chrono::system_clock> _start_time;
        bool _printed = false;
    };
}

#endif // !TREASURE_CORE_TIMER_HPP

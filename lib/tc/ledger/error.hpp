/* This file is part of Treasure Core project.
 * Copyright (c) 2025 Treasure Core contributors
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef TREASURE_CORE_LEDGER_ERROR_HPP
#define TREASURE_CORE_LEDGER_ERROR_HPP

#include <cstdint>
#include <tc/common/error.hpp>
#include <tc/common/format.hpp>

namespace treasure_core::ledger {
    // numbering follows the custom error range of on-chain programs
    enum class error_code: uint32_t {
        insufficient_deposit = 6000,
        already_claimed,
        duplicate_deposit,
        duplicate_search,
        unauthorized,
        arithmetic_overflow,
        max_supply_exceeded,
        cannot_decrease_max_supply,
        invalid_asset,
        invalid_mint,
        invalid_holding_account,
        address_derivation_exhausted,
        already_initialized,
        not_initialized,
        record_not_found,
        claim_required,
        collectible_already_issued,
        insufficient_funds,
        invalid_metadata
    };

    extern std::string_view error_name(error_code code);
    extern std::string_view error_message(error_code code);

    struct program_error: error {
        explicit program_error(error_code code);
        explicit program_error(error_code code, std::string_view details);

        template<typename ...Args>
        explicit program_error(const error_code code, fmt::format_string<Args...> fmt, Args&&... a):
            program_error { code, std::string_view { fmt::format(fmt, std::forward<Args>(a)...) } }
        {
        }

        error_code code() const noexcept
        {
            return _code;
        }
    private:
        error_code _code;
    };
}

namespace fmt {
    template<>
    struct formatter<treasure_core::ledger::error_code>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            return fmt::format_to(ctx.out(), "{}", treasure_core::ledger::error_name(v));
        }
    };
}

#endif // !TREASURE_CORE_LEDGER_ERROR_HPP

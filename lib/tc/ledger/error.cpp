/* This file is part of Treasure Core project.
 * Copyright (c) 2025 Treasure Core contributors
 * This code is distributed under the license specified in the LICENSE file. */

#include <tc/ledger/error.hpp>

namespace treasure_core::ledger {
    struct error_info {
        std::string_view name;
        std::string_view message;
    };

    static error_info _info(const error_code code)
    {
        switch (code) {
            case error_code::insufficient_deposit: return { "InsufficientDeposit", "Deposit amount is below the minimum" };
            case error_code::already_claimed: return { "AlreadyClaimed", "The deposit has already been claimed" };
            case error_code::duplicate_deposit: return { "DuplicateDeposit", "A deposit with this nonce already exists" };
            case error_code::duplicate_search: return { "DuplicateSearch", "A search with this nonce already exists" };
            case error_code::unauthorized: return { "Unauthorized", "You are not authorized to perform this action" };
            case error_code::arithmetic_overflow: return { "ArithmeticOverflow", "Arithmetic overflow" };
            case error_code::max_supply_exceeded: return { "MaxSupplyExceeded", "Maximum supply exceeded" };
            case error_code::cannot_decrease_max_supply: return { "CannotDecreaseMaxSupply", "Cannot decrease max supply" };
            case error_code::invalid_asset: return { "InvalidAsset", "Invalid token asset" };
            case error_code::invalid_mint: return { "InvalidMint", "Invalid token mint" };
            case error_code::invalid_holding_account: return { "InvalidHoldingAccount", "Invalid token account" };
            case error_code::address_derivation_exhausted: return { "AddressDerivationExhausted", "Unable to find a viable derived address" };
            case error_code::already_initialized: return { "AlreadyInitialized", "The record has already been initialized" };
            case error_code::not_initialized: return { "NotInitialized", "The record has not been initialized" };
            case error_code::record_not_found: return { "RecordNotFound", "The requested record does not exist" };
            case error_code::claim_required: return { "ClaimRequired", "The deposit must be claimed first" };
            case error_code::collectible_already_issued: return { "CollectibleAlreadyIssued", "A collectible has already been issued for the deposit" };
            case error_code::insufficient_funds: return { "InsufficientFunds", "Insufficient funds" };
            case error_code::invalid_metadata: return { "InvalidMetadata", "Invalid collectible metadata" };
            default: throw error("unsupported error code: {}", static_cast<uint32_t>(code));
        }
    }

    std::string_view error_name(const error_code code)
    {
        return _info(code).name;
    }

    std::string_view error_message(const error_code code)
    {
        return _info(code).message;
    }

    program_error::program_error(const error_code code)
        : program_error { code, std::string_view {} }
    {
    }

    program_error::program_error(const error_code code, const std::string_view details)
        : error { std::string_view { details.empty()
            ? fmt::format("{} ({}): {}", error_name(code), static_cast<uint32_t>(code), error_message(code))
            : fmt::format("{} ({}): {}: {}", error_name(code), static_cast<uint32_t>(code), error_message(code), details) } },
          _code { code }
    {
    }
}

/* This file is part of Treasure Core project.
 * Copyright (c) 2025 Treasure Core contributors
 * This code is distributed under the license specified in the LICENSE file. */

#include <tc/common/test.hpp>
#include <tc/program/state.hpp>

using namespace treasure_core;
using namespace treasure_core::program;
using namespace treasure_core::ledger;

namespace {
    template<typename T>
    void check_layout(const T &v, const std::string_view disc_hex, const size_t size)
    {
        const auto bytes = to_bytes(v);
        test_same(std::string { T::type_name }, size, bytes.size());
        test_same(std::string { T::type_name }, uint8_vector::from_hex(disc_hex), uint8_vector { static_cast<buffer>(bytes).subbuf(0, 8) });
        test_same(std::string { T::type_name }, v, from_bytes<T>(bytes));
    }
}

suite program_state_suite = [] {
    "program::state"_test = [] {
        const auto k1 = pubkey::from_hex("1111111111111111111111111111111111111111111111111111111111111111");
        const auto k2 = pubkey::from_hex("2222222222222222222222222222222222222222222222222222222222222222");
        "layouts"_test = [&] {
            check_layout(supply_state { k1, k2, 10, 3, 100, 254 }, "98A27D05DCA97285", 98);
            check_layout(supply_state { k1, k2, 10, 3, {}, 254 }, "98A27D05DCA97285", 98);
            check_layout(vault_state { k1, 500, 2, 255 }, "D308E82B02987577", 57);
            check_layout(deposit_record { k1, 100'000'000, 42, true, 4, 253 }, "53E80A1FFB31BDA7", 59);
            check_layout(whitelist_entry { k1, true, 250 }, "3346AD51DBC0EA3E", 42);
            check_layout(search_record { k1, -5, 7, 9, false, 251 }, "2CE5D30EC7486B06", 58);
            check_layout(collectible_receipt { k1, k2, 252 }, "AF0DC9FD90B81D76", 73);
        };
        "supply layout"_test = [&] {
            const auto bytes = to_bytes(supply_state { k1, k2, 0x0A, 0x03, 0x64, 0xFE });
            test_same(uint8_vector::from_hex(
                "98A27D05DCA97285"
                "1111111111111111111111111111111111111111111111111111111111111111"
                "2222222222222222222222222222222222222222222222222222222222222222"
                "0A00000000000000" "0300000000000000" "01" "6400000000000000" "FE"), bytes);
        };
        "search layout"_test = [&] {
            const auto bytes = to_bytes(search_record { k1, -1, 2, 3, true, 0xFD });
            test_same(uint8_vector::from_hex(
                "2CE5D30EC7486B06"
                "1111111111111111111111111111111111111111111111111111111111111111"
                "FFFFFFFF" "02000000" "0300000000000000" "01" "FD"), bytes);
        };
        "invalid tier"_test = [&] {
            auto bytes = to_bytes(deposit_record { k1, 1, 1, false, 1, 0 });
            bytes[bytes.size() - 2] = 5;
            expect(throws<error>([&] { from_bytes<deposit_record>(bytes); }));
        };
        "net supply"_test = [&] {
            test_same(7, (supply_state { k1, k2, 10, 3, {}, 0 }.net_supply()));
        };
        "describe"_test = [&] {
            const auto desc = program::describe(to_bytes(deposit_record { k1, 100'000'000, 42, true, 4, 253 }));
            expect(static_cast<bool>(desc));
            if (desc) {
                test_same(std::string_view { "DepositRecord" }, static_cast<std::string_view>(desc->at("type").as_string()));
                test_same(42, desc->at("data").as_object().at("nonce").as_uint64());
                test_same(4, desc->at("data").as_object().at("tier").as_uint64());
            }
            const auto sdesc = program::describe(to_bytes(supply_state { k1, k2, 10, 3, {}, 0 }));
            expect(static_cast<bool>(sdesc));
            if (sdesc)
                expect(sdesc->at("data").as_object().at("maxSupply").is_null());
            expect(!program::describe(uint8_vector::from_hex("00112233")));
        };
    };
};

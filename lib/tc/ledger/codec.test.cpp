/* This file is part of Treasure Core project.
 * Copyright (c) 2025 Treasure Core contributors
 * This code is distributed under the license specified in the LICENSE file. */

#include <tc/common/test.hpp>
#include <tc/ledger/token-ledger.hpp>

using namespace treasure_core;
using namespace treasure_core::ledger;

suite ledger_codec_suite = [] {
    "ledger::codec"_test = [] {
        "discriminator"_test = [] {
            test_same(discriminator::from_hex("176040FAEBBF0090"), discriminator_of("Holding"));
            test_same(discriminator::from_hex("4B413569E343B6EF"), discriminator_of("AssetInfo"));
            expect(discriminator_of("Holding") != discriminator_of("holding"));
        };
        "little-endian layout"_test = [] {
            const holding_record rec { address::from_hex("1111111111111111111111111111111111111111111111111111111111111111"), pubkey::from_hex("2222222222222222222222222222222222222222222222222222222222222222"), 0x0102030405060708ULL };
            const auto bytes = to_bytes(rec);
            test_same(holding_record::serialized_size, bytes.size());
            test_same(uint8_vector::from_hex("176040FAEBBF0090111111111111111111111111111111111111111111111111111111111111111122222222222222222222222222222222222222222222222222222222222222220807060504030201"), bytes);
            test_same(rec, from_bytes<holding_record>(bytes));
            expect(has_type<holding_record>(bytes));
            expect(!has_type<asset_record>(bytes));
        };
        "wrong size or type"_test = [] {
            const auto bytes = to_bytes(asset_record { 6, pubkey {}, 1000 });
            test_same(asset_record::serialized_size, bytes.size());
            expect(throws<error>([&] { from_bytes<holding_record>(bytes); }));
            expect(throws<error>([&] { from_bytes<asset_record>(static_cast<buffer>(bytes).subbuf(0, bytes.size() - 1)); }));
            auto corrupted = bytes;
            corrupted[0] ^= 0xFF;
            expect(throws<error>([&] { from_bytes<asset_record>(corrupted); }));
        };
        "optional and signed values"_test = [] {
            record_writer w {};
            w.opt_u64(std::optional<uint64_t> {}).opt_u64(std::optional<uint64_t> { 5 }).i32(-2);
            test_same(uint8_vector::from_hex("000000000000000000010500000000000000FEFFFFFF"), w.data());
            record_reader r { w.data() };
            expect(!r.opt_u64());
            test_same(std::optional<uint64_t> { 5 }, r.opt_u64());
            test_same(-2, r.i32());
            test_same(0, r.remaining());
            expect(throws<error>([&] { r.uint<uint8_t>(); }));
        };
        "booleans"_test = [] {
            const auto data = uint8_vector::from_hex("000102");
            record_reader r { data };
            expect(!r.boolean());
            expect(r.boolean());
            expect(throws<error>([&] { r.boolean(); }));
        };
        "padded strings"_test = [] {
            const metadata_record meta { address {}, "Treasure #1", "DOTTY", "https://example.com/1.json", 0, false, pubkey {} };
            const auto bytes = to_bytes(meta);
            test_same(metadata_record::serialized_size, bytes.size());
            test_same(meta, from_bytes<metadata_record>(bytes));
            record_writer w {};
            expect(throws<error>([&] { w.padded(std::string_view { "too long" }, 4); }));
        };
        "formatting"_test = [] {
            const asset_record rec { 6, pubkey {}, 1000 };
            const auto s = fmt::format("{}", rec);
            expect(s.starts_with("AssetInfo{")) << s;
            expect(s.find("\"supply\":1000") != s.npos) << s;
        };
    };
};

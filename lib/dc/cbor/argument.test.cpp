/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <limits>
#include <dc/common/test.hpp>
#include <dc/cbor/argument.hpp>

using namespace dax_codec;
using namespace dax_codec::cbor;

namespace {
    constexpr uint64_t safe_limit = (1ULL << 53) - 1;

    item_header peek_hex(const std::string_view hex, const uint64_t limit=safe_limit)
    {
        const auto data = uint8_vector::from_hex(hex);
        return peek_argument(cursor { data }, limit);
    }
}

suite cbor_argument_suite = [] {
    "cbor::argument"_test = [] {
        "inline"_test = [] {
            const auto hdr = peek_hex("17");
            test_same(uint64_t { 23 }, hdr.arg.native());
            test_same(size_t { 1 }, hdr.size);
            test_same(major_type::uint, hdr.type());
        };
        "extensions"_test = [] {
            test_same(uint64_t { 0xFF }, peek_hex("18FF").arg.native());
            test_same(size_t { 2 }, peek_hex("18FF").size);
            test_same(uint64_t { 0x0102 }, peek_hex("590102").arg.native());
            test_same(size_t { 3 }, peek_hex("590102").size);
            test_same(uint64_t { 0x01020304 }, peek_hex("9A01020304").arg.native());
            test_same(size_t { 5 }, peek_hex("9A01020304").size);
            test_same(uint64_t { 0x0102030405060708 }, peek_hex("1B0102030405060708", std::numeric_limits<uint64_t>::max()).arg.native());
            test_same(size_t { 9 }, peek_hex("1B0102030405060708").size);
        };
        "native limit"_test = [] {
            const auto below = peek_hex("1B001FFFFFFFFFFFFF");
            expect(!below.arg.big());
            test_same(safe_limit, below.arg.native());
            const auto above = peek_hex("1B0020000000000000");
            expect(above.arg.big());
            test_same(cpp_int { safe_limit + 1 }, above.arg.to_big_int());
            test_same(safe_limit + 1, above.arg.to_uint64());
            expect(throws<error>([&] { above.arg.native(); }));
        };
        "indefinite"_test = [] {
            expect(peek_hex("5F").arg.indefinite());
            expect(peek_hex("7F").arg.indefinite());
            expect(peek_hex("9F").arg.indefinite());
            expect(peek_hex("BF").arg.indefinite());
            expect(throws<invalid_size_error>([] { peek_hex("1F"); }));
            expect(throws<invalid_size_error>([] { peek_hex("3F"); }));
            expect(throws<invalid_size_error>([] { peek_hex("DF"); }));
        };
        "reserved"_test = [] {
            expect(throws<invalid_size_error>([] { peek_hex("1C"); }));
            expect(throws<invalid_size_error>([] { peek_hex("5D"); }));
            expect(throws<invalid_size_error>([] { peek_hex("9E"); }));
        };
        "incomplete"_test = [] {
            for (const auto hex: { "", "18", "19FF", "1AFFFFFF", "1BFFFFFFFFFFFFFF" }) {
                const auto data = uint8_vector::from_hex(hex);
                cursor c { data };
                expect(throws<incomplete_error>([&] { read_argument(c, safe_limit); })) << hex;
                test_same(size_t { 0 }, c.offset());
            }
        };
        "read consumes the header"_test = [] {
            const auto data = uint8_vector::from_hex("1903E801");
            cursor c { data };
            test_same(uint64_t { 1000 }, read_argument(c, safe_limit).native());
            test_same(size_t { 3 }, c.offset());
        };
    };
};

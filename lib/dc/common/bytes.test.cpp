/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <dc/common/bytes.hpp>
#include <dc/common/test.hpp>

using namespace dax_codec;

suite common_bytes_suite = [] {
    "common::bytes"_test = [] {
        "from_hex"_test = [] {
            const auto v = uint8_vector::from_hex("00aBFf");
            test_same(size_t { 3 }, v.size());
            test_same(uint8_t { 0xAB }, v[1]);
            test_same(std::string { "00ABFF" }, fmt::format("{}", v));
            expect(throws<error>([] { uint8_vector::from_hex("0"); }));
            expect(throws<error>([] { uint8_vector::from_hex("0G"); }));
            expect(throws<error>([] { uint8_vector::from_hex("\xC3\xA9"); }));
            expect(throws<error>([] { uint8_vector::from_hex("0\xFF"); }));
        };
        "to_host"_test = [] {
            const auto v = uint8_vector::from_hex("01020304");
            test_same(uint32_t { 0x01020304 }, static_cast<buffer>(v).to_host<uint32_t>());
            expect(throws<error>([&] { static_cast<buffer>(v).to_host<uint16_t>(); }));
        };
        "append"_test = [] {
            uint8_vector v {};
            v << uint8_t { 0x01 } << uint8_vector::from_hex("0203");
            test_same(uint8_vector::from_hex("010203"), v);
        };
        "ordering"_test = [] {
            expect(uint8_vector::from_hex("01") < uint8_vector::from_hex("0100"));
            expect(uint8_vector::from_hex("02") > uint8_vector::from_hex("0100"));
            expect(uint8_vector::from_hex("0A0B") == uint8_vector::from_hex("0A0B"));
        };
    };
};

/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <dc/common/test.hpp>
#include <dc/cbor/cursor.hpp>
#include <dc/cbor/stream-buffer.hpp>

using namespace dax_codec;
using namespace dax_codec::cbor;

suite cbor_cursor_suite = [] {
    "cbor::cursor"_test = [] {
        "peek and consume"_test = [] {
            const auto data = uint8_vector::from_hex("010203");
            cursor c { data };
            test_same(uint8_t { 0x01 }, c.peek());
            c.consume(2);
            test_same(uint8_t { 0x03 }, c.peek());
            test_same(size_t { 1 }, c.available());
        };
        "window"_test = [] {
            const auto data = uint8_vector::from_hex("0102030405");
            cursor c { data, 1, 3 };
            test_same(uint8_t { 0x02 }, c.peek());
            c.consume(2);
            expect(c.empty());
            expect(throws<incomplete_error>([&] { c.peek(); }));
            expect(throws<error>([&] { cursor { data, 4, 3 }; }));
            expect(throws<error>([&] { cursor { data, 0, 6 }; }));
        };
        "ensure_available does not move the cursor"_test = [] {
            const auto data = uint8_vector::from_hex("0102");
            cursor c { data };
            c.consume(1);
            try {
                c.ensure_available(3);
                expect(false);
            } catch (const incomplete_error &ex) {
                test_same(size_t { 4 }, ex.required());
            }
            test_same(size_t { 1 }, c.offset());
        };
        "drain"_test = [] {
            const auto data = uint8_vector::from_hex("0161626364");
            cursor c { data, 0, 4 };
            c.consume(1);
            test_same(std::string { "abc" }, c.drain_text());
            expect(c.empty());
            cursor c2 { data, 3 };
            test_same(uint8_vector::from_hex("6364"), c2.drain());
            test_same(size_t { 5 }, c2.offset());
        };
        "checkpoint"_test = [] {
            const auto data = uint8_vector::from_hex("010203");
            cursor c { data };
            const auto cp = c.save();
            c.consume(3);
            c.restore(cp);
            test_same(size_t { 0 }, c.offset());
            cursor small { data, 0, 1 };
            expect(throws<error>([&] { small.restore(cursor::checkpoint { 2 }); }));
        };
    };
    "cbor::stream_buffer"_test = [] {
        stream_buffer sb {};
        sb.write(uint8_vector::from_hex("0102"));
        sb.write(uint8_vector {});
        sb.write(uint8_vector::from_hex("03"));
        test_same(size_t { 3 }, sb.size());
        test_same(uint8_vector::from_hex("010203"), sb.read());
        test_same(size_t { 0 }, sb.size());
        sb.write(std::string_view { "text" });
        test_same(std::string { "text" }, sb.read_as_string());
        test_same(std::string {}, sb.read_as_string());
    };
};

/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <cmath>
#include <limits>
#include <dc/common/test.hpp>
#include <dc/cbor/value.hpp>

using namespace dax_codec;
using namespace dax_codec::cbor;

suite cbor_value_suite = [] {
    "cbor::value"_test = [] {
        "types"_test = [] {
            test_same(value_type::null, value {}.type());
            test_same(value_type::boolean, value { true }.type());
            test_same(value_type::integer, value { 1 }.type());
            test_same(value_type::big_int, value { cpp_int { 1 } }.type());
            test_same(value_type::floating, value { 1.0 }.type());
            test_same(value_type::decimal, value { decimal { 1, 0 } }.type());
            test_same(value_type::bytes, value { uint8_vector {} }.type());
            test_same(value_type::text, value { "" }.type());
            test_same(value_type::array, value { value_array {} }.type());
            test_same(value_type::map, value { value_map {} }.type());
            test_same(value_type::tagged, value { tagged_value { 1, value {} } }.type());
        };
        "accessors"_test = [] {
            expect(throws<error>([] { value { 1 }.as_text(); }));
            expect(throws<error>([] { value {}.as_bool(); }));
            test_same(cpp_int { 7 }, value { 7 }.as_big_int());
            test_same(std::string { "x" }, value { "x" }.as_text());
        };
        "integers compare numerically"_test = [] {
            expect(value { 1 } == value { cpp_int { 1 } });
            expect(value { -5 } < value { cpp_int { "18446744073709551616" } });
            expect(value { cpp_int { "-18446744073709551616" } } < value { -5 });
            expect(value { 2 } > value { 1 });
        };
        "ordering across types"_test = [] {
            expect(value {} < value { false });
            expect(value { true } < value { -100 });
            expect(value { 100 } < value { -1.0 });
            expect(value { 1e300 } < value { decimal { -1, 0 } });
            expect(value { decimal { 1, 0 } } < value { uint8_vector {} });
            expect(value { uint8_vector::from_hex("FF") } < value { "" });
            expect(value { "z" } < value { value_array {} });
            expect(value { value_array { 1 } } < value { value_map {} });
            expect(value { value_map {} } < value { tagged_value { 0, value {} } });
        };
        "floats"_test = [] {
            const value nan { std::numeric_limits<double>::quiet_NaN() };
            expect(nan == nan);
            expect(value { std::numeric_limits<double>::infinity() } < nan);
            expect(value { 0.0 } == value { -0.0 });
            expect(value { -1.5 } < value { 1.5 });
        };
        "containers"_test = [] {
            expect(value { value_array { 1, 2 } } < value { value_array { 1, 3 } });
            expect(value { value_array { 1 } } < value { value_array { 1, 0 } });
            value_map a {};
            a.emplace(value { "k" }, value { 1 });
            value_map b {};
            b.emplace(value { "k" }, value { 2 });
            expect(value { a } < value { b });
            expect(value { a } == value { value_map { a } });
        };
        "deep copy of tagged values"_test = [] {
            value orig { tagged_value { 42, value { value_array { 1, 2 } } } };
            value copy { orig };
            expect(copy == orig);
            expect(orig.as_tagged().item.get() != copy.as_tagged().item.get());
            std::get<tagged_value>(orig).item = std::make_unique<value>(3);
            expect(copy != orig);
            test_same(value { value_array { 1, 2 } }, *copy.as_tagged().item);
            value assigned {};
            assigned = copy;
            expect(assigned == copy);
        };
        "to_string"_test = [] {
            test_same(std::string { "null" }, value {}.to_string());
            test_same(std::string { "true" }, value { true }.to_string());
            test_same(std::string { "-12" }, value { -12 }.to_string());
            test_same(std::string { "18446744073709551616" }, value { cpp_int { "18446744073709551616" } }.to_string());
            test_same(std::string { "1.5" }, value { 1.5 }.to_string());
            test_same(std::string { "123.45" }, value { decimal { 12345, -2 } }.to_string());
            test_same(std::string { "h'01AB'" }, value { uint8_vector::from_hex("01ab") }.to_string());
            test_same(std::string { "\"abc\"" }, value { "abc" }.to_string());
            test_same(std::string { "[1, [2, 3]]" }, value { value_array { 1, value_array { 2, 3 } } }.to_string());
            value_map m {};
            m.emplace(value { 2 }, value { "b" });
            m.emplace(value { 1 }, value { "a" });
            test_same(std::string { "{1: \"a\", 2: \"b\"}" }, value { m }.to_string());
            test_same(std::string { "42(null)" }, value { tagged_value { 42, value {} } }.to_string());
            test_same(std::string { "[1, 2]" }, fmt::format("{}", value { value_array { 1, 2 } }));
        };
    };
};

/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <limits>
#include <dc/common/test.hpp>
#include <dc/decimal.hpp>

using namespace dax_codec;

suite decimal_suite = [] {
    "decimal"_test = [] {
        "to_string"_test = [] {
            test_same(std::string { "123.45" }, decimal { 12345, -2 }.to_string());
            test_same(std::string { "-0.0012" }, decimal { -12, -4 }.to_string());
            test_same(std::string { "0.5" }, decimal { 5, -1 }.to_string());
            test_same(std::string { "1200" }, decimal { 12, 2 }.to_string());
            test_same(std::string { "7" }, decimal { 7, 0 }.to_string());
            test_same(std::string { "3e-100" }, decimal { 3, -100 }.to_string());
            test_same(std::string { "123.45" }, fmt::format("{}", decimal { 12345, -2 }));
        };
        "ordering"_test = [] {
            expect(decimal { 1, 0 } == decimal { 100, -2 });
            expect(decimal { 12345, -2 } < decimal { 12346, -2 });
            expect(decimal { 999, -3 } < decimal { 1, 0 });
            expect(decimal { -1, 5 } < decimal { 1, -5 });
            expect(decimal { -2, 0 } < decimal { -1, 0 });
            expect(decimal { -1, 3 } < decimal { -999, 0 });
            expect(decimal { 0, 10 } == decimal { 0, -10 });
            expect(decimal { 1, std::numeric_limits<int64_t>::max() } > decimal { 1, std::numeric_limits<int64_t>::min() + 1 });
        };
        "to_double"_test = [] {
            test_close(123.45, decimal { 12345, -2 }.to_double());
            test_close(-1200.0, decimal { -12, 2 }.to_double());
        };
    };
};

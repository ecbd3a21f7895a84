/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <dc/common/test.hpp>
#include <dc/cbor/float16.hpp>

using namespace dax_codec;
using namespace dax_codec::cbor;

suite cbor_float16_suite = [] {
    "cbor::half_to_double"_test = [] {
        "zero"_test = [] {
            test_same(0.0, half_to_double(0x0000));
            expect(std::signbit(half_to_double(0x8000)));
        };
        "subnormal"_test = [] {
            test_same(5.960464477539063e-08, half_to_double(0x0001));
            test_same(6.097555160522461e-05, half_to_double(0x03FF));
        };
        "normal"_test = [] {
            test_same(6.103515625e-05, half_to_double(0x0400));
            test_same(1.0, half_to_double(0x3C00));
            test_same(1.5, half_to_double(0x3E00));
            test_same(-4.0, half_to_double(0xC400));
            test_same(65504.0, half_to_double(0x7BFF));
            test_same(0.333251953125, half_to_double(0x3555));
        };
        "infinity"_test = [] {
            test_same(std::numeric_limits<double>::infinity(), half_to_double(0x7C00));
            test_same(-std::numeric_limits<double>::infinity(), half_to_double(0xFC00));
        };
        "nan"_test = [] {
            expect(std::isnan(half_to_double(0x7E00)));
            expect(std::isnan(half_to_double(0x7C01)));
            expect(std::isnan(half_to_double(0xFE00)));
        };
    };
};

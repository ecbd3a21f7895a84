/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <cerrno>
#include <dc/common/error.hpp>
#include <dc/common/test.hpp>

using namespace dax_codec;

suite common_error_suite = [] {
    "common::error"_test = [] {
        "message"_test = [] {
            const error err { "decoding failed" };
            test_same(std::string_view { "decoding failed" }, std::string_view { err.what() });
        };
        "cause"_test = [] {
            const error err { "config is broken", std::runtime_error { "bad key" } };
            const std::string_view msg { err.what() };
            expect(msg.starts_with("config is broken caused by "));
            expect(msg.ends_with(": bad key"));
        };
        "stacktrace"_test = [] {
            const error err { "with a trace" };
            expect(nothrow([&] { err.stacktrace(); }));
        };
        "error_sys"_test = [] {
            errno = ENOENT;
            const error_sys err { "open failed" };
            expect(std::string_view { err.what() }.starts_with("open failed errno: "));
        };
    };
};

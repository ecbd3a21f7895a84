/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <filesystem>
#include <dc/common/test.hpp>
#include <dc/config.hpp>
#include <dc/file.hpp>

using namespace dax_codec;

suite config_suite = [] {
    "config"_test = [] {
        "config_json"_test = [] {
            const config_json cfg { json::object { { "maxDepth", 8 } } };
            test_same(uint64_t { 8 }, json::value_to_uint(cfg.at("maxDepth"), "maxDepth"));
            expect(cfg.find("missing") == nullptr);
            expect(throws<error>([&] { cfg.at("missing"); }));
            test_same(std::string_view { R"({"maxDepth":8})" }, cfg.bytes().str());
        };
        "config_file"_test = [] {
            const auto path = (std::filesystem::temp_directory_path() / "dc-config-test.json").string();
            file::write(path, std::string_view { R"({ "maxCollectionSize": 1024, "nativeIntLimit": 4294967295 })" });
            const config_file cfg { path };
            test_same(uint64_t { 1024 }, json::value_to_uint(cfg.at("maxCollectionSize"), "maxCollectionSize"));
            test_same(uint64_t { 4294967295 }, json::value_to_uint(cfg.at("nativeIntLimit"), "nativeIntLimit"));
            test_same(file::read(path), uint8_vector { cfg.bytes() });
            std::filesystem::remove(path);
        };
        "invalid files"_test = [] {
            const auto path = (std::filesystem::temp_directory_path() / "dc-config-invalid.json").string();
            file::write(path, std::string_view { "[1, 2" });
            expect(throws<error>([&] { config_file { path }; }));
            file::write(path, std::string_view { "[1, 2]" });
            expect(throws<error>([&] { config_file { path }; }));
            std::filesystem::remove(path);
            expect(throws<error>([&] { config_file { path }; }));
        };
        "value_to_uint"_test = [] {
            expect(throws<error>([] { json::value_to_uint(json::value { -1 }, "x"); }));
            expect(throws<error>([] { json::value_to_uint(json::value { 1.5 }, "x"); }));
            test_same(uint64_t { 7 }, json::value_to_uint(json::value { 7 }, "x"));
        };
    };
};

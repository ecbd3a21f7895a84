/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef DAX_CODEC_CONFIG_HPP
#define DAX_CODEC_CONFIG_HPP

#include <optional>
#include <string>
#include <dc/common/bytes.hpp>
#include <dc/json.hpp>

namespace dax_codec {
    // DC_CONFIG, when set, names the configuration file used by default
    extern std::optional<std::string> default_config_path();

    struct config {
        virtual ~config() =default;

        [[nodiscard]] const json::value &at(const std::string_view &name) const
        {
            if (const auto *v = find(name); v)
                return *v;
            throw error(fmt::format("config does not have the requested {} element!", name));
        }

        [[nodiscard]] const json::value *find(const std::string_view &name) const
        {
            const auto &obj = json();
            if (const auto it = obj.find(json::string_view { name.data(), name.size() }); it != obj.end())
                return &it->value();
            return nullptr;
        }

        [[nodiscard]] const json::object &json() const
        {
            return _json_impl();
        }

        [[nodiscard]] buffer bytes() const
        {
            return _bytes_impl();
        }
    private:
        virtual const json::object &_json_impl() const =0;
        virtual buffer _bytes_impl() const =0;
    };

    // Used as a config mock
    struct config_json: config {
        explicit config_json(json::object &&obj)
            : _json { std::move(obj) }, _bytes { json::serialize(_json) }
        {
        }
    private:
        const json::object _json;
        const std::string _bytes;

        const json::object &_json_impl() const override
        {
            return _json;
        }

        buffer _bytes_impl() const override
        {
            return _bytes;
        }
    };

    struct config_file: config {
        explicit config_file(const std::string &path);
    private:
        uint8_vector _raw;
        json::object _parsed;

        const json::object &_json_impl() const override
        {
            return _parsed;
        }

        buffer _bytes_impl() const override
        {
            return _raw;
        }
    };
}

#endif // !DAX_CODEC_CONFIG_HPP

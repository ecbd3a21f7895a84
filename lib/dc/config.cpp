/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <cstdlib>
#include <dc/config.hpp>
#include <dc/file.hpp>
#include <dc/logger.hpp>

namespace dax_codec {
    std::optional<std::string> default_config_path()
    {
        if (const char *env_path = std::getenv("DC_CONFIG"); env_path && *env_path)
            return std::string { env_path };
        return {};
    }

    static json::object parse_object(const uint8_vector &raw, const std::string &path)
    {
        try {
            auto parsed = json::parse(raw);
            if (!parsed.is_object())
                throw error(fmt::format("configuration file {} must contain a JSON object!", path));
            return std::move(parsed.as_object());
        } catch (const boost::system::system_error &ex) {
            throw error(fmt::format("configuration file {} is not a valid JSON", path), ex);
        }
    }

    config_file::config_file(const std::string &path)
        : _raw { file::read(path) }, _parsed { parse_object(_raw, path) }
    {
        logger::debug("loaded configuration from {}: {} bytes", path, _raw.size());
    }
}

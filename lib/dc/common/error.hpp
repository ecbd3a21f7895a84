/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef DAX_CODEC_COMMON_ERROR_HPP
#define DAX_CODEC_COMMON_ERROR_HPP

#include <array>
#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>

namespace dax_codec {
    struct base_error: std::exception {
        static constexpr size_t stacktrace_depth = 0x20;

        explicit base_error(std::string_view msg);
        const char *what() const noexcept override;
        // renders the frames captured at construction; expensive, so only on demand
        std::string stacktrace() const;
    private:
        std::string _msg;
        std::array<std::byte, sizeof(void*) * stacktrace_depth> _trace {};
    };

    struct error: base_error {
        explicit error(std::string_view msg);
        explicit error(std::string_view msg, const std::exception &ex);
    };

    struct error_sys: error {
        explicit error_sys(std::string_view msg);
    };
}

#endif // !DAX_CODEC_COMMON_ERROR_HPP

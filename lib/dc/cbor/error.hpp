/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef DAX_CODEC_CBOR_ERROR_HPP
#define DAX_CODEC_CBOR_ERROR_HPP

#include <stdexcept>
#include <dc/common/error.hpp>
#include <dc/common/format.hpp>

namespace dax_codec::cbor {
    // not derived from dax_codec::error so that the frequent "need more data" case does not capture a stack trace
    struct incomplete_error: std::runtime_error {
        explicit incomplete_error(const size_t required):
            std::runtime_error { fmt::format("need data up to byte {}", required) }, _required { required }
        {
        }

        // the absolute offset the window must reach for the failed read to succeed
        size_t required() const noexcept
        {
            return _required;
        }
    private:
        size_t _required;
    };

    struct type_mismatch_error: error {
        using error::error;
    };

    struct not_a_number_error: error {
        using error::error;
    };

    struct malformed_decimal_error: error {
        using error::error;
    };

    struct invalid_tag_error: error {
        using error::error;
    };

    struct duplicate_key_error: error {
        using error::error;
    };

    struct unexpected_break_error: error {
        using error::error;
    };

    struct invalid_size_error: error {
        using error::error;
    };

    struct collection_too_big_error: error {
        using error::error;
    };

    struct nesting_too_deep_error: error {
        using error::error;
    };
}

#endif // !DAX_CODEC_CBOR_ERROR_HPP

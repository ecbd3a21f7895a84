/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef DAX_CODEC_DECIMAL_HPP
#define DAX_CODEC_DECIMAL_HPP

#include <compare>
#include <string>
#include <dc/big_int.hpp>

namespace dax_codec {
    // unscaled * 10^exponent
    struct decimal {
        cpp_int unscaled {};
        int64_t exponent = 0;

        // ordering is numeric, so 1.0 and 1.00 compare equal
        std::weak_ordering operator<=>(const decimal &o) const;

        bool operator==(const decimal &o) const
        {
            return (*this <=> o) == 0;
        }

        int sign() const
        {
            return unscaled.sign();
        }

        double to_double() const;
        std::string to_string() const;
    };
}

namespace fmt {
    template<>
    struct formatter<dax_codec::decimal>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            return fmt::format_to(ctx.out(), "{}", v.to_string());
        }
    };
}

#endif // !DAX_CODEC_DECIMAL_HPP

/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef DAX_CODEC_CBOR_FLOAT16_HPP
#define DAX_CODEC_CBOR_FLOAT16_HPP

#include <cmath>
#include <cstdint>
#include <limits>

namespace dax_codec::cbor {
    // IEEE-754 binary16 to double
    inline double half_to_double(const uint16_t half) noexcept
    {
        const double sign = half & 0x8000 ? -1.0 : 1.0;
        const int exp = (half >> 10) & 0x1F;
        const int mant = half & 0x3FF;
        if (exp == 0)
            return sign * std::ldexp(static_cast<double>(mant), -24);
        if (exp == 0x1F)
            return mant ? std::numeric_limits<double>::quiet_NaN() : sign * std::numeric_limits<double>::infinity();
        return sign * std::ldexp(static_cast<double>(1024 + mant), exp - 25);
    }
}

#endif // !DAX_CODEC_CBOR_FLOAT16_HPP

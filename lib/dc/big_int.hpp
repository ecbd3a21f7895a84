/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef DAX_CODEC_BIG_INT_HPP
#define DAX_CODEC_BIG_INT_HPP

#include <sstream>
#define BOOST_DETAIL_EMPTY_VALUE_BASE
#include <boost/multiprecision/cpp_int.hpp>
#include <dc/common/bytes.hpp>
#include <dc/common/format.hpp>

namespace dax_codec {
    using boost::multiprecision::cpp_int;

    static constexpr size_t big_int_max_size = 8192;

    inline cpp_int big_uint_from_bytes(const buffer data, const size_t max_size=big_int_max_size)
    {
        if (data.size() > max_size)
            throw error(fmt::format("big ints larger than {} bytes are not supported but got: {}!", max_size, data.size()));
        cpp_int val = 0;
        for (const uint8_t &b: data) {
            val *= 256;
            val += b;
        }
        return val;
    }

    inline cpp_int big_nint_from_bytes(const buffer data, const size_t max_size=big_int_max_size)
    {
        auto val = big_uint_from_bytes(data, max_size);
        ++val;
        val *= -1;
        return val;
    }

    // -(m + 1) where m is the magnitude transmitted with a negative integer
    inline cpp_int big_nint_from_magnitude(const cpp_int &m)
    {
        cpp_int val = m;
        ++val;
        val *= -1;
        return val;
    }
}

namespace fmt {
    template<typename T>
    struct formatter<boost::multiprecision::number<T>>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            std::ostringstream ss {};
            ss << v;
            return fmt::format_to(ctx.out(), "{}", ss.str());
        }
    };
}

#endif // !DAX_CODEC_BIG_INT_HPP

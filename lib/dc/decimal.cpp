/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <cmath>
#include <dc/decimal.hpp>

namespace dax_codec {
    // exponents farther than this from zero are rendered in the scientific form
    static constexpr int64_t max_plain_exponent = 64;

    static int64_t num_digits(const cpp_int &v)
    {
        return static_cast<int64_t>(cpp_int { abs(v) }.str().size());
    }

    static cpp_int pow10(const int64_t e)
    {
        return boost::multiprecision::pow(cpp_int { 10 }, static_cast<unsigned>(e));
    }

    std::weak_ordering decimal::operator<=>(const decimal &o) const
    {
        const auto s = sign();
        if (const auto os = o.sign(); s != os)
            return s < os ? std::weak_ordering::less : std::weak_ordering::greater;
        if (s == 0)
            return std::weak_ordering::equivalent;
        // the position of the leading digit decides unless both are of the same order of magnitude
        const cpp_int mag = cpp_int { num_digits(unscaled) } + exponent;
        const cpp_int o_mag = cpp_int { num_digits(o.unscaled) } + o.exponent;
        if (mag != o_mag) {
            const auto abs_less = mag < o_mag;
            if (s > 0)
                return abs_less ? std::weak_ordering::less : std::weak_ordering::greater;
            return abs_less ? std::weak_ordering::greater : std::weak_ordering::less;
        }
        // same magnitude: the exponent difference is bounded by the digit counts
        cpp_int l = unscaled, r = o.unscaled;
        if (exponent > o.exponent)
            l *= pow10(exponent - o.exponent);
        else if (o.exponent > exponent)
            r *= pow10(o.exponent - exponent);
        if (l < r)
            return std::weak_ordering::less;
        if (l > r)
            return std::weak_ordering::greater;
        return std::weak_ordering::equivalent;
    }

    double decimal::to_double() const
    {
        return unscaled.convert_to<double>() * std::pow(10.0, static_cast<double>(exponent));
    }

    std::string decimal::to_string() const
    {
        if (exponent == 0)
            return unscaled.str();
        if (exponent < -max_plain_exponent || exponent > max_plain_exponent)
            return fmt::format("{}e{}", unscaled, exponent);
        if (exponent > 0)
            return unscaled.str() + std::string(static_cast<size_t>(exponent), '0');
        auto digits = cpp_int { abs(unscaled) }.str();
        const auto scale = static_cast<size_t>(-exponent);
        if (digits.size() <= scale)
            digits.insert(0, scale - digits.size() + 1, '0');
        digits.insert(digits.size() - scale, 1, '.');
        if (unscaled.sign() < 0)
            digits.insert(0, 1, '-');
        return digits;
    }
}

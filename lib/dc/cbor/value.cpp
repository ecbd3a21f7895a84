/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <algorithm>
#include <cmath>
#include <dc/cbor/value.hpp>

namespace dax_codec::cbor {
    tagged_value::tagged_value(const uint64_t t, value &&v):
        tag { t }, item { std::make_unique<value>(std::move(v)) }
    {
    }

    tagged_value::tagged_value(const tagged_value &o):
        tag { o.tag }, item { o.item ? std::make_unique<value>(*o.item) : nullptr }
    {
    }

    tagged_value::tagged_value(tagged_value &&o) noexcept =default;

    tagged_value &tagged_value::operator=(const tagged_value &o)
    {
        if (this != &o) {
            tag = o.tag;
            item = o.item ? std::make_unique<value>(*o.item) : nullptr;
        }
        return *this;
    }

    tagged_value &tagged_value::operator=(tagged_value &&o) noexcept =default;

    tagged_value::~tagged_value() =default;

    cpp_int value::as_big_int(const std::source_location &loc) const
    {
        if (const auto *v = std::get_if<int64_t>(this); v)
            return cpp_int { *v };
        return _get<cpp_int>(loc);
    }

    static int type_rank(const value_type typ)
    {
        switch (typ) {
            case value_type::null: return 0;
            case value_type::boolean: return 1;
            case value_type::integer:
            case value_type::big_int: return 2;
            case value_type::floating: return 3;
            case value_type::decimal: return 4;
            case value_type::bytes: return 5;
            case value_type::text: return 6;
            case value_type::array: return 7;
            case value_type::map: return 8;
            case value_type::tagged: return 9;
            default: throw error(fmt::format("unsupported value type: {}", typ));
        }
    }

    static std::weak_ordering compare_floats(const double x, const double y)
    {
        const auto x_nan = std::isnan(x);
        const auto y_nan = std::isnan(y);
        if (x_nan || y_nan) {
            if (x_nan && y_nan)
                return std::weak_ordering::equivalent;
            return x_nan ? std::weak_ordering::greater : std::weak_ordering::less;
        }
        if (x < y)
            return std::weak_ordering::less;
        if (x > y)
            return std::weak_ordering::greater;
        return std::weak_ordering::equivalent;
    }

    static std::weak_ordering compare_big(const cpp_int &x, const cpp_int &y)
    {
        const auto cmp = x.compare(y);
        if (cmp < 0)
            return std::weak_ordering::less;
        if (cmp > 0)
            return std::weak_ordering::greater;
        return std::weak_ordering::equivalent;
    }

    static std::weak_ordering compare_maps(const value_map &x, const value_map &y)
    {
        auto x_it = x.begin();
        auto y_it = y.begin();
        for (; x_it != x.end() && y_it != y.end(); ++x_it, ++y_it) {
            if (const auto cmp = x_it->first <=> y_it->first; cmp != 0)
                return cmp;
            if (const auto cmp = x_it->second <=> y_it->second; cmp != 0)
                return cmp;
        }
        return x.size() <=> y.size();
    }

    std::weak_ordering value::operator<=>(const value &o) const
    {
        const auto typ = type();
        const auto o_typ = o.type();
        if (const auto r = type_rank(typ), o_r = type_rank(o_typ); r != o_r)
            return r <=> o_r;
        switch (typ) {
            case value_type::null:
                return std::weak_ordering::equivalent;
            case value_type::boolean:
                return std::get<bool>(*this) <=> std::get<bool>(o);
            case value_type::integer:
            case value_type::big_int:
                if (typ == value_type::integer && o_typ == value_type::integer)
                    return std::get<int64_t>(*this) <=> std::get<int64_t>(o);
                return compare_big(as_big_int(), o.as_big_int());
            case value_type::floating:
                return compare_floats(std::get<double>(*this), std::get<double>(o));
            case value_type::decimal:
                return std::get<decimal>(*this) <=> std::get<decimal>(o);
            case value_type::bytes:
                return std::get<uint8_vector>(*this) <=> std::get<uint8_vector>(o);
            case value_type::text:
                return std::get<std::string>(*this) <=> std::get<std::string>(o);
            case value_type::array: {
                const auto &x = std::get<value_array>(*this);
                const auto &y = std::get<value_array>(o);
                return std::lexicographical_compare_three_way(x.begin(), x.end(), y.begin(), y.end());
            }
            case value_type::map:
                return compare_maps(std::get<value_map>(*this), std::get<value_map>(o));
            case value_type::tagged: {
                const auto &x = std::get<tagged_value>(*this);
                const auto &y = std::get<tagged_value>(o);
                if (x.tag != y.tag)
                    return x.tag <=> y.tag;
                return *x.item <=> *y.item;
            }
            default:
                throw error(fmt::format("unsupported value type: {}", typ));
        }
    }

    std::string value::to_string() const
    {
        switch (type()) {
            case value_type::null: return "null";
            case value_type::boolean: return std::get<bool>(*this) ? "true" : "false";
            case value_type::integer: return fmt::format("{}", std::get<int64_t>(*this));
            case value_type::big_int: return std::get<cpp_int>(*this).str();
            case value_type::floating: return fmt::format("{}", std::get<double>(*this));
            case value_type::decimal: return std::get<decimal>(*this).to_string();
            case value_type::bytes: return fmt::format("h'{}'", std::get<uint8_vector>(*this));
            case value_type::text: return fmt::format("\"{}\"", std::get<std::string>(*this));
            case value_type::array: {
                std::string res { "[" };
                const auto &arr = std::get<value_array>(*this);
                for (auto it = arr.begin(); it != arr.end(); ++it) {
                    if (it != arr.begin())
                        res += ", ";
                    res += it->to_string();
                }
                res += "]";
                return res;
            }
            case value_type::map: {
                std::string res { "{" };
                const auto &m = std::get<value_map>(*this);
                for (auto it = m.begin(); it != m.end(); ++it) {
                    if (it != m.begin())
                        res += ", ";
                    res += fmt::format("{}: {}", it->first.to_string(), it->second.to_string());
                }
                res += "}";
                return res;
            }
            case value_type::tagged: {
                const auto &t = std::get<tagged_value>(*this);
                return fmt::format("{}({})", t.tag, t.item ? t.item->to_string() : "null");
            }
            default:
                throw error(fmt::format("unsupported value type: {}", type()));
        }
    }
}

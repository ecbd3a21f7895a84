/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef DAX_CODEC_CBOR_VALUE_HPP
#define DAX_CODEC_CBOR_VALUE_HPP

#include <compare>
#include <memory>
#include <source_location>
#include <string>
#include <variant>
#include <dc/big_int.hpp>
#include <dc/common/bytes.hpp>
#include <dc/container.hpp>
#include <dc/decimal.hpp>

namespace dax_codec::cbor {
    struct value;

    enum class value_type: uint8_t {
        null, boolean, integer, big_int, floating, decimal, bytes, text, array, map, tagged
    };

    struct value_array: vector<value> {
        using base_type = vector<value>;
        using base_type::base_type;
    };

    struct value_map: flat_map<value, value> {
        using base_type = flat_map<value, value>;
        using base_type::base_type;
    };

    // An application-defined tag whose item has been decoded but not interpreted
    struct tagged_value {
        uint64_t tag = 0;
        std::unique_ptr<value> item {};

        tagged_value(uint64_t t, value &&v);
        tagged_value(const tagged_value &o);
        tagged_value(tagged_value &&o) noexcept;
        tagged_value &operator=(const tagged_value &o);
        tagged_value &operator=(tagged_value &&o) noexcept;
        ~tagged_value();
    };

    using value_base = std::variant<std::monostate, bool, int64_t, cpp_int, double, decimal,
        uint8_vector, std::string, value_array, value_map, tagged_value>;

    struct value: value_base {
        using value_base::value_base;

        value() =default;
        value(const value &) =default;
        value(value &&) =default;
        value &operator=(const value &) =default;
        value &operator=(value &&) =default;

        value(const char *s): value_base { std::string { s } }
        {
        }

        value(const int v): value_base { int64_t { v } }
        {
        }

        value_type type() const noexcept
        {
            return static_cast<value_type>(index());
        }

        bool is_null() const noexcept
        {
            return std::holds_alternative<std::monostate>(*this);
        }

        bool as_bool(const std::source_location &loc=std::source_location::current()) const
        {
            return _get<bool>(loc);
        }

        int64_t as_int(const std::source_location &loc=std::source_location::current()) const
        {
            return _get<int64_t>(loc);
        }

        // accepts both native and arbitrary-precision integers
        cpp_int as_big_int(const std::source_location &loc=std::source_location::current()) const;

        double as_float(const std::source_location &loc=std::source_location::current()) const
        {
            return _get<double>(loc);
        }

        const decimal &as_decimal(const std::source_location &loc=std::source_location::current()) const
        {
            return _get<decimal>(loc);
        }

        const uint8_vector &as_bytes(const std::source_location &loc=std::source_location::current()) const
        {
            return _get<uint8_vector>(loc);
        }

        const std::string &as_text(const std::source_location &loc=std::source_location::current()) const
        {
            return _get<std::string>(loc);
        }

        const value_array &as_array(const std::source_location &loc=std::source_location::current()) const
        {
            return _get<value_array>(loc);
        }

        const value_map &as_map(const std::source_location &loc=std::source_location::current()) const
        {
            return _get<value_map>(loc);
        }

        const tagged_value &as_tagged(const std::source_location &loc=std::source_location::current()) const
        {
            return _get<tagged_value>(loc);
        }

        // a total order: null < bool < integers < floats < decimals < bytes < text < arrays < maps < tagged;
        // native and big integers compare numerically, NaN sorts after every other float
        std::weak_ordering operator<=>(const value &o) const;

        bool operator==(const value &o) const
        {
            return (*this <=> o) == 0;
        }

        std::string to_string() const;
    private:
        template<typename T>
        const T &_get(const std::source_location &loc) const
        {
            if (const auto *v = std::get_if<T>(this); v) [[likely]]
                return *v;
            throw error(fmt::format("unexpected value type: {} at {}", type(), loc));
        }
    };
}

namespace fmt {
    template<>
    struct formatter<dax_codec::cbor::value_type>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            using dax_codec::cbor::value_type;
            switch (v) {
                case value_type::null: return fmt::format_to(ctx.out(), "null");
                case value_type::boolean: return fmt::format_to(ctx.out(), "bool");
                case value_type::integer: return fmt::format_to(ctx.out(), "int");
                case value_type::big_int: return fmt::format_to(ctx.out(), "big_int");
                case value_type::floating: return fmt::format_to(ctx.out(), "float");
                case value_type::decimal: return fmt::format_to(ctx.out(), "decimal");
                case value_type::bytes: return fmt::format_to(ctx.out(), "bytes");
                case value_type::text: return fmt::format_to(ctx.out(), "text");
                case value_type::array: return fmt::format_to(ctx.out(), "array");
                case value_type::map: return fmt::format_to(ctx.out(), "map");
                case value_type::tagged: return fmt::format_to(ctx.out(), "tagged");
                default: return fmt::format_to(ctx.out(), "value_type: {}", static_cast<int>(v));
            }
        }
    };

    template<>
    struct formatter<dax_codec::cbor::value_array>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            auto out_it = fmt::format_to(ctx.out(), "[");
            for (auto it = v.begin(); it != v.end(); ++it)
                out_it = fmt::format_to(out_it, "{}{}", it == v.begin() ? "" : ", ", it->to_string());
            return fmt::format_to(out_it, "]");
        }
    };

    template<>
    struct formatter<dax_codec::cbor::value_map>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            auto out_it = fmt::format_to(ctx.out(), "{{");
            for (auto it = v.begin(); it != v.end(); ++it)
                out_it = fmt::format_to(out_it, "{}{}: {}", it == v.begin() ? "" : ", ", it->first.to_string(), it->second.to_string());
            return fmt::format_to(out_it, "}}");
        }
    };

    template<>
    struct formatter<dax_codec::cbor::value>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            return fmt::format_to(ctx.out(), "{}", v.to_string());
        }
    };
}

#endif // !DAX_CODEC_CBOR_VALUE_HPP

/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef DAX_CODEC_CBOR_TYPES_HPP
#define DAX_CODEC_CBOR_TYPES_HPP

#include <cstdint>
#include <dc/common/format.hpp>

namespace dax_codec::cbor {
    enum class major_type: uint8_t {
        uint = 0,
        nint = 1,
        bytes = 2,
        text = 3,
        array = 4,
        map = 5,
        tag = 6,
        simple = 7
    };

    // additional-info values; within the simple major type 25-27 select half, single and double floats
    enum class special_val: uint8_t {
        s_false = 20,
        s_true = 21,
        s_null = 22,
        s_undefined = 23,
        one_byte = 24,
        two_bytes = 25,
        four_bytes = 26,
        eight_bytes = 27,
        s_break = 31
    };

    static constexpr uint8_t indefinite_info = 31;

    namespace type_byte {
        static constexpr uint8_t s_false = 0xF4;
        static constexpr uint8_t s_true = 0xF5;
        static constexpr uint8_t s_null = 0xF6;
        static constexpr uint8_t s_undefined = 0xF7;
        static constexpr uint8_t float16 = 0xF9;
        static constexpr uint8_t float32 = 0xFA;
        static constexpr uint8_t float64 = 0xFB;
        static constexpr uint8_t s_break = 0xFF;
    }

    enum class well_known_tag: uint64_t {
        positive_bignum = 2,
        negative_bignum = 3,
        decimal_fraction = 4
    };

    struct type_info {
        major_type type;
        uint8_t info;

        bool indefinite() const noexcept
        {
            return info == indefinite_info;
        }
    };

    constexpr type_info decompose(const uint8_t typ) noexcept
    {
        return { static_cast<major_type>(typ >> 5), static_cast<uint8_t>(typ & 0x1F) };
    }

    constexpr uint8_t compose(const major_type mt, const uint8_t info) noexcept
    {
        return static_cast<uint8_t>(static_cast<uint8_t>(mt) << 5 | (info & 0x1F));
    }

    constexpr bool is_major_type(const uint8_t typ, const major_type mt) noexcept
    {
        return decompose(typ).type == mt;
    }
}

namespace fmt {
    template<>
    struct formatter<dax_codec::cbor::special_val>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            using dax_codec::cbor::special_val;
            switch (v) {
                case special_val::s_false: return fmt::format_to(ctx.out(), "false");
                case special_val::s_true: return fmt::format_to(ctx.out(), "true");
                case special_val::s_null: return fmt::format_to(ctx.out(), "null");
                case special_val::s_undefined: return fmt::format_to(ctx.out(), "undefined");
                case special_val::one_byte: return fmt::format_to(ctx.out(), "one_byte");
                case special_val::two_bytes: return fmt::format_to(ctx.out(), "two_bytes");
                case special_val::four_bytes: return fmt::format_to(ctx.out(), "four_bytes");
                case special_val::eight_bytes: return fmt::format_to(ctx.out(), "eight_bytes");
                case special_val::s_break: return fmt::format_to(ctx.out(), "break");
                default: return fmt::format_to(ctx.out(), "special_value: {}", static_cast<int>(v));
            }
        }
    };

    template<>
    struct formatter<dax_codec::cbor::major_type>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            using dax_codec::cbor::major_type;
            switch (v) {
                case major_type::uint: return fmt::format_to(ctx.out(), "uint");
                case major_type::nint: return fmt::format_to(ctx.out(), "nint");
                case major_type::bytes: return fmt::format_to(ctx.out(), "bytes");
                case major_type::text: return fmt::format_to(ctx.out(), "text");
                case major_type::array: return fmt::format_to(ctx.out(), "array");
                case major_type::map: return fmt::format_to(ctx.out(), "map");
                case major_type::tag: return fmt::format_to(ctx.out(), "tag");
                case major_type::simple: return fmt::format_to(ctx.out(), "simple");
                default: return fmt::format_to(ctx.out(), "major_type: {}", static_cast<int>(v));
            }
        }
    };
}

#endif // !DAX_CODEC_CBOR_TYPES_HPP

/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef DAX_CODEC_CBOR_ARGUMENT_HPP
#define DAX_CODEC_CBOR_ARGUMENT_HPP

#include <source_location>
#include <variant>
#include <dc/big_int.hpp>
#include <dc/cbor/cursor.hpp>
#include <dc/cbor/types.hpp>

namespace dax_codec::cbor {
    struct indefinite_length {
        bool operator==(const indefinite_length &) const noexcept =default;
    };

    // The value carried by an item header: a native magnitude, a magnitude above the native limit,
    // or the marker of an indefinite-length item.
    struct argument: std::variant<uint64_t, cpp_int, indefinite_length> {
        using base_type = std::variant<uint64_t, cpp_int, indefinite_length>;
        using base_type::base_type;

        bool indefinite() const noexcept
        {
            return std::holds_alternative<indefinite_length>(*this);
        }

        bool big() const noexcept
        {
            return std::holds_alternative<cpp_int>(*this);
        }

        uint64_t native(const std::source_location &loc=std::source_location::current()) const;
        // magnitudes read from the wire never exceed 64 bits, so this works for big arguments as well
        uint64_t to_uint64(const std::source_location &loc=std::source_location::current()) const;
        cpp_int to_big_int(const std::source_location &loc=std::source_location::current()) const;
    };

    struct item_header {
        uint8_t typ = 0;
        argument arg {};
        // the type byte plus the extension bytes
        size_t size = 0;

        major_type type() const noexcept
        {
            return decompose(typ).type;
        }
    };

    // Values above native_limit are returned as cpp_int. Does not move the cursor.
    extern item_header peek_argument(const cursor &c, uint64_t native_limit);
    extern argument read_argument(cursor &c, uint64_t native_limit);
}

namespace fmt {
    template<>
    struct formatter<dax_codec::cbor::argument>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            using namespace dax_codec::cbor;
            if (v.indefinite())
                return fmt::format_to(ctx.out(), "indefinite");
            if (v.big())
                return fmt::format_to(ctx.out(), "{}", std::get<dax_codec::cpp_int>(v));
            return fmt::format_to(ctx.out(), "{}", std::get<uint64_t>(v));
        }
    };
}

#endif // !DAX_CODEC_CBOR_ARGUMENT_HPP

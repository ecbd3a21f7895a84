/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <dc/cbor/argument.hpp>

namespace dax_codec::cbor {
    uint64_t argument::native(const std::source_location &loc) const
    {
        if (const auto *v = std::get_if<uint64_t>(this); v) [[likely]]
            return *v;
        throw error(fmt::format("expected a native argument but got {} at {}", *this, loc));
    }

    uint64_t argument::to_uint64(const std::source_location &loc) const
    {
        if (const auto *v = std::get_if<uint64_t>(this); v) [[likely]]
            return *v;
        if (const auto *v = std::get_if<cpp_int>(this); v)
            return v->convert_to<uint64_t>();
        throw error(fmt::format("expected a definite argument but got {} at {}", *this, loc));
    }

    cpp_int argument::to_big_int(const std::source_location &loc) const
    {
        if (const auto *v = std::get_if<cpp_int>(this); v)
            return *v;
        return cpp_int { native(loc) };
    }

    item_header peek_argument(const cursor &c, const uint64_t native_limit)
    {
        const auto typ = c.peek();
        const auto [mt, info] = decompose(typ);
        if (info < static_cast<uint8_t>(special_val::one_byte)) [[likely]]
            return { typ, uint64_t { info }, 1 };
        switch (info) {
            case static_cast<uint8_t>(special_val::one_byte):
                c.ensure_available(2);
                return { typ, uint64_t { c.at(1) }, 2 };
            case static_cast<uint8_t>(special_val::two_bytes):
                c.ensure_available(3);
                return { typ, uint64_t { c.view(1, 2).to_host<uint16_t>() }, 3 };
            case static_cast<uint8_t>(special_val::four_bytes):
                c.ensure_available(5);
                return { typ, uint64_t { c.view(1, 4).to_host<uint32_t>() }, 5 };
            case static_cast<uint8_t>(special_val::eight_bytes): {
                c.ensure_available(9);
                const uint64_t high = c.view(1, 4).to_host<uint32_t>();
                const uint64_t low = c.view(5, 4).to_host<uint32_t>();
                const uint64_t val = (high << 32) | low;
                if (val > native_limit)
                    return { typ, cpp_int { val }, 9 };
                return { typ, val, 9 };
            }
            case indefinite_info:
                switch (mt) {
                    case major_type::bytes:
                    case major_type::text:
                    case major_type::array:
                    case major_type::map:
                        return { typ, indefinite_length {}, 1 };
                    default:
                        throw invalid_size_error(fmt::format("indefinite length is not allowed for {} items: 0x{:02X}", mt, typ));
                }
            default:
                throw invalid_size_error(fmt::format("reserved additional info value {} in type byte 0x{:02X}", info, typ));
        }
    }

    argument read_argument(cursor &c, const uint64_t native_limit)
    {
        auto hdr = peek_argument(c, native_limit);
        c.consume(hdr.size);
        return std::move(hdr.arg);
    }
}

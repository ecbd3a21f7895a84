/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef DAX_CODEC_NARROW_CAST_HPP
#define DAX_CODEC_NARROW_CAST_HPP

#include <limits>
#include <typeinfo>
#include <dc/common/error.hpp>
#include <dc/common/format.hpp>

namespace dax_codec {
    template<typename TO, typename FROM>
    constexpr TO narrow_cast(const FROM from)
    {
        if constexpr (std::numeric_limits<FROM>::is_signed == std::numeric_limits<TO>::is_signed) {
            if (from > std::numeric_limits<TO>::max()) [[unlikely]]
                throw error(fmt::format("can't convert {} {} to {}: the value is too big", typeid(FROM).name(), from, typeid(TO).name()));
            if (from < std::numeric_limits<TO>::min()) [[unlikely]]
                throw error(fmt::format("can't convert {} {} to {}: the value is too small", typeid(FROM).name(), from, typeid(TO).name()));
            return static_cast<TO>(from);
        }
        if constexpr (std::numeric_limits<FROM>::is_signed) {
            if (from < 0) [[unlikely]]
                throw error(fmt::format("can't convert {} {} to {}: the value is negative", typeid(FROM).name(), from, typeid(TO).name()));
            if (static_cast<std::make_unsigned_t<FROM>>(from) > std::numeric_limits<TO>::max()) [[unlikely]]
                throw error(fmt::format("can't convert {} {} to {}: the value is too big", typeid(FROM).name(), from, typeid(TO).name()));
            return static_cast<TO>(from);
        }
        if (from > static_cast<std::make_unsigned_t<TO>>(std::numeric_limits<TO>::max())) [[unlikely]]
            throw error(fmt::format("can't convert {} {} to {}: the value is too big", typeid(FROM).name(), from, typeid(TO).name()));
        return static_cast<TO>(from);
    }
}

#endif // !DAX_CODEC_NARROW_CAST_HPP

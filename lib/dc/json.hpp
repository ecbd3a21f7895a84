/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef DAX_CODEC_JSON_HPP
#define DAX_CODEC_JSON_HPP

#include <boost/json.hpp>
#include <dc/common/bytes.hpp>

namespace dax_codec::json {
    using namespace boost::json;

    inline json::value parse(const buffer &buf, json::storage_ptr sp={})
    {
        return boost::json::parse(json::string_view { reinterpret_cast<const char *>(buf.data()), buf.size() }, sp);
    }

    // returns the value as uint64_t accepting any non-negative JSON number that is an exact integer
    inline uint64_t value_to_uint(const json::value &v, const std::string_view name)
    {
        switch (v.kind()) {
            case json::kind::uint64: return v.get_uint64();
            case json::kind::int64:
                if (v.get_int64() >= 0)
                    return static_cast<uint64_t>(v.get_int64());
                break;
            default:
                break;
        }
        throw error(fmt::format("{} must be a non-negative integer but got: {}", name, json::serialize(v)));
    }
}

#endif // !DAX_CODEC_JSON_HPP

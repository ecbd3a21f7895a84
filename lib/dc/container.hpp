/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef DAX_CODEC_CONTAINER_HPP
#define DAX_CODEC_CONTAINER_HPP

#include <map>
#include <set>
#include <vector>
#include <boost/container/flat_map.hpp>
#include <dc/common/format.hpp>

namespace dax_codec {
    template<typename T>
    using vector = std::vector<T>;

    template<typename K, typename V>
    using map = std::map<K, V>;

    template<typename T, typename C=std::less<T>>
    using set = std::set<T, C>;

    // boost::container::flat_map supports incomplete value types, so it can hold recursive structures
    template<typename K, typename V>
    struct flat_map: boost::container::flat_map<K, V> {
        using base_type = boost::container::flat_map<K, V>;
        using base_type::base_type;
    };
}

namespace fmt {
    template<typename K, typename V>
    struct formatter<dax_codec::flat_map<K, V>>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            auto out_it = fmt::format_to(ctx.out(), "{{");
            for (auto it = v.begin(); it != v.end(); ++it) {
                const std::string sep { std::next(it) == v.end() ? "" : ", " };
                out_it = fmt::format_to(out_it, "{}={}{}", it->first, it->second, sep);
            }
            return fmt::format_to(out_it, "}}");
        }
    };
}

#endif //!DAX_CODEC_CONTAINER_HPP

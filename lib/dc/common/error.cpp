/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <cerrno>
#include <cstring>
#include <sstream>
#include <typeinfo>
#include <boost/stacktrace.hpp>
#include "error.hpp"
#include "format.hpp"

namespace dax_codec {
    base_error::base_error(const std::string_view msg):
        _msg { msg }
    {
        // skips top 3 frames: safe_dump, base_error, and error
        boost::stacktrace::safe_dump_to(3, _trace.data(), _trace.size());
    }

    const char *base_error::what() const noexcept
    {
        return _msg.c_str();
    }

    std::string base_error::stacktrace() const
    {
        std::ostringstream os {};
        os << boost::stacktrace::stacktrace::from_dump(_trace.data(), _trace.size());
        return os.str();
    }

    error::error(const std::string_view msg)
        : base_error { msg }
    {
    }

    error::error(const std::string_view msg, const std::exception &ex)
        : error { fmt::format("{} caused by {}: {}", msg, typeid(ex).name(), ex.what()) }
    {
    }

    error_sys::error_sys(const std::string_view msg)
        : error { fmt::format("{} errno: {} strerror: {}", msg, errno, std::strerror(errno)) }
    {
    }
}

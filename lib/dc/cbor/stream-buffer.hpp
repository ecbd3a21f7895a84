/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef DAX_CODEC_CBOR_STREAM_BUFFER_HPP
#define DAX_CODEC_CBOR_STREAM_BUFFER_HPP

#include <string>
#include <dc/common/bytes.hpp>

namespace dax_codec::cbor {
    // Accumulates the chunks of a byte or text string. Reading empties the buffer so it can be reused.
    struct stream_buffer {
        void write(const buffer bytes)
        {
            _data << bytes;
        }

        size_t size() const noexcept
        {
            return _data.size();
        }

        void clear() noexcept
        {
            _data.clear();
        }

        uint8_vector read()
        {
            uint8_vector res {};
            std::swap(res, _data);
            return res;
        }

        std::string read_as_string()
        {
            std::string res { _data.str() };
            _data.clear();
            return res;
        }
    private:
        uint8_vector _data {};
    };
}

#endif // !DAX_CODEC_CBOR_STREAM_BUFFER_HPP

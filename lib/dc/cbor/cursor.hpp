/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef DAX_CODEC_CBOR_CURSOR_HPP
#define DAX_CODEC_CBOR_CURSOR_HPP

#include <string>
#include <dc/common/bytes.hpp>
#include <dc/cbor/error.hpp>

namespace dax_codec::cbor {
    // A read-only window [offset, limit) over a buffer the cursor does not own.
    // Every read that may fail with incomplete_error checks availability before touching the offset.
    struct cursor {
        struct checkpoint {
            size_t offset;
        };

        cursor() =default;

        explicit cursor(const buffer data, const size_t start=0):
            cursor { data, start, data.size() }
        {
        }

        cursor(const buffer data, const size_t start, const size_t limit):
            _data { data }, _offset { start }, _limit { limit }
        {
            if (_limit > _data.size()) [[unlikely]]
                throw error(fmt::format("cursor limit {} is beyond the end of a buffer of {} bytes", _limit, _data.size()));
            if (_offset > _limit) [[unlikely]]
                throw error(fmt::format("cursor start {} is beyond its limit {}", _offset, _limit));
        }

        const buffer &data() const noexcept
        {
            return _data;
        }

        size_t offset() const noexcept
        {
            return _offset;
        }

        size_t limit() const noexcept
        {
            return _limit;
        }

        size_t available() const noexcept
        {
            return _limit - _offset;
        }

        bool empty() const noexcept
        {
            return _offset == _limit;
        }

        void ensure_available(const size_t n) const
        {
            if (available() < n) [[unlikely]]
                throw incomplete_error { _offset + n };
        }

        uint8_t peek() const
        {
            ensure_available(1);
            return _data[_offset];
        }

        // the caller must have verified the availability of [offset + pos, offset + pos + sz)
        buffer view(const size_t pos, const size_t sz) const noexcept
        {
            return { _data.data() + _offset + pos, sz };
        }

        uint8_t at(const size_t pos) const noexcept
        {
            return _data[_offset + pos];
        }

        void consume(const size_t n) noexcept
        {
            _offset += n;
        }

        uint8_vector drain()
        {
            uint8_vector res { view(0, available()) };
            _offset = _limit;
            return res;
        }

        std::string drain_text()
        {
            std::string res { view(0, available()).str() };
            _offset = _limit;
            return res;
        }

        checkpoint save() const noexcept
        {
            return { _offset };
        }

        void restore(const checkpoint cp)
        {
            if (cp.offset > _limit) [[unlikely]]
                throw error(fmt::format("checkpoint offset {} is beyond the cursor limit {}", cp.offset, _limit));
            _offset = cp.offset;
        }
    private:
        buffer _data {};
        size_t _offset = 0;
        size_t _limit = 0;
    };
}

#endif // !DAX_CODEC_CBOR_CURSOR_HPP

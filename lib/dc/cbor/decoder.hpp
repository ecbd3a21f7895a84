/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef DAX_CODEC_CBOR_DECODER_HPP
#define DAX_CODEC_CBOR_DECODER_HPP

#include <functional>
#include <memory>
#include <optional>
#include <variant>
#include <dc/cbor/argument.hpp>
#include <dc/cbor/cursor.hpp>
#include <dc/cbor/error.hpp>
#include <dc/cbor/stream-buffer.hpp>
#include <dc/cbor/types.hpp>
#include <dc/cbor/value.hpp>
#include <dc/container.hpp>
#include <dc/decimal.hpp>

namespace dax_codec {
    struct config;
}

namespace boost::json {
    class object;
}

namespace dax_codec::cbor {
    struct decoder;

    // A handler receives the tag number with the cursor positioned at the tagged item and must consume that item.
    using tag_handler = std::function<value(decoder &, uint64_t)>;
    using tag_handler_map = map<uint64_t, tag_handler>;

    struct decoder_options {
        size_t max_collection_size = 0x100000;
        size_t max_depth = 64;
        uint64_t native_int_limit = (1ULL << 53) - 1;
        size_t big_int_max_size = dax_codec::big_int_max_size;

        static decoder_options from_json(const boost::json::object &obj);
        static decoder_options from_config(const config &cfg);
        void validate() const;
    };

    struct incomplete {
        size_t required = 0;
    };

    using decode_result = std::variant<value, incomplete>;

    struct decoder {
        // restricts the shared-handlers constructor to the decoder itself
        class key {
            friend decoder;
            key() =default;
        };

        decoder(key, std::shared_ptr<const tag_handler_map> handlers, const decoder_options &opts, buffer data, size_t start, size_t end);
        explicit decoder(buffer data, size_t start=0, std::optional<size_t> end={},
            tag_handler_map handlers={}, const decoder_options &opts={});
        decoder(const decoder &) =delete;
        decoder &operator=(const decoder &) =delete;

        const decoder_options &options() const noexcept
        {
            return _opts;
        }

        size_t offset() const noexcept
        {
            return _cur.offset();
        }

        size_t limit() const noexcept
        {
            return _cur.limit();
        }

        bool empty() const noexcept
        {
            return _cur.empty();
        }

        cursor::checkpoint checkpoint() const noexcept
        {
            return _cur.save();
        }

        void rollback(const cursor::checkpoint cp)
        {
            _cur.restore(cp);
        }

        // points the decoder at a new window; the handlers and options stay
        void rebind(buffer data, size_t start=0, std::optional<size_t> end={});

        uint8_t peek() const
        {
            return _cur.peek();
        }

        void skip();

        uint8_vector drain()
        {
            return _cur.drain();
        }

        std::string drain_text()
        {
            return _cur.drain_text();
        }

        value decode_object();
        // Incomplete input is reported as a value and leaves the cursor where it was before the call
        decode_result try_decode_object();

        value decode_int();
        double decode_float();
        value decode_number();
        uint8_vector decode_bytes();
        std::string decode_string();

        argument decode_array_length();
        argument decode_map_length();
        void process_array(const std::function<void()> &fn);
        void process_map(const std::function<void()> &fn);
        value_array build_array(const std::function<value()> &fn);
        value_map build_map(const std::function<std::pair<value, value>()> &fn);
        value_array decode_array();
        value_map decode_map();

        bool try_decode_break();
        bool try_decode_null();

        uint64_t decode_tag();
        cpp_int decode_big_int(uint64_t tag);
        decimal decode_decimal(uint64_t tag);

        // The returned sub-decoder is owned by this decoder and is rebound by the next call.
        // For a definite-length byte string it shares this decoder's buffer.
        decoder &decode_cbor();
    private:
        cursor _cur;
        std::shared_ptr<const tag_handler_map> _handlers;
        decoder_options _opts;
        stream_buffer _stream {};
        std::unique_ptr<decoder> _sub {};
        uint8_vector _sub_storage {};
        size_t _depth = 0;


        std::optional<uint64_t> _peek_tag() const;
        value _decode_tagged();
        size_t _checked_length(const argument &arg, std::string_view what) const;
        void _read_string(major_type mt);
        void _read_definite_string(const item_header &hdr);
        decoder &_sub_decoder();
    };

    extern value parse(buffer data, const decoder_options &opts={}, tag_handler_map handlers={});
    extern vector<value> parse_all(buffer data, const decoder_options &opts={}, tag_handler_map handlers={});
}

#endif // !DAX_CODEC_CBOR_DECODER_HPP

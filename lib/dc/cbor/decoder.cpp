/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <bit>
#include <limits>
#include <map>
#include <dc/cbor/decoder.hpp>
#include <dc/cbor/float16.hpp>
#include <dc/config.hpp>
#include <dc/narrow-cast.hpp>

namespace dax_codec::cbor {
    decoder_options decoder_options::from_json(const json::object &obj)
    {
        decoder_options opts {};
        if (const auto *v = obj.if_contains("maxCollectionSize"); v)
            opts.max_collection_size = narrow_cast<size_t>(json::value_to_uint(*v, "maxCollectionSize"));
        if (const auto *v = obj.if_contains("maxDepth"); v)
            opts.max_depth = narrow_cast<size_t>(json::value_to_uint(*v, "maxDepth"));
        if (const auto *v = obj.if_contains("nativeIntLimit"); v)
            opts.native_int_limit = json::value_to_uint(*v, "nativeIntLimit");
        if (const auto *v = obj.if_contains("bigIntMaxSize"); v)
            opts.big_int_max_size = narrow_cast<size_t>(json::value_to_uint(*v, "bigIntMaxSize"));
        opts.validate();
        return opts;
    }

    decoder_options decoder_options::from_config(const config &cfg)
    {
        return from_json(cfg.json());
    }

    void decoder_options::validate() const
    {
        if (max_depth == 0)
            throw error("maxDepth must be positive!");
        if (big_int_max_size == 0)
            throw error("bigIntMaxSize must be positive!");
        // 4-byte arguments are always native; negated native values must fit int64_t
        if (native_int_limit < std::numeric_limits<uint32_t>::max()
                || native_int_limit > static_cast<uint64_t>(std::numeric_limits<int64_t>::max()))
            throw error(fmt::format("nativeIntLimit must be within [{}, {}] but got: {}",
                std::numeric_limits<uint32_t>::max(), std::numeric_limits<int64_t>::max(), native_int_limit));
    }

    namespace {
        struct depth_guard {
            depth_guard(size_t &depth, const size_t max_depth, const size_t offset):
                _depth { depth }
            {
                if (_depth >= max_depth) [[unlikely]]
                    throw nesting_too_deep_error(fmt::format("nesting deeper than {} levels at offset {}", max_depth, offset));
                ++_depth;
            }

            ~depth_guard()
            {
                --_depth;
            }

            depth_guard(const depth_guard &) =delete;
            depth_guard &operator=(const depth_guard &) =delete;
        private:
            size_t &_depth;
        };

        // tags are read with the full 64-bit range regardless of the native integer limit
        constexpr uint64_t tag_limit = std::numeric_limits<uint64_t>::max();

        constexpr bool is_big_int_tag(const uint64_t tag)
        {
            return tag == static_cast<uint64_t>(well_known_tag::positive_bignum)
                || tag == static_cast<uint64_t>(well_known_tag::negative_bignum);
        }
    }

    decoder::decoder(const buffer data, const size_t start, const std::optional<size_t> end,
            tag_handler_map handlers, const decoder_options &opts):
        decoder { key {}, std::make_shared<const tag_handler_map>(std::move(handlers)), opts,
            data, start, end.value_or(data.size()) }
    {
    }

    decoder::decoder(key, std::shared_ptr<const tag_handler_map> handlers, const decoder_options &opts,
            const buffer data, const size_t start, const size_t end):
        _cur { data, start, end }, _handlers { std::move(handlers) }, _opts { opts }
    {
        _opts.validate();
    }

    void decoder::rebind(const buffer data, const size_t start, const std::optional<size_t> end)
    {
        _cur = cursor { data, start, end.value_or(data.size()) };
        _stream.clear();
        _depth = 0;
    }

    void decoder::skip()
    {
        decode_object();
    }

    value decoder::decode_object()
    {
        const auto typ = _cur.peek();
        switch (typ) {
            case type_byte::s_null:
            case type_byte::s_undefined:
                _cur.consume(1);
                return {};
            case type_byte::s_true:
                _cur.consume(1);
                return true;
            case type_byte::s_false:
                _cur.consume(1);
                return false;
            case type_byte::float16:
            case type_byte::float32:
            case type_byte::float64:
                return decode_float();
            case type_byte::s_break:
                throw unexpected_break_error(fmt::format("unexpected break at offset {}", _cur.offset()));
            default:
                break;
        }
        switch (const auto mt = decompose(typ).type; mt) {
            case major_type::uint:
            case major_type::nint:
                return decode_int();
            case major_type::bytes:
                return decode_bytes();
            case major_type::text:
                return decode_string();
            case major_type::array:
                return decode_array();
            case major_type::map:
                return decode_map();
            case major_type::tag:
                return _decode_tagged();
            default:
                throw type_mismatch_error(fmt::format("unsupported simple value 0x{:02X} at offset {}", typ, _cur.offset()));
        }
    }

    decode_result decoder::try_decode_object()
    {
        const auto cp = _cur.save();
        try {
            return decode_object();
        } catch (const incomplete_error &ex) {
            _cur.restore(cp);
            return incomplete { ex.required() };
        }
    }

    value decoder::decode_int()
    {
        const auto typ = _cur.peek();
        const auto mt = decompose(typ).type;
        if (mt != major_type::uint && mt != major_type::nint) [[unlikely]] {
            if (const auto tag = _peek_tag(); tag && is_big_int_tag(*tag)) {
                decode_tag();
                return decode_big_int(*tag);
            }
            throw type_mismatch_error(fmt::format("expected an integer but got {} at offset {}", mt, _cur.offset()));
        }
        const auto arg = read_argument(_cur, _opts.native_int_limit);
        if (mt == major_type::uint) {
            if (arg.big())
                return std::get<cpp_int>(arg);
            return static_cast<int64_t>(arg.native());
        }
        if (arg.big())
            return big_nint_from_magnitude(std::get<cpp_int>(arg));
        return -static_cast<int64_t>(arg.native()) - 1;
    }

    double decoder::decode_float()
    {
        switch (const auto typ = _cur.peek(); typ) {
            case type_byte::float16: {
                _cur.ensure_available(3);
                const auto res = half_to_double(_cur.view(1, 2).to_host<uint16_t>());
                _cur.consume(3);
                return res;
            }
            case type_byte::float32: {
                _cur.ensure_available(5);
                const auto res = std::bit_cast<float>(_cur.view(1, 4).to_host<uint32_t>());
                _cur.consume(5);
                return res;
            }
            case type_byte::float64: {
                _cur.ensure_available(9);
                const auto res = std::bit_cast<double>(_cur.view(1, 8).to_host<uint64_t>());
                _cur.consume(9);
                return res;
            }
            default:
                throw type_mismatch_error(fmt::format("expected a float but got 0x{:02X} at offset {}", typ, _cur.offset()));
        }
    }

    value decoder::decode_number()
    {
        const auto typ = _cur.peek();
        switch (typ) {
            case type_byte::float16:
            case type_byte::float32:
            case type_byte::float64:
                return decode_float();
            default:
                break;
        }
        switch (decompose(typ).type) {
            case major_type::uint:
            case major_type::nint:
                return decode_int();
            case major_type::tag:
                if (const auto tag = _peek_tag(); tag) {
                    if (is_big_int_tag(*tag)) {
                        decode_tag();
                        return decode_big_int(*tag);
                    }
                    if (*tag == static_cast<uint64_t>(well_known_tag::decimal_fraction)) {
                        decode_tag();
                        return decode_decimal(*tag);
                    }
                }
                break;
            default:
                break;
        }
        throw not_a_number_error(fmt::format("not a number: 0x{:02X} at offset {}", typ, _cur.offset()));
    }

    uint8_vector decoder::decode_bytes()
    {
        if (const auto typ = _cur.peek(); !is_major_type(typ, major_type::bytes)) [[unlikely]]
            throw type_mismatch_error(fmt::format("expected bytes but got 0x{:02X} at offset {}", typ, _cur.offset()));
        _stream.clear();
        _read_string(major_type::bytes);
        return _stream.read();
    }

    std::string decoder::decode_string()
    {
        if (const auto typ = _cur.peek(); !is_major_type(typ, major_type::text)) [[unlikely]]
            throw type_mismatch_error(fmt::format("expected text but got 0x{:02X} at offset {}", typ, _cur.offset()));
        _stream.clear();
        _read_string(major_type::text);
        return _stream.read_as_string();
    }

    size_t decoder::_checked_length(const argument &arg, const std::string_view what) const
    {
        if (arg.big() || arg.native() > _opts.max_collection_size) [[unlikely]]
            throw collection_too_big_error(fmt::format("{} of {} elements at offset {} exceeds the limit of {}",
                what, arg, _cur.offset(), _opts.max_collection_size));
        return static_cast<size_t>(arg.native());
    }

    void decoder::_read_definite_string(const item_header &hdr)
    {
        const auto len = _checked_length(hdr.arg, "string");
        if (_stream.size() + len > _opts.max_collection_size) [[unlikely]]
            throw collection_too_big_error(fmt::format("chunked string at offset {} exceeds the limit of {} bytes",
                _cur.offset(), _opts.max_collection_size));
        // the header and the payload are checked together so that a truncated string is not partially consumed
        _cur.ensure_available(hdr.size + len);
        _stream.write(_cur.view(hdr.size, len));
        _cur.consume(hdr.size + len);
    }

    void decoder::_read_string(const major_type mt)
    {
        const auto hdr = peek_argument(_cur, _opts.native_int_limit);
        if (!hdr.arg.indefinite()) [[likely]] {
            _read_definite_string(hdr);
            return;
        }
        _cur.consume(hdr.size);
        while (!try_decode_break()) {
            const auto chunk = peek_argument(_cur, _opts.native_int_limit);
            if (chunk.type() != mt || chunk.arg.indefinite()) [[unlikely]]
                throw type_mismatch_error(fmt::format("a chunk of an indefinite {} string must be a definite {} string but got 0x{:02X} at offset {}",
                    mt, mt, chunk.typ, _cur.offset()));
            _read_definite_string(chunk);
        }
    }

    argument decoder::decode_array_length()
    {
        if (const auto typ = _cur.peek(); !is_major_type(typ, major_type::array)) [[unlikely]]
            throw type_mismatch_error(fmt::format("expected an array but got 0x{:02X} at offset {}", typ, _cur.offset()));
        return read_argument(_cur, _opts.native_int_limit);
    }

    argument decoder::decode_map_length()
    {
        if (const auto typ = _cur.peek(); !is_major_type(typ, major_type::map)) [[unlikely]]
            throw type_mismatch_error(fmt::format("expected a map but got 0x{:02X} at offset {}", typ, _cur.offset()));
        return read_argument(_cur, _opts.native_int_limit);
    }

    void decoder::process_array(const std::function<void()> &fn)
    {
        depth_guard guard { _depth, _opts.max_depth, _cur.offset() };
        const auto len = decode_array_length();
        if (len.indefinite()) {
            while (!try_decode_break())
                fn();
            return;
        }
        const auto sz = _checked_length(len, "array");
        for (size_t i = 0; i < sz; ++i) {
            // a break before the declared count ends the array early
            if (try_decode_break())
                break;
            fn();
        }
    }

    void decoder::process_map(const std::function<void()> &fn)
    {
        depth_guard guard { _depth, _opts.max_depth, _cur.offset() };
        const auto len = decode_map_length();
        if (len.indefinite()) {
            while (!try_decode_break())
                fn();
            return;
        }
        const auto sz = _checked_length(len, "map");
        for (size_t i = 0; i < sz; ++i) {
            if (try_decode_break())
                break;
            fn();
        }
    }

    value_array decoder::build_array(const std::function<value()> &fn)
    {
        value_array res {};
        process_array([&] {
            if (res.size() >= _opts.max_collection_size) [[unlikely]]
                throw collection_too_big_error(fmt::format("indefinite array exceeds the limit of {} elements", _opts.max_collection_size));
            res.emplace_back(fn());
        });
        return res;
    }

    value_map decoder::build_map(const std::function<std::pair<value, value>()> &fn)
    {
        std::map<value, value> items {};
        process_map([&] {
            if (items.size() >= _opts.max_collection_size) [[unlikely]]
                throw collection_too_big_error(fmt::format("indefinite map exceeds the limit of {} elements", _opts.max_collection_size));
            const auto key_offset = _cur.offset();
            auto [k, v] = fn();
            if (items.contains(k)) [[unlikely]]
                throw duplicate_key_error(fmt::format("duplicate map key {} at offset {}", k, key_offset));
            items.emplace(std::move(k), std::move(v));
        });
        value_map res {};
        res.reserve(items.size());
        while (!items.empty()) {
            auto node = items.extract(items.begin());
            res.emplace_hint(res.end(), std::move(node.key()), std::move(node.mapped()));
        }
        return res;
    }

    value_array decoder::decode_array()
    {
        return build_array([&] { return decode_object(); });
    }

    value_map decoder::decode_map()
    {
        return build_map([&] {
            auto k = decode_object();
            auto v = decode_object();
            return std::pair<value, value> { std::move(k), std::move(v) };
        });
    }

    bool decoder::try_decode_break()
    {
        if (_cur.peek() == type_byte::s_break) {
            _cur.consume(1);
            return true;
        }
        return false;
    }

    bool decoder::try_decode_null()
    {
        if (_cur.peek() == type_byte::s_null) {
            _cur.consume(1);
            return true;
        }
        return false;
    }

    std::optional<uint64_t> decoder::_peek_tag() const
    {
        if (!is_major_type(_cur.peek(), major_type::tag))
            return {};
        return peek_argument(_cur, tag_limit).arg.native();
    }

    uint64_t decoder::decode_tag()
    {
        if (const auto typ = _cur.peek(); !is_major_type(typ, major_type::tag)) [[unlikely]]
            throw invalid_tag_error(fmt::format("expected a tag but got 0x{:02X} at offset {}", typ, _cur.offset()));
        return read_argument(_cur, tag_limit).native();
    }

    cpp_int decoder::decode_big_int(const uint64_t tag)
    {
        if (!is_big_int_tag(tag)) [[unlikely]]
            throw invalid_tag_error(fmt::format("invalid tag to decode a big int: {}", tag));
        if (const auto typ = _cur.peek(); !is_major_type(typ, major_type::bytes)) [[unlikely]]
            throw type_mismatch_error(fmt::format("big int payload must be bytes but got 0x{:02X} at offset {}", typ, _cur.offset()));
        const auto data = decode_bytes();
        if (data.size() > _opts.big_int_max_size) [[unlikely]]
            throw collection_too_big_error(fmt::format("big ints larger than {} bytes are not supported but got: {}",
                _opts.big_int_max_size, data.size()));
        if (tag == static_cast<uint64_t>(well_known_tag::positive_bignum))
            return big_uint_from_bytes(data, _opts.big_int_max_size);
        return big_nint_from_bytes(data, _opts.big_int_max_size);
    }

    decimal decoder::decode_decimal(const uint64_t tag)
    {
        if (tag != static_cast<uint64_t>(well_known_tag::decimal_fraction)) [[unlikely]]
            throw invalid_tag_error(fmt::format("a decimal must have tag {} but got: {}",
                static_cast<uint64_t>(well_known_tag::decimal_fraction), tag));
        const auto start = _cur.offset();
        if (const auto len = decode_array_length(); len.indefinite() || len.big() || len.native() != 2) [[unlikely]]
            throw malformed_decimal_error(fmt::format("a decimal at offset {} must be an array of two elements but got: {}", start, len));
        const auto scale = decode_int();
        if (scale.type() != value_type::integer || scale.as_int() == std::numeric_limits<int64_t>::min()) [[unlikely]]
            throw malformed_decimal_error(fmt::format("unsupported decimal scale {} at offset {}", scale, start));
        auto unscaled = decode_int().as_big_int();
        return { std::move(unscaled), -scale.as_int() };
    }

    value decoder::_decode_tagged()
    {
        depth_guard guard { _depth, _opts.max_depth, _cur.offset() };
        const auto tag = decode_tag();
        switch (tag) {
            case static_cast<uint64_t>(well_known_tag::positive_bignum):
            case static_cast<uint64_t>(well_known_tag::negative_bignum):
                return decode_big_int(tag);
            case static_cast<uint64_t>(well_known_tag::decimal_fraction):
                return decode_decimal(tag);
            default:
                if (const auto it = _handlers->find(tag); it != _handlers->end())
                    return it->second(*this, tag);
                // unregistered tags are transparent
                return decode_object();
        }
    }

    decoder &decoder::_sub_decoder()
    {
        if (!_sub)
            _sub = std::make_unique<decoder>(key {}, _handlers, _opts, buffer {}, 0, 0);
        return *_sub;
    }

    decoder &decoder::decode_cbor()
    {
        const auto hdr = peek_argument(_cur, _opts.native_int_limit);
        if (hdr.type() != major_type::bytes) [[unlikely]]
            throw type_mismatch_error(fmt::format("expected encoded bytes but got 0x{:02X} at offset {}", hdr.typ, _cur.offset()));
        if (!hdr.arg.indefinite()) {
            // the window is not copied, so max_collection_size does not apply
            if (hdr.arg.big()) [[unlikely]]
                throw collection_too_big_error(fmt::format("nested item of {} bytes at offset {} is too big", hdr.arg, _cur.offset()));
            const auto len = static_cast<size_t>(hdr.arg.native());
            _cur.ensure_available(hdr.size + len);
            const auto start = _cur.offset() + hdr.size;
            _cur.consume(hdr.size + len);
            _sub_decoder().rebind(_cur.data(), start, start + len);
        } else {
            // chunks are not contiguous in the source buffer, so they are gathered into owned storage
            _sub_storage = decode_bytes();
            _sub_decoder().rebind(_sub_storage, 0, _sub_storage.size());
        }
        return *_sub;
    }

    value parse(const buffer data, const decoder_options &opts, tag_handler_map handlers)
    {
        decoder dec { data, 0, {}, std::move(handlers), opts };
        auto res = dec.decode_object();
        if (!dec.empty()) [[unlikely]]
            throw error(fmt::format("{} unexpected bytes after the item at offset {}", dec.limit() - dec.offset(), dec.offset()));
        return res;
    }

    vector<value> parse_all(const buffer data, const decoder_options &opts, tag_handler_map handlers)
    {
        decoder dec { data, 0, {}, std::move(handlers), opts };
        vector<value> res {};
        while (!dec.empty())
            res.emplace_back(dec.decode_object());
        return res;
    }
}

/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <algorithm>
#include <cctype>
#include <dc/cli/decode.hpp>
#include <dc/file.hpp>

namespace dax_codec::cli::decode {
    static std::optional<std::string_view> error_kind(const error &ex)
    {
        if (dynamic_cast<const cbor::type_mismatch_error *>(&ex))
            return "type mismatch";
        if (dynamic_cast<const cbor::not_a_number_error *>(&ex))
            return "not a number";
        if (dynamic_cast<const cbor::malformed_decimal_error *>(&ex))
            return "malformed decimal";
        if (dynamic_cast<const cbor::invalid_tag_error *>(&ex))
            return "invalid tag";
        if (dynamic_cast<const cbor::duplicate_key_error *>(&ex))
            return "duplicate key";
        if (dynamic_cast<const cbor::unexpected_break_error *>(&ex))
            return "unexpected break";
        if (dynamic_cast<const cbor::invalid_size_error *>(&ex))
            return "invalid size";
        if (dynamic_cast<const cbor::collection_too_big_error *>(&ex))
            return "collection too big";
        if (dynamic_cast<const cbor::nesting_too_deep_error *>(&ex))
            return "nesting too deep";
        return {};
    }

    static uint8_vector from_hex_text(const buffer text)
    {
        std::string hex {};
        hex.reserve(text.size());
        for (const char c: text.str()) {
            if (!std::isspace(static_cast<unsigned char>(c)))
                hex += c;
        }
        return uint8_vector::from_hex(hex);
    }

    size_t print_items(const buffer data, const cbor::decoder_options &opts, std::ostream &os)
    {
        cbor::decoder dec { data, 0, {}, {}, opts };
        size_t num_items = 0;
        while (!dec.empty()) {
            auto res = dec.try_decode_object();
            if (const auto *inc = std::get_if<cbor::incomplete>(&res); inc)
                throw error(fmt::format("truncated input: need data up to byte {} but have only {}", inc->required, data.size()));
            os << fmt::format("ITEM {}: {}\n", num_items++, std::get<cbor::value>(res));
        }
        return num_items;
    }

    cbor::decoder_options load_options(const options &opts)
    {
        std::optional<std::string> cfg_path {};
        if (const auto it = opts.find("config"); it != opts.end()) {
            if (!it->second)
                throw error("--config requires a path: --config=<path>");
            cfg_path = *it->second;
        } else {
            cfg_path = default_config_path();
        }
        if (!cfg_path)
            return {};
        logger::info("loading decoder options from {}", *cfg_path);
        return cbor::decoder_options::from_config(config_file { *cfg_path });
    }

    void cmd::configure(config &cmd) const
    {
        cmd.name = "decode";
        cmd.desc = "decode and print all items stored in a file";
        cmd.args.expect({ "<path>" });
        cmd.opts.try_emplace("hex", "the file contains hex text instead of raw bytes");
        cmd.opts.try_emplace("config", "a JSON file with decoder options, DC_CONFIG by default");
    }

    void cmd::run(const arguments &args, const options &opts) const
    {
        const auto &path = args.at(0);
        const auto dec_opts = load_options(opts);
        auto data = file::read(path);
        if (opts.contains("hex"))
            data = from_hex_text(data);
        logger::debug("decoding {} bytes from {}", data.size(), path);
        try {
            const auto num_items = print_items(data, dec_opts, std::cout);
            logger::info("decoded {} items from {}", num_items, path);
        } catch (const error &ex) {
            const auto kind = error_kind(ex);
            if (!kind)
                throw;
            throw error(fmt::format("{} error in {}", *kind, path), ex);
        }
    }

    static auto instance = command::reg(std::make_shared<cmd>());
}

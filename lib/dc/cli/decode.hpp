/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef DAX_CODEC_CLI_DECODE_HPP
#define DAX_CODEC_CLI_DECODE_HPP

#include <ostream>
#include <dc/cbor/decoder.hpp>
#include <dc/cli.hpp>

namespace dax_codec::cli::decode {
    // prints every top-level item as "ITEM <n>: <value>" and returns the number of items
    extern size_t print_items(buffer data, const cbor::decoder_options &opts, std::ostream &os);
    extern cbor::decoder_options load_options(const options &opts);

    struct cmd: command {
        void configure(config &cmd) const override;
        void run(const arguments &args, const options &opts) const override;
    };
}

#endif // !DAX_CODEC_CLI_DECODE_HPP

/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef DAX_CODEC_CLI_HPP
#define DAX_CODEC_CLI_HPP

#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <dc/config.hpp>
#include <dc/container.hpp>
#include <dc/logger.hpp>

namespace dax_codec::cli {
    using arguments = vector<std::string>;
    using options = map<std::string, std::optional<std::string>>;

    struct option_config {
        std::string desc {};
    };
    using option_config_map = map<std::string, option_config>;

    struct argument_config {
        std::optional<size_t> min {};
        std::optional<size_t> max {};
        std::vector<std::string> names {};

        void expect(const std::initializer_list<std::string> &args)
        {
            names = args;
            size_t req = 0;
            size_t opt = 0;
            for (const auto &a: args) {
                if (a.at(0) == '[')
                    ++opt;
                else
                    ++req;
            }
            min = req;
            max = req + opt;
        }
    };

    struct config {
        std::string name {};
        std::string desc {};
        argument_config args {};
        option_config_map opts {};

        std::string make_usage() const
        {
            std::string arg_info {};
            for (const auto &name: args.names)
                arg_info += fmt::format(" {}", name);
            const std::string opt_info { opts.empty() ? "" : "[options]" };
            return fmt::format("{}{} - {}", opt_info, arg_info, desc);
        }
    };

    struct parse_result {
        arguments args {};
        options opts {};
    };

    struct command {
        using command_list = std::vector<std::shared_ptr<command>>;

        static const command_list &registry()
        {
            return _registry();
        }

        static std::shared_ptr<command> reg(std::shared_ptr<command> &&cmd)
        {
            return _registry().emplace_back(std::move(cmd));
        }

        virtual ~command() =default;
        virtual void configure(config &meta) const =0;
        virtual void run(const arguments &args, const options &opts) const =0;

        parse_result parse(const config &cfg, const arguments &args) const
        {
            parse_result pr {};
            for (const auto &arg: args) {
                if (arg.substr(0, 2) == "--") {
                    std::string name = arg.substr(2);
                    std::optional<std::string> val {};
                    if (const auto eq_pos = arg.find('=', 2); eq_pos != arg.npos) {
                        val = arg.substr(eq_pos + 1);
                        name = arg.substr(2, eq_pos - 2);
                    }
                    if (!cfg.opts.contains(name))
                        throw error(fmt::format("unknown option '--{}'", name));
                    if (const auto [opt_it, opt_created] = pr.opts.try_emplace(name, std::move(val)); !opt_created)
                        throw error(fmt::format("duplicate option specification '{}'", arg));
                } else {
                    pr.args.emplace_back(arg);
                }
            }
            if (cfg.args.min && pr.args.size() < *cfg.args.min)
                _throw_usage(cfg);
            if (cfg.args.max && pr.args.size() > *cfg.args.max)
                _throw_usage(cfg);
            return pr;
        }
    protected:
        [[noreturn]] void _throw_usage(const config &cmd) const
        {
            std::string usage = fmt::format("usage: {} {}", cmd.name, cmd.make_usage());
            if (!cmd.opts.empty()) {
                usage += fmt::format("\n{} supports the following options:", cmd.name);
                for (const auto &[name, cfg]: cmd.opts)
                    usage += fmt::format("\n    --{} - {}", name, cfg.desc);
            }
            throw error(usage);
        }
    private:
        static command_list &_registry()
        {
            static command_list l {};
            return l;
        }
    };

    struct command_meta {
        std::shared_ptr<command> cmd {};
        config cfg {};
    };

    extern int run(int argc, const char **argv, const command::command_list &command_list);
    extern int run(int argc, const char **argv);
}

#endif // !DAX_CODEC_CLI_HPP

/* This file is part of Shipyard project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include <iostream>
#include "cli.hpp"

namespace shipyard::cli {
    static std::map<std::string, command::ptr_type> &registry()
    {
        static std::map<std::string, command::ptr_type> commands {};
        return commands;
    }

    command::ptr_type command::reg(ptr_type cmd)
    {
        config cfg {};
        cmd->configure(cfg);
        if (cfg.name.empty()) [[unlikely]]
            throw error("a command must have a name!");
        const auto [it, created] = registry().try_emplace(cfg.name, cmd);
        if (!created) [[unlikely]]
            throw error(fmt::format("a duplicate command name: {}", cfg.name));
        return cmd;
    }

    void arg_config::expect(const std::initializer_list<std::string> arg_names)
    {
        names.assign(arg_names.begin(), arg_names.end());
        min = 0;
        max = 0;
        for (const auto &n: names) {
            ++max;
            if (!n.starts_with('['))
                ++min;
        }
    }

    void arg_config::validate(const arguments &args) const
    {
        if (args.size() < min || args.size() > max) [[unlikely]]
            throw error(fmt::format("expected between {} and {} arguments but got {}", min, max, args.size()));
    }

    std::string config::usage() const
    {
        std::string res = fmt::format("{}", name);
        for (const auto &n: args.names)
            res += fmt::format(" {}", n);
        for (const auto &[o_name, o_cfg]: opts) {
            res += fmt::format(" [--{}=<value>]", o_name);
        }
        res += fmt::format("\n    {}", desc);
        for (const auto &[o_name, o_cfg]: opts) {
            res += fmt::format("\n    --{}: {}", o_name, o_cfg.desc);
            if (o_cfg.default_value)
                res += fmt::format(" (default: {})", *o_cfg.default_value);
        }
        return res;
    }

    static void print_usage()
    {
        std::cerr << "Usage: shipyard <command> [<arg> ...] [--<option>=<value> ...]\nCommands:\n";
        for (const auto &[name, cmd]: registry()) {
            config cfg {};
            cmd->configure(cfg);
            std::cerr << fmt::format("  {}\n", cfg.usage());
        }
    }

    static void parse(const config &cfg, const int argc, const char **argv, arguments &args, options &opts)
    {
        for (const auto &[name, o_cfg]: cfg.opts)
            opts.try_emplace(name, o_cfg.default_value);
        for (int i = 2; i < argc; ++i) {
            const std::string_view arg { argv[i] };
            if (!arg.starts_with("--")) {
                args.emplace_back(arg);
                continue;
            }
            auto name = arg.substr(2);
            std::optional<std::string> val {};
            if (const auto eq_pos = name.find('='); eq_pos != std::string_view::npos) {
                val.emplace(name.substr(eq_pos + 1));
                name = name.substr(0, eq_pos);
            } else if (i + 1 < argc) {
                val.emplace(argv[++i]);
            }
            const auto it = opts.find(std::string { name });
            if (it == opts.end()) [[unlikely]]
                throw error(fmt::format("unsupported option: --{}", name));
            if (!val) [[unlikely]]
                throw error(fmt::format("option --{} requires a value", name));
            it->second = std::move(val);
        }
        cfg.args.validate(args);
    }

    int run(const int argc, const char **argv)
    {
        if (argc < 2) {
            print_usage();
            return 1;
        }
        const std::string cmd_name { argv[1] };
        const auto it = registry().find(cmd_name);
        if (it == registry().end()) {
            logger::error("unknown command: {}", cmd_name);
            print_usage();
            return 1;
        }
        config cfg {};
        it->second->configure(cfg);
        try {
            arguments args {};
            options opts {};
            parse(cfg, argc, argv, args, opts);
            it->second->run(args, opts);
            return 0;
        } catch (const std::exception &ex) {
            logger::error("{} failed: {}", cmd_name, ex.what());
            return 1;
        }
    }
}

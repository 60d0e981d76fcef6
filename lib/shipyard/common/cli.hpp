#pragma once
/* This file is part of Shipyard project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "error.hpp"
#include "logger.hpp"

namespace shipyard::cli {
    using arguments = std::vector<std::string>;
    using options = std::map<std::string, std::optional<std::string>>;

    struct option_config {
        std::string desc {};
        std::optional<std::string> default_value {};

        option_config(std::string d, std::optional<std::string> def={}):
            desc { std::move(d) },
            default_value { std::move(def) }
        {
        }
    };

    struct arg_config {
        size_t min = 0;
        size_t max = 0;
        std::vector<std::string> names {};

        // names in square brackets are optional and must follow the required ones
        void expect(std::initializer_list<std::string> arg_names);
        void validate(const arguments &args) const;
    };

    struct config {
        std::string name {};
        std::string desc {};
        arg_config args {};
        std::map<std::string, option_config> opts {};

        [[nodiscard]] std::string usage() const;
    };

    struct command {
        using ptr_type = std::shared_ptr<command>;

        static ptr_type reg(ptr_type cmd);

        virtual ~command() =default;
        virtual void configure(config &cmd) const =0;

        virtual void run(const arguments &) const
        {
            throw error("this command must override one of the run methods!");
        }

        virtual void run(const arguments &args, const options &) const
        {
            run(args);
        }
    };

    extern int run(int argc, const char **argv);
}

/* This file is part of Shipyard project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include "cli.hpp"
#include "test.hpp"

namespace {
    using namespace shipyard;
    using namespace shipyard::cli;

    struct invocation_t {
        size_t runs = 0;
        arguments args {};
        options opts {};
    };

    invocation_t &last_invocation()
    {
        static invocation_t inv {};
        return inv;
    }

    struct echo_cmd: command {
        void configure(config &cmd) const override
        {
            cmd.name = "test-echo";
            cmd.desc = "Record the arguments and options it was invoked with";
            cmd.args.expect({ "<first>", "[<second>]" });
            cmd.opts.try_emplace("output", "an option without a default");
            cmd.opts.try_emplace("mode", "an option with a default", "fast");
        }

        void run(const arguments &args, const options &opts) const override
        {
            auto &inv = last_invocation();
            ++inv.runs;
            inv.args = args;
            inv.opts = opts;
            if (args.at(0) == "fail")
                throw error("the command failed");
        }
    };
    auto echo_instance = command::reg(std::make_shared<echo_cmd>());

    int run_cmd(std::initializer_list<const char *> argv)
    {
        last_invocation() = {};
        std::vector<const char *> v { argv };
        return cli::run(static_cast<int>(v.size()), v.data());
    }

    void expect_rejected(std::initializer_list<const char *> argv, const std::source_location &loc=std::source_location::current())
    {
        expect_equal(1, run_cmd(argv), loc);
        expect(last_invocation().runs == 0U, loc);
    }
}

suite shipyard_common_cli_suite = [] {
    "shipyard::common::cli"_test = [] {
        "arg_config bounds"_test = [] {
            arg_config ac {};
            ac.expect({ "<a>", "<b>", "[<c>]", "[<d>]" });
            expect_equal(size_t { 2 }, ac.min);
            expect_equal(size_t { 4 }, ac.max);
            expect(throws<error>([&] { ac.validate({ "1" }); }));
            expect(nothrow([&] { ac.validate({ "1", "2" }); }));
            expect(nothrow([&] { ac.validate({ "1", "2", "3", "4" }); }));
            expect(throws<error>([&] { ac.validate({ "1", "2", "3", "4", "5" }); }));
            ac.expect({});
            expect_equal(size_t { 0 }, ac.max);
            expect(nothrow([&] { ac.validate({}); }));
            expect(throws<error>([&] { ac.validate({ "1" }); }));
        };
        "usage"_test = [] {
            config cfg {};
            echo_cmd {}.configure(cfg);
            const auto u = cfg.usage();
            expect(u.starts_with("test-echo <first> [<second>]")) << u;
            expect(u.find("[--output=<value>]") != std::string::npos) << u;
            expect(u.find("--mode: an option with a default (default: fast)") != std::string::npos) << u;
        };
        "duplicate registration"_test = [] {
            expect(throws<error>([] { command::reg(std::make_shared<echo_cmd>()); }));
        };
        "options with an equals sign and as a separate argument"_test = [] {
            expect_equal(0, run_cmd({ "shipyard", "test-echo", "x", "--output=out.tar" }));
            auto &inv = last_invocation();
            expect_equal(size_t { 1 }, inv.runs);
            expect(inv.args == arguments { "x" });
            expect(inv.opts.at("output") == std::optional<std::string> { "out.tar" });
            expect(inv.opts.at("mode") == std::optional<std::string> { "fast" });

            expect_equal(0, run_cmd({ "shipyard", "test-echo", "--mode", "slow", "x", "y" }));
            expect(inv.args == arguments { "x", "y" });
            expect(!inv.opts.at("output").has_value());
            expect(inv.opts.at("mode") == std::optional<std::string> { "slow" });
        };
        "invalid invocations are rejected before the command runs"_test = [] {
            expect_rejected({ "shipyard" });
            expect_rejected({ "shipyard", "no-such-command" });
            expect_rejected({ "shipyard", "test-echo", "x", "--colour=red" });
            expect_rejected({ "shipyard", "test-echo", "x", "--output" });
            expect_rejected({ "shipyard", "test-echo" });
            expect_rejected({ "shipyard", "test-echo", "x", "y", "z" });
        };
        "a failing command"_test = [] {
            expect_equal(1, run_cmd({ "shipyard", "test-echo", "fail" }));
            expect_equal(size_t { 1 }, last_invocation().runs);
        };
    };
};

/* This file is part of Shipyard project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include <cerrno>
#include "test.hpp"

namespace {
    using namespace shipyard;
}

suite shipyard_common_error_suite = [] {
    "shipyard::common::error"_test = [] {
        "message"_test = [] {
            const error e { "disk is full" };
            expect_equal(std::string_view { "disk is full" }, std::string_view { e.what() });
        };
        "nested"_test = [] {
            const error e { "write failed", std::runtime_error { "no space" } };
            const std::string_view msg { e.what() };
            expect(msg.starts_with("write failed caused by "));
            expect(msg.ends_with(": no space"));
        };
        "errno"_test = [] {
            errno = ENOENT;
            const error_sys e { "open failed" };
            const std::string_view msg { e.what() };
            expect(msg.starts_with("open failed errno: "));
            expect(msg.find(std::strerror(ENOENT)) != std::string_view::npos);
        };
    };
};

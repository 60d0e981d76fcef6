/* This file is part of Shipyard project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include "test.hpp"
#include "file.hpp"

namespace {
    using namespace shipyard;
    using namespace std::string_view_literals;
}

suite shipyard_common_file_suite = [] {
    "shipyard::common::file"_test = [] {
        "write_stream"_test = [] {
            const file::tmp_directory tmp_dir { "test-shipyard-file" };
            const auto path = (tmp_dir.path() / "out.bin").string();
            file::write_stream ws { path };
            ws.write("ab"sv);
            ws.write(""sv);
            ws.write("cd"sv);
            ws.close();
            expect(nothrow([&] { ws.close(); }));
            expect(throws<error>([&] { ws.write("ef"sv); }));
            expect_equal(std::string_view { "abcd" }, file::read(path).str());
        };
        "missing file"_test = [] {
            const file::tmp_directory tmp_dir { "test-shipyard-file" };
            expect(throws<error_sys>([&] { file::read((tmp_dir.path() / "none").string()); }));
            expect(throws<error_sys>([&] { file::write_stream { (tmp_dir.path() / "no-dir" / "x").string() }; }));
        };
        "tmp_directory is removed"_test = [] {
            std::filesystem::path p {};
            {
                const file::tmp_directory tmp_dir { "test-shipyard-file" };
                p = tmp_dir;
                file::write((tmp_dir.path() / "x").string(), "x"sv);
                expect(std::filesystem::exists(p));
            }
            expect(!std::filesystem::exists(p));
        };
    };
};

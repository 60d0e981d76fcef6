#pragma once
/* This file is part of Shipyard project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include <cstdio>
#include <filesystem>
#include <string>
#include <string_view>
#include "bytes.hpp"
#include "error.hpp"
#include "format.hpp"

namespace shipyard::file {
    extern std::string install_path(std::string_view rel_path);
    extern uint8_vector read(const std::string &path);
    extern void write(const std::string &path, buffer data);

    // A thin wrapper around FILE * that reports every failure as an exception.
    struct write_stream {
        explicit write_stream(const std::string &path);
        write_stream(const write_stream &) =delete;
        write_stream &operator=(const write_stream &) =delete;
        ~write_stream();

        void write(buffer data);
        void close();

        [[nodiscard]] const std::string &path() const noexcept
        {
            return _path;
        }
    private:
        std::string _path;
        FILE *_f = nullptr;
    };

    struct tmp_directory {
        explicit tmp_directory(std::string_view name);
        tmp_directory(const tmp_directory &) =delete;
        tmp_directory(tmp_directory &&o) noexcept;
        ~tmp_directory();

        operator std::filesystem::path() const noexcept
        {
            return _path;
        }

        [[nodiscard]] const std::filesystem::path &path() const noexcept
        {
            return _path;
        }
    private:
        std::filesystem::path _path;
    };
}

/* This file is part of Shipyard project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include <array>
#include <atomic>
#include <unistd.h>
#include "file.hpp"

namespace shipyard::file {
    std::string install_path(const std::string_view rel_path)
    {
        // provide a dummy implementation at the moment
        return fmt::format("./{}", rel_path);
    }

    uint8_vector read(const std::string &path)
    {
        FILE *f = fopen(path.c_str(), "rb");
        if (!f) [[unlikely]]
            throw error_sys(fmt::format("failed to open {} for reading", path));
        uint8_vector res {};
        std::array<uint8_t, 0x4000> buf;
        for (;;) {
            const auto n = fread(buf.data(), 1, buf.size(), f);
            res << buffer { buf.data(), n };
            if (n < buf.size())
                break;
        }
        const bool failed = ferror(f) != 0;
        fclose(f);
        if (failed) [[unlikely]]
            throw error(fmt::format("failed to read {}", path));
        return res;
    }

    void write(const std::string &path, const buffer data)
    {
        write_stream ws { path };
        ws.write(data);
        ws.close();
    }

    write_stream::write_stream(const std::string &path):
        _path { path },
        _f { fopen(path.c_str(), "wb") }
    {
        if (!_f) [[unlikely]]
            throw error_sys(fmt::format("failed to open {} for writing", _path));
    }

    write_stream::~write_stream()
    {
        if (_f)
            fclose(_f);
    }

    void write_stream::write(const buffer data)
    {
        if (!_f) [[unlikely]]
            throw error(fmt::format("write to a closed stream {}", _path));
        if (data.empty())
            return;
        if (fwrite(data.data(), 1, data.size(), _f) != data.size()) [[unlikely]]
            throw error_sys(fmt::format("failed to write {} bytes to {}", data.size(), _path));
    }

    void write_stream::close()
    {
        if (!_f)
            return;
        FILE *f = _f;
        _f = nullptr;
        if (fflush(f) != 0) [[unlikely]] {
            const error_sys err { fmt::format("failed to flush {}", _path) };
            fclose(f);
            throw err;
        }
        if (fclose(f) != 0) [[unlikely]]
            throw error_sys(fmt::format("failed to close {}", _path));
    }

    static std::filesystem::path unique_tmp_path(const std::string_view name)
    {
        static std::atomic_size_t counter { 0 };
        return std::filesystem::temp_directory_path() / fmt::format("{}-{}-{}", name, getpid(), counter.fetch_add(1));
    }

    tmp_directory::tmp_directory(const std::string_view name):
        _path { unique_tmp_path(name) }
    {
        std::filesystem::remove_all(_path);
        std::filesystem::create_directories(_path);
    }

    tmp_directory::tmp_directory(tmp_directory &&o) noexcept:
        _path { std::move(o._path) }
    {
        o._path.clear();
    }

    tmp_directory::~tmp_directory()
    {
        if (!_path.empty()) {
            std::error_code ec {};
            std::filesystem::remove_all(_path, ec);
        }
    }
}

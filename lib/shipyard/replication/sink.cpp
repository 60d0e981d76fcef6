/* This file is part of Shipyard project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include "errors.hpp"
#include "sink.hpp"

namespace shipyard::replication {
    file_sink_t::file_sink_t(const std::string &path):
        _os { path }
    {
    }

    void file_sink_t::write(const buffer bytes)
    {
        _os.write(bytes);
    }

    void file_sink_t::close()
    {
        _os.close();
    }

    void memory_sink_t::write(const buffer bytes)
    {
        std::scoped_lock lk { _mutex };
        if (_closed) [[unlikely]]
            throw error("memory_sink_t: write after close!");
        _bytes << bytes;
    }

    void memory_sink_t::close()
    {
        std::scoped_lock lk { _mutex };
        _closed = true;
    }

    uint8_vector memory_sink_t::bytes() const
    {
        std::scoped_lock lk { _mutex };
        return _bytes;
    }

    bool memory_sink_t::closed() const
    {
        std::scoped_lock lk { _mutex };
        return _closed;
    }
}

/* This file is part of Shipyard project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include <shipyard/common/logger.hpp>
#include "stream-adapter.hpp"

namespace shipyard::replication {
    static std::string describe(const std::exception_ptr &ex)
    {
        if (!ex)
            return "no cause";
        try {
            std::rethrow_exception(ex);
        } catch (const std::exception &e) {
            return e.what();
        } catch (...) {
            return "an unknown error";
        }
    }

    stream_to_sink_t::stream_to_sink_t(sink_t &sink):
        _sink { sink }
    {
    }

    bool stream_to_sink_t::on_next(const buffer chunk)
    {
        std::scoped_lock lk { _mutex };
        if (_state == adapter_state_t::closed) {
            logger::warn("stream_to_sink: ignoring a chunk of {} bytes received after the stream was closed", chunk.size());
            return false;
        }
        try {
            _sink.write(chunk);
        } catch (const std::exception &ex) {
            logger::error("stream_to_sink: failed to write a chunk of {} bytes after {} bytes: {}", chunk.size(), _result.bytes, ex.what());
            _close(std::make_exception_ptr(sink_write_error(
                fmt::format("failed to persist a chunk of {} bytes at offset {}", chunk.size(), _result.bytes), ex)));
            return false;
        }
        _result.bytes += chunk.size();
        ++_result.chunks;
        return true;
    }

    void stream_to_sink_t::on_error(std::exception_ptr cause)
    {
        std::scoped_lock lk { _mutex };
        if (_state == adapter_state_t::closed) {
            logger::debug("stream_to_sink: ignoring an error after the stream was closed: {}", describe(cause));
            return;
        }
        logger::error("stream_to_sink: the stream failed after {} bytes: {}", _result.bytes, describe(cause));
        _close(std::make_exception_ptr(transfer_error(
            fmt::format("the transfer failed after {} bytes in {} chunks: {}", _result.bytes, _result.chunks, describe(cause)))));
    }

    void stream_to_sink_t::on_completed()
    {
        std::scoped_lock lk { _mutex };
        if (_state == adapter_state_t::closed) {
            logger::debug("stream_to_sink: ignoring a completion after the stream was closed");
            return;
        }
        logger::debug("stream_to_sink: the stream completed with {} bytes in {} chunks", _result.bytes, _result.chunks);
        _close({});
    }

    download_result_t stream_to_sink_t::wait()
    {
        std::unique_lock lk { _mutex };
        _closed_cv.wait(lk, [&] { return _state == adapter_state_t::closed; });
        if (_failure)
            std::rethrow_exception(_failure);
        return _result;
    }

    adapter_state_t stream_to_sink_t::state() const
    {
        std::scoped_lock lk { _mutex };
        return _state;
    }

    void stream_to_sink_t::_close(std::exception_ptr failure)
    {
        _state = adapter_state_t::closed;
        try {
            _sink.close();
        } catch (const std::exception &ex) {
            logger::error("stream_to_sink: failed to close the sink: {}", ex.what());
            // the first failure is the one worth reporting
            if (!failure)
                failure = std::make_exception_ptr(sink_write_error("failed to close the sink", ex));
        }
        _failure = std::move(failure);
        _closed_cv.notify_all();
    }
}

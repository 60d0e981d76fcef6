/* This file is part of Shipyard project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include <shipyard/common/logger.hpp>
#include "stream-request.hpp"

namespace shipyard::replication::quic {
    stream_request_t::stream_request_t(const download_request_t &r, stream_observer_ptr_t o, const size_t max_frame_size):
        _req { r },
        _observer { std::move(o) },
        _decoder { max_frame_size }
    {
        if (!_observer) [[unlikely]]
            throw error(fmt::format("{}: the observer must not be nullptr", _req));
    }

    bool stream_request_t::on_receive(const buffer bytes)
    {
        std::unique_lock lk { _mutex };
        if (_terminated)
            return false;
        try {
            if (!_decoder.feed(bytes, [&](const buffer chunk) { return _observer->on_next(chunk); })) {
                _terminated = true;
                logger::warn("{}: the receiver stopped accepting data, cancelling the stream", _req);
                return false;
            }
            return true;
        } catch (const std::exception &) {
            _terminated = true;
            lk.unlock();
            _observer->on_error(std::current_exception());
            return false;
        }
    }

    void stream_request_t::on_peer_finished()
    {
        std::unique_lock lk { _mutex };
        if (_terminated)
            return;
        _terminated = true;
        try {
            _decoder.finish();
        } catch (const std::exception &) {
            lk.unlock();
            _observer->on_error(std::current_exception());
            return;
        }
        lk.unlock();
        logger::debug("{}: the peer completed the stream", _req);
        _observer->on_completed();
    }

    void stream_request_t::on_peer_aborted(const uint64_t error_code)
    {
        fail(std::make_exception_ptr(transfer_error(fmt::format("{}: the peer aborted the stream with error code {}", _req, error_code))));
    }

    void stream_request_t::on_closed(const bool connection_shutdown)
    {
        if (terminated())
            return;
        fail(std::make_exception_ptr(transfer_error(connection_shutdown
            ? fmt::format("{}: the connection was shut down before the transfer completed", _req)
            : fmt::format("{}: the stream was closed before the transfer completed", _req))));
    }

    void stream_request_t::fail(std::exception_ptr cause)
    {
        std::unique_lock lk { _mutex };
        if (_terminated)
            return;
        _terminated = true;
        lk.unlock();
        _observer->on_error(std::move(cause));
    }

    bool stream_request_t::terminated() const
    {
        std::scoped_lock lk { _mutex };
        return _terminated;
    }
}

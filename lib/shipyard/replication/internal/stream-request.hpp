#pragma once
/* This file is part of Shipyard project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include <memory>
#include <mutex>
#include "../channel.hpp"
#include "../protocol.hpp"

namespace shipyard::replication::quic {
    // The state of one download stream. The transport translates its stream events into these calls.
    // The observer receives exactly one terminal signal whatever the order of the events.
    struct stream_request_t {
        stream_request_t(const download_request_t &r, stream_observer_ptr_t o, size_t max_frame_size);

        // returns false when the stream must be aborted
        bool on_receive(buffer bytes);
        // the peer sent FIN
        void on_peer_finished();
        void on_peer_aborted(uint64_t error_code);
        // the stream is gone; fails the request unless it has already terminated
        void on_closed(bool connection_shutdown);
        void fail(std::exception_ptr cause);

        [[nodiscard]] const download_request_t &request() const noexcept
        {
            return _req;
        }

        [[nodiscard]] bool terminated() const;

        // keeps the request alive while the transport holds only a raw pointer to it
        std::shared_ptr<stream_request_t> self {};
    private:
        mutable std::mutex _mutex alignas(64U) {};
        const download_request_t _req;
        const stream_observer_ptr_t _observer;
        frame_decoder_t _decoder;
        bool _terminated = false;
    };
}

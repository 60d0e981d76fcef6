#pragma once
/* This file is part of Shipyard project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include <chrono>
#include <exception>
#include <memory>
#include "config.hpp"
#include "protocol.hpp"

namespace shipyard::replication {
    // Receives the response of one streaming request. Calls arrive on transport threads.
    struct stream_observer_t {
        virtual ~stream_observer_t() =default;
        // returns false when no more data is accepted; the transport then cancels the stream
        [[nodiscard]] virtual bool on_next(buffer chunk) =0;
        virtual void on_error(std::exception_ptr cause) =0;
        virtual void on_completed() =0;
    };
    using stream_observer_ptr_t = std::shared_ptr<stream_observer_t>;

    // A connection to a single peer able to carry multiple sequential streaming requests.
    struct channel_t {
        virtual ~channel_t() =default;

        // Hands the request to the transport and returns without waiting for the response.
        // The observer gets the chunks followed by a terminal signal. If this throws, the
        // observer may have been signalled already and must tolerate the caller reporting the error too.
        virtual void download(const download_request_t &req, stream_observer_ptr_t obs) =0;

        // Tears down all streams and waits up to grace for the transport to release its resources.
        // Throws shutdown_error on a timeout. Repeated calls are no-ops.
        virtual void shutdown(std::chrono::milliseconds grace) =0;
    };
    using channel_ptr_t = std::unique_ptr<channel_t>;

    // Validates the configuration and the TLS material before any network I/O.
    // Throws configuration_error or tls_setup_error.
    [[nodiscard]] extern channel_ptr_t make_channel(const transport_config_t &cfg);
}

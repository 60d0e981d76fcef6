#pragma once
/* This file is part of Shipyard project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include <condition_variable>
#include <mutex>
#include "channel.hpp"
#include "sink.hpp"

namespace shipyard::replication {
    struct download_result_t {
        uint64_t bytes = 0;
        uint64_t chunks = 0;

        bool operator==(const download_result_t &) const =default;
    };

    enum class adapter_state_t: uint8_t {
        open,
        closed
    };

    // Drains one response stream into a sink. The sink is closed exactly once: on completion,
    // on a stream error, or on the first failed write, whichever comes first.
    struct stream_to_sink_t: stream_observer_t {
        explicit stream_to_sink_t(sink_t &sink);

        bool on_next(buffer chunk) override;
        void on_error(std::exception_ptr cause) override;
        void on_completed() override;

        // blocks until the stream reaches a terminal state; rethrows transfer_error or sink_write_error
        download_result_t wait();

        [[nodiscard]] adapter_state_t state() const;
    private:
        // must be called with _mutex held
        void _close(std::exception_ptr failure);

        mutable std::mutex _mutex alignas(64U) {};
        std::condition_variable _closed_cv {};
        sink_t &_sink;
        adapter_state_t _state = adapter_state_t::open;
        download_result_t _result {};
        std::exception_ptr _failure {};
    };
}

namespace fmt {
    template<>
    struct formatter<shipyard::replication::download_result_t>: formatter<int> {
        template<typename FormatContext>
        auto format(const shipyard::replication::download_result_t &r, FormatContext &ctx) const -> decltype(ctx.out())
        {
            return fmt::format_to(ctx.out(), "bytes: {} chunks: {}", r.bytes, r.chunks);
        }
    };
}

#pragma once
/* This file is part of Shipyard project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include <chrono>
#include <filesystem>
#include <memory>
#include "channel.hpp"
#include "sink.hpp"
#include "stream-adapter.hpp"

namespace shipyard::replication {
    // Fetches containers from a single peer over one channel. One download at a time.
    struct client_t {
        // throws configuration_error or tls_setup_error
        explicit client_t(const transport_config_t &cfg);
        explicit client_t(channel_ptr_t channel, std::filesystem::path working_dir=".",
            std::chrono::milliseconds shutdown_grace=default_shutdown_grace);
        ~client_t();

        // Blocks until the peer completes the stream. The sink is closed exactly once before this returns
        // or throws, busy_error included.
        // Throws transfer_error, sink_write_error or busy_error.
        download_result_t download(uint64_t container_id, sink_t &sink);

        // Downloads into <working_dir>/container-<id>.tar and removes the partial file on failure.
        std::filesystem::path download(uint64_t container_id);

        // Downloads into path. A file that can't be opened is left untouched, a partial download is removed.
        std::filesystem::path download(uint64_t container_id, const std::filesystem::path &path);

        // Idempotent. Fails the in-flight download with transfer_error.
        void shutdown() noexcept;
    private:
        struct impl_t;
        std::unique_ptr<impl_t> _impl;
    };
}

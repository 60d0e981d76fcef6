/* This file is part of Shipyard project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include <atomic>
#include <mutex>
#include <shipyard/common/logger.hpp>
#include <shipyard/common/scope-exit.hpp>
#include "client.hpp"

namespace shipyard::replication {
    struct client_t::impl_t {
        impl_t(channel_ptr_t channel, std::filesystem::path working_dir, const std::chrono::milliseconds shutdown_grace):
            _channel { std::move(channel) },
            _working_dir { std::move(working_dir) },
            _shutdown_grace { shutdown_grace }
        {
            if (!_channel) [[unlikely]]
                throw configuration_error("the replication client requires a channel");
        }

        ~impl_t()
        {
            shutdown();
        }

        download_result_t download(const uint64_t container_id, sink_t &sink)
        {
            const auto busy = _acquire(container_id, &sink);
            return _download(container_id, sink);
        }

        std::filesystem::path download(const uint64_t container_id)
        {
            const auto busy = _acquire(container_id);
            try {
                std::filesystem::create_directories(_working_dir);
            } catch (const std::exception &ex) {
                throw sink_write_error(fmt::format("container {}: failed to create {}", container_id, _working_dir.string()), ex);
            }
            return _download_file(container_id, _working_dir / fmt::format("container-{}.tar", container_id));
        }

        std::filesystem::path download(const uint64_t container_id, const std::filesystem::path &path)
        {
            const auto busy = _acquire(container_id);
            return _download_file(container_id, path);
        }

        void shutdown() noexcept
        {
            channel_ptr_t channel {};
            {
                std::scoped_lock lk { _mutex };
                std::swap(channel, _channel);
            }
            if (!channel)
                return;
            logger::run_log_errors([&] {
                channel->shutdown(_shutdown_grace);
            }, [&] {
                channel.reset();
            });
            logger::info("replication client: shut down");
        }
    private:
        std::mutex _mutex alignas(64U) {};
        channel_ptr_t _channel;
        const std::filesystem::path _working_dir;
        const std::chrono::milliseconds _shutdown_grace;
        std::atomic_bool _busy { false };

        // a file that can't be opened is left untouched, a partial download is removed
        std::filesystem::path _download_file(const uint64_t container_id, const std::filesystem::path &path)
        {
            std::unique_ptr<file_sink_t> sink {};
            try {
                sink = std::make_unique<file_sink_t>(path.string());
            } catch (const std::exception &ex) {
                throw sink_write_error(fmt::format("container {}: failed to create {}", container_id, path.string()), ex);
            }
            try {
                _download(container_id, *sink);
            } catch (const std::exception &) {
                std::error_code ec {};
                std::filesystem::remove(path, ec);
                if (ec)
                    logger::warn("container {}: failed to remove the partial download {}: {}", container_id, path.string(), ec.message());
                throw;
            }
            return path;
        }

        // a rejected caller's sink is closed before busy_error is thrown
        [[nodiscard]] scope_exit _acquire(const uint64_t container_id, sink_t *sink=nullptr)
        {
            if (_busy.exchange(true)) [[unlikely]] {
                if (sink)
                    logger::run_log_errors([&] { sink->close(); });
                throw busy_error(fmt::format("container {}: another download is in flight on this client", container_id));
            }
            return scope_exit { [this] { _busy = false; } };
        }

        download_result_t _download(const uint64_t container_id, sink_t &sink)
        {
            const download_request_t req { container_id };
            const auto adapter = std::make_shared<stream_to_sink_t>(sink);
            {
                std::scoped_lock lk { _mutex };
                if (!_channel) {
                    adapter->on_error(std::make_exception_ptr(transfer_error("the client has been shut down")));
                } else {
                    logger::info("{}: started", req);
                    try {
                        _channel->download(req, adapter);
                    } catch (const std::exception &) {
                        adapter->on_error(std::current_exception());
                    }
                }
            }
            const auto res = adapter->wait();
            logger::info("{}: completed with {} bytes in {} chunks", req, res.bytes, res.chunks);
            return res;
        }
    };

    client_t::client_t(const transport_config_t &cfg):
        client_t { make_channel(cfg), cfg.working_dir, cfg.shutdown_grace }
    {
    }

    client_t::client_t(channel_ptr_t channel, std::filesystem::path working_dir, const std::chrono::milliseconds shutdown_grace):
        _impl { std::make_unique<impl_t>(std::move(channel), std::move(working_dir), shutdown_grace) }
    {
    }

    client_t::~client_t() =default;

    download_result_t client_t::download(const uint64_t container_id, sink_t &sink)
    {
        return _impl->download(container_id, sink);
    }

    std::filesystem::path client_t::download(const uint64_t container_id)
    {
        return _impl->download(container_id);
    }

    std::filesystem::path client_t::download(const uint64_t container_id, const std::filesystem::path &path)
    {
        return _impl->download(container_id, path);
    }

    void client_t::shutdown() noexcept
    {
        _impl->shutdown();
    }
}

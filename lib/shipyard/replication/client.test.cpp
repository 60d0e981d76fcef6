/* This file is part of Shipyard project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include <condition_variable>
#include <mutex>
#include <thread>
#include <vector>
#include <shipyard/common/test.hpp>
#include "client.hpp"

namespace {
    using namespace shipyard;
    using namespace shipyard::replication;
    using namespace std::string_view_literals;

    enum class ending_t { completed, failed, hang };

    struct script_t {
        std::vector<std::string> chunks {};
        ending_t ending = ending_t::completed;
    };

    struct channel_stats_t {
        std::vector<download_request_t> requests {};
        size_t shutdowns = 0;
        bool cancelled = false;
    };

    // Plays a script on a separate thread like a transport delivering stream events.
    struct scripted_channel_t: channel_t {
        scripted_channel_t(script_t script, std::shared_ptr<channel_stats_t> stats):
            _script { std::move(script) },
            _stats { std::move(stats) }
        {
        }

        ~scripted_channel_t() override
        {
            _release_hanging();
            for (auto &t: _threads)
                t.join();
        }

        void download(const download_request_t &req, stream_observer_ptr_t obs) override
        {
            _stats->requests.emplace_back(req);
            _threads.emplace_back([this, obs] {
                for (const auto &chunk: _script.chunks) {
                    if (!obs->on_next(chunk)) {
                        _stats->cancelled = true;
                        return;
                    }
                }
                switch (_script.ending) {
                    case ending_t::completed:
                        obs->on_completed();
                        break;
                    case ending_t::failed:
                        obs->on_error(std::make_exception_ptr(error("connection reset by peer")));
                        break;
                    case ending_t::hang: {
                        std::unique_lock lk { _mutex };
                        _hanging_cv.wait(lk, [&] { return _released; });
                        obs->on_error(std::make_exception_ptr(error("the connection was shut down")));
                        break;
                    }
                }
            });
        }

        void shutdown(std::chrono::milliseconds) override
        {
            ++_stats->shutdowns;
            _release_hanging();
        }
    private:
        script_t _script;
        std::shared_ptr<channel_stats_t> _stats;
        std::vector<std::thread> _threads {};
        std::mutex _mutex {};
        std::condition_variable _hanging_cv {};
        bool _released = false;

        void _release_hanging()
        {
            {
                std::scoped_lock lk { _mutex };
                _released = true;
            }
            _hanging_cv.notify_all();
        }
    };

    struct throwing_channel_t: channel_t {
        void download(const download_request_t &, stream_observer_ptr_t) override
        {
            throw transfer_error("failed to open a stream");
        }

        void shutdown(std::chrono::milliseconds) override
        {
            throw shutdown_error("the connection did not close in time");
        }
    };

    struct counting_sink_t: memory_sink_t {
        size_t closes = 0;

        void close() override
        {
            ++closes;
            memory_sink_t::close();
        }
    };

    struct failing_sink_t: memory_sink_t {
        void write(const buffer bytes) override
        {
            if (!this->bytes().empty())
                throw error("disk is full");
            memory_sink_t::write(bytes);
        }
    };

    client_t make_client(script_t script, std::shared_ptr<channel_stats_t> stats, const std::filesystem::path &working_dir=".")
    {
        return client_t { std::make_unique<scripted_channel_t>(std::move(script), std::move(stats)), working_dir };
    }
}

suite shipyard_replication_client_suite = [] {
    "shipyard::replication::client"_test = [] {
        "successful download"_test = [] {
            const auto stats = std::make_shared<channel_stats_t>();
            auto client = make_client({ { "ab", "cd", "ef" } }, stats);
            counting_sink_t sink {};
            const auto res = client.download(42, sink);
            expect_equal(download_result_t { 6, 3 }, res);
            expect_equal(std::string_view { "abcdef" }, sink.bytes().str());
            expect_equal(size_t { 1 }, sink.closes);
            expect(fatal(stats->requests.size() == 1U));
            expect(stats->requests[0] == download_request_t { 42, 0, -1 });
        };
        "transfer error keeps the received prefix"_test = [] {
            const auto stats = std::make_shared<channel_stats_t>();
            auto client = make_client({ { "ab" }, ending_t::failed }, stats);
            counting_sink_t sink {};
            expect(throws<transfer_error>([&] { client.download(7, sink); }));
            expect_equal(std::string_view { "ab" }, sink.bytes().str());
            expect_equal(size_t { 1 }, sink.closes);
        };
        "a sink write failure cancels the stream"_test = [] {
            const auto stats = std::make_shared<channel_stats_t>();
            auto client = make_client({ { "ab", "cd", "ef" } }, stats);
            failing_sink_t sink {};
            expect(throws<sink_write_error>([&] { client.download(7, sink); }));
            expect(sink.closed());
            expect_equal(std::string_view { "ab" }, sink.bytes().str());
            client.shutdown();
            expect(stats->cancelled);
        };
        "a channel failure is reported as transfer_error"_test = [] {
            client_t client { std::make_unique<throwing_channel_t>() };
            counting_sink_t sink {};
            expect(throws<transfer_error>([&] { client.download(1, sink); }));
            expect_equal(size_t { 1 }, sink.closes);
            expect(nothrow([&] { client.shutdown(); }));
        };
        "concurrent download is rejected"_test = [] {
            const auto stats = std::make_shared<channel_stats_t>();
            auto client = make_client({ { "ab" }, ending_t::hang }, stats);
            counting_sink_t first_sink {};
            std::exception_ptr first_failure {};
            std::thread first { [&] {
                try {
                    client.download(1, first_sink);
                } catch (const std::exception &) {
                    first_failure = std::current_exception();
                }
            } };
            while (first_sink.bytes().empty())
                std::this_thread::sleep_for(std::chrono::milliseconds { 1 });
            counting_sink_t second_sink {};
            expect(throws<busy_error>([&] { client.download(2, second_sink); }));
            expect_equal(size_t { 1 }, second_sink.closes);
            expect(second_sink.bytes().empty());
            client.shutdown();
            first.join();
            expect(fatal(first_failure != nullptr));
            expect(throws<transfer_error>([&] { std::rethrow_exception(first_failure); }));
            expect_equal(size_t { 1 }, first_sink.closes);
            expect_equal(size_t { 1 }, stats->requests.size());
        };
        "shutdown is idempotent"_test = [] {
            const auto stats = std::make_shared<channel_stats_t>();
            auto client = make_client({ { "ab" } }, stats);
            client.shutdown();
            client.shutdown();
            expect_equal(size_t { 1 }, stats->shutdowns);
        };
        "shutdown failures are not propagated"_test = [] {
            client_t client { std::make_unique<throwing_channel_t>() };
            expect(nothrow([&] { client.shutdown(); }));
            expect(nothrow([&] { client.shutdown(); }));
        };
        "download after shutdown"_test = [] {
            const auto stats = std::make_shared<channel_stats_t>();
            auto client = make_client({ { "ab" } }, stats);
            client.shutdown();
            counting_sink_t sink {};
            expect(throws<transfer_error>([&] { client.download(3, sink); }));
            expect_equal(size_t { 1 }, sink.closes);
            expect(stats->requests.empty());
        };
        "download into the working directory"_test = [] {
            const file::tmp_directory tmp_dir { "test-shipyard-client" };
            const auto stats = std::make_shared<channel_stats_t>();
            auto client = make_client({ { "ab", "cd" } }, stats, tmp_dir.path() / "containers");
            const auto path = client.download(5);
            expect(path == tmp_dir.path() / "containers" / "container-5.tar");
            expect_equal(std::string_view { "abcd" }, file::read(path.string()).str());
        };
        "a failed download removes the partial file"_test = [] {
            const file::tmp_directory tmp_dir { "test-shipyard-client" };
            const auto stats = std::make_shared<channel_stats_t>();
            auto client = make_client({ { "ab" }, ending_t::failed }, stats, tmp_dir.path());
            expect(throws<transfer_error>([&] { client.download(6); }));
            expect(!std::filesystem::exists(tmp_dir.path() / "container-6.tar"));
        };
        "download into a given path"_test = [] {
            const file::tmp_directory tmp_dir { "test-shipyard-client" };
            const auto stats = std::make_shared<channel_stats_t>();
            auto client = make_client({ { "ab", "cd" } }, stats);
            const auto out_path = tmp_dir.path() / "out.tar";
            expect(client.download(8, out_path) == out_path);
            expect_equal(std::string_view { "abcd" }, file::read(out_path.string()).str());
        };
        "a path that can't be opened is left untouched"_test = [] {
            const file::tmp_directory tmp_dir { "test-shipyard-client" };
            const auto stats = std::make_shared<channel_stats_t>();
            auto client = make_client({ { "ab" } }, stats);
            const auto out_path = tmp_dir.path() / "existing";
            std::filesystem::create_directories(out_path);
            expect(throws<sink_write_error>([&] { client.download(9, out_path); }));
            expect(std::filesystem::is_directory(out_path));
            expect(stats->requests.empty());
        };
        "the client requires a channel"_test = [] {
            expect(throws<configuration_error>([] { client_t { channel_ptr_t {} }; }));
        };
        "the factory validates the configuration before any I/O"_test = [] {
            const file::tmp_directory tmp_dir { "test-shipyard-client" };
            transport_config_t cfg {
                .peer = { "127.0.0.1", 9870 },
                .security = {
                    .enabled = true,
                    .client_cert_path = (tmp_dir.path() / "missing.cert").string(),
                    .client_key_path = (tmp_dir.path() / "missing.key").string()
                }
            };
            expect(throws<configuration_error>([&] { client_t { cfg }; }));
            const auto garbage_path = (tmp_dir.path() / "garbage.pem").string();
            file::write(garbage_path, "garbage"sv);
            cfg.security.client_cert_path = garbage_path;
            cfg.security.client_key_path = garbage_path;
            expect(throws<tls_setup_error>([&] { client_t { cfg }; }));
        };
        "the factory rejects a host name with the test authority override"_test = [] {
            const file::tmp_directory tmp_dir { "test-shipyard-client" };
            const auto cert_path = (tmp_dir.path() / "client.cert").string();
            const auto key_path = (tmp_dir.path() / "client.key").string();
            file::write(cert_path, "cert"sv);
            file::write(key_path, "key"sv);
            const transport_config_t cfg {
                .peer = { "peer.example", 9870 },
                .security = {
                    .enabled = true,
                    .client_cert_path = cert_path,
                    .client_key_path = key_path,
                    .test_authority_override = true
                },
                .environment = environment_t::test
            };
            expect(throws<configuration_error>([&] { client_t { cfg }; }));
        };
    };
};

/* This file is part of Shipyard project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include <optional>
#include <thread>
#include <shipyard/common/test.hpp>
#include "stream-adapter.hpp"

namespace {
    using namespace shipyard;
    using namespace shipyard::replication;
    using namespace std::string_view_literals;

    struct counting_sink_t: sink_t {
        std::string data {};
        size_t writes = 0;
        size_t closes = 0;
        // the write with this index fails
        std::optional<size_t> fail_write {};
        bool fail_close = false;

        void write(const buffer bytes) override
        {
            if (fail_write && *fail_write == writes)
                throw error("disk is full");
            ++writes;
            data += static_cast<std::string_view>(bytes);
        }

        void close() override
        {
            ++closes;
            if (fail_close)
                throw error("flush failed");
        }
    };

    std::exception_ptr cause(const std::string_view msg)
    {
        return std::make_exception_ptr(error(msg));
    }
}

suite shipyard_replication_stream_adapter_suite = [] {
    "shipyard::replication::stream_to_sink"_test = [] {
        "chunks then completion"_test = [] {
            counting_sink_t sink {};
            stream_to_sink_t adapter { sink };
            expect(adapter.state() == adapter_state_t::open);
            expect(adapter.on_next("ab"sv));
            expect(adapter.on_next("cd"sv));
            expect(adapter.on_next("ef"sv));
            expect_equal(size_t { 0 }, sink.closes);
            adapter.on_completed();
            expect(adapter.state() == adapter_state_t::closed);
            expect_equal(std::string { "abcdef" }, sink.data);
            expect_equal(size_t { 1 }, sink.closes);
            expect_equal(download_result_t { 6, 3 }, adapter.wait());
        };
        "empty stream"_test = [] {
            counting_sink_t sink {};
            stream_to_sink_t adapter { sink };
            adapter.on_completed();
            expect_equal(download_result_t { 0, 0 }, adapter.wait());
            expect_equal(size_t { 1 }, sink.closes);
        };
        "error after a chunk"_test = [] {
            counting_sink_t sink {};
            stream_to_sink_t adapter { sink };
            expect(adapter.on_next("ab"sv));
            adapter.on_error(cause("connection reset"));
            expect(!adapter.on_next("cd"sv));
            expect_equal(std::string { "ab" }, sink.data);
            expect_equal(size_t { 1 }, sink.closes);
            expect(throws<transfer_error>([&] { adapter.wait(); }));
        };
        "signals after a terminal one are ignored"_test = [] {
            counting_sink_t sink {};
            stream_to_sink_t adapter { sink };
            adapter.on_completed();
            adapter.on_completed();
            adapter.on_error(cause("late"));
            expect_equal(size_t { 1 }, sink.closes);
            expect(nothrow([&] { adapter.wait(); }));

            counting_sink_t sink2 {};
            stream_to_sink_t adapter2 { sink2 };
            adapter2.on_error(cause("first"));
            adapter2.on_error(cause("second"));
            adapter2.on_completed();
            expect_equal(size_t { 1 }, sink2.closes);
            try {
                adapter2.wait();
                expect(false);
            } catch (const transfer_error &ex) {
                expect(std::string_view { ex.what() }.find("first") != std::string_view::npos);
            }
        };
        "write failure closes the sink and stops the stream"_test = [] {
            counting_sink_t sink {};
            sink.fail_write = 1;
            stream_to_sink_t adapter { sink };
            expect(adapter.on_next("ab"sv));
            expect(!adapter.on_next("cd"sv));
            expect(adapter.state() == adapter_state_t::closed);
            expect(!adapter.on_next("ef"sv));
            adapter.on_completed();
            expect_equal(std::string { "ab" }, sink.data);
            expect_equal(size_t { 1 }, sink.closes);
            expect(throws<sink_write_error>([&] { adapter.wait(); }));
        };
        "close failure after completion"_test = [] {
            counting_sink_t sink {};
            sink.fail_close = true;
            stream_to_sink_t adapter { sink };
            expect(adapter.on_next("ab"sv));
            adapter.on_completed();
            expect_equal(size_t { 1 }, sink.closes);
            expect(throws<sink_write_error>([&] { adapter.wait(); }));
        };
        "close failure does not mask a transfer error"_test = [] {
            counting_sink_t sink {};
            sink.fail_close = true;
            stream_to_sink_t adapter { sink };
            adapter.on_error(cause("peer aborted"));
            expect(throws<transfer_error>([&] { adapter.wait(); }));
        };
        "wait blocks until a signal from another thread"_test = [] {
            memory_sink_t sink {};
            stream_to_sink_t adapter { sink };
            std::thread producer { [&] {
                for (const auto chunk: { "ab"sv, "cd"sv, "ef"sv })
                    expect(adapter.on_next(chunk));
                adapter.on_completed();
            } };
            const auto res = adapter.wait();
            producer.join();
            expect_equal(download_result_t { 6, 3 }, res);
            expect_equal(std::string_view { "abcdef" }, sink.bytes().str());
            expect(sink.closed());
        };
    };
};

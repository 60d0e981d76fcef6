#pragma once
/* This file is part of Shipyard project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include <functional>
#include <shipyard/common/bytes.hpp>

namespace shipyard::replication {
    enum class request_kind_t: uint8_t {
        download_container = 1
    };

    struct download_request_t {
        // a length of whole_container asks the peer to stream until it signals completion
        static constexpr int64_t whole_container = -1;

        uint64_t container_id;
        int64_t offset = 0;
        int64_t length = whole_container;

        // kind:u8 len:u32 container_id:u64 offset:i64 length:i64, all little-endian
        [[nodiscard]] uint8_vector encode() const;
        [[nodiscard]] static download_request_t decode(buffer bytes);

        bool operator==(const download_request_t &) const =default;
    };

    // Reassembles length-prefixed response frames (len:u32 bytes[len]) from arbitrarily split receive buffers.
    struct frame_decoder_t {
        using observer_t = std::function<bool(buffer)>;

        explicit frame_decoder_t(size_t max_frame_size);

        // Passes every completed frame to obs in order; stops early and returns false as soon as obs does.
        // Throws transfer_error when a frame announces more than max_frame_size bytes.
        bool feed(buffer bytes, const observer_t &obs);

        // throws transfer_error if the stream ended inside a frame
        void finish() const;

        [[nodiscard]] size_t buffered() const noexcept
        {
            return _buf.size();
        }
    private:
        static constexpr size_t header_size = sizeof(uint32_t);

        size_t _max_frame_size;
        uint8_vector _buf {};
    };
}

namespace fmt {
    template<>
    struct formatter<shipyard::replication::download_request_t>: formatter<int> {
        template<typename FormatContext>
        auto format(const shipyard::replication::download_request_t &r, FormatContext &ctx) const -> decltype(ctx.out())
        {
            return fmt::format_to(ctx.out(), "download(container: {} offset: {} length: {})", r.container_id, r.offset, r.length);
        }
    };
}

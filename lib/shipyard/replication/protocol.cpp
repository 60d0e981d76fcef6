/* This file is part of Shipyard project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include "errors.hpp"
#include "protocol.hpp"

namespace shipyard::replication {
    static constexpr size_t request_body_size = sizeof(uint64_t) + sizeof(int64_t) + sizeof(int64_t);
    static constexpr size_t request_header_size = sizeof(uint8_t) + sizeof(uint32_t);

    uint8_vector download_request_t::encode() const
    {
        static_assert(std::endian::native == std::endian::little);
        uint8_vector res {};
        res.reserve(request_header_size + request_body_size);
        res << static_cast<uint8_t>(request_kind_t::download_container);
        const uint32_t body_size = request_body_size;
        res << buffer::from(body_size);
        res << buffer::from(container_id);
        res << buffer::from(offset);
        res << buffer::from(length);
        return res;
    }

    download_request_t download_request_t::decode(const buffer bytes)
    {
        if (bytes.size() != request_header_size + request_body_size) [[unlikely]]
            throw error(fmt::format("a download request must have {} bytes but got {}", request_header_size + request_body_size, bytes.size()));
        if (const auto kind = bytes[0]; kind != static_cast<uint8_t>(request_kind_t::download_container)) [[unlikely]]
            throw error(fmt::format("unsupported request kind: {}", kind));
        if (const auto body_size = bytes.load<uint32_t>(1); body_size != request_body_size) [[unlikely]]
            throw error(fmt::format("unexpected download request body size: {}", body_size));
        return {
            bytes.load<uint64_t>(request_header_size),
            bytes.load<int64_t>(request_header_size + 8),
            bytes.load<int64_t>(request_header_size + 16)
        };
    }

    frame_decoder_t::frame_decoder_t(const size_t max_frame_size):
        _max_frame_size { max_frame_size }
    {
    }

    bool frame_decoder_t::feed(const buffer bytes, const observer_t &obs)
    {
        _buf << bytes;
        size_t off = 0;
        bool keep_going = true;
        while (keep_going && _buf.size() - off >= header_size) {
            const auto frame_size = static_cast<buffer>(_buf).load<uint32_t>(off);
            if (frame_size > _max_frame_size) [[unlikely]]
                throw transfer_error(fmt::format("an inbound frame of {} bytes exceeds the limit of {} bytes", frame_size, _max_frame_size));
            if (_buf.size() - off - header_size < frame_size)
                break;
            keep_going = obs(buffer { _buf.data() + off + header_size, frame_size });
            off += header_size + frame_size;
        }
        _buf.erase(_buf.begin(), _buf.begin() + static_cast<std::ptrdiff_t>(off));
        return keep_going;
    }

    void frame_decoder_t::finish() const
    {
        if (!_buf.empty()) [[unlikely]]
            throw transfer_error(fmt::format("the stream ended inside a frame with {} bytes pending", _buf.size()));
    }
}

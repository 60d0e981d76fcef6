#pragma once
/* This file is part of Shipyard project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include <memory>
#include <mutex>
#include <shipyard/common/bytes.hpp>
#include <shipyard/common/file.hpp>

namespace shipyard::replication {
    // A sequential byte destination. Implementations may throw from write and close.
    struct sink_t {
        virtual ~sink_t() =default;
        virtual void write(buffer bytes) =0;
        virtual void close() =0;
    };

    struct file_sink_t: sink_t {
        explicit file_sink_t(const std::string &path);
        void write(buffer bytes) override;
        void close() override;

        [[nodiscard]] const std::string &path() const noexcept
        {
            return _os.path();
        }
    private:
        file::write_stream _os;
    };

    // A staging buffer kept in memory until the storage layer ingests it.
    struct memory_sink_t: sink_t {
        void write(buffer bytes) override;
        void close() override;

        [[nodiscard]] uint8_vector bytes() const;
        [[nodiscard]] bool closed() const;
    private:
        mutable std::mutex _mutex alignas(64U) {};
        uint8_vector _bytes {};
        bool _closed = false;
    };
}

#pragma once
/* This file is part of Shipyard project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <boost/json/fwd.hpp>
#include <shipyard/common/format.hpp>
#include "errors.hpp"

namespace shipyard::replication {
    // The largest container chunk a peer emits plus headroom for the framing.
    static constexpr size_t default_max_inbound_message_size = (32ULL << 20U) + (1ULL << 20U);
    static constexpr std::chrono::milliseconds default_shutdown_grace { 5000 };
    static constexpr std::chrono::milliseconds default_connect_timeout { 5000 };
    static constexpr std::string_view default_alpn = "shipyard-repl/1";
    static constexpr std::string_view default_app_name = "shipyard";
    // the peer name verified in place of the configured host when the test override is active
    static constexpr std::string_view test_authority = "localhost";

    struct address_t {
        std::string host;
        uint16_t port;
    };

    enum class environment_t: uint8_t {
        production = 0,
        test = 1
    };

    struct security_config_t {
        bool enabled = false;
        std::string client_cert_path {};
        std::string client_key_path {};
        // the system trust store is used when not set
        std::optional<std::string> trust_anchor_path {};
        // the peer is expected to demand the client certificate; it is presented either way
        bool require_client_auth = true;
        // test environments only: connect to the IP literal in host and verify the peer as test_authority
        bool test_authority_override = false;
    };

    struct transport_config_t {
        address_t peer;
        security_config_t security {};
        environment_t environment = environment_t::production;
        std::filesystem::path working_dir { "." };
        size_t max_inbound_message_size = default_max_inbound_message_size;
        std::chrono::milliseconds shutdown_grace = default_shutdown_grace;
        std::chrono::milliseconds connect_timeout = default_connect_timeout;
        std::string app_name { default_app_name };
        std::string alpn { default_alpn };

        static transport_config_t from_json(const boost::json::value &jv);

        // throws configuration_error; touches only the local file system
        void validate() const;
    };

    [[nodiscard]] extern transport_config_t load_transport_config(const std::string &path);
}

namespace fmt {
    template<>
    struct formatter<shipyard::replication::address_t>: formatter<int> {
        template<typename FormatContext>
        auto format(const shipyard::replication::address_t &a, FormatContext &ctx) const -> decltype(ctx.out())
        {
            if (a.host.find(':') != std::string::npos)
                return fmt::format_to(ctx.out(), "[{}]:{}", a.host, a.port);
            return fmt::format_to(ctx.out(), "{}:{}", a.host, a.port);
        }
    };

    template<>
    struct formatter<shipyard::replication::environment_t>: formatter<int> {
        template<typename FormatContext>
        auto format(const shipyard::replication::environment_t &e, FormatContext &ctx) const -> decltype(ctx.out())
        {
            using shipyard::replication::environment_t;
            switch (e) {
                case environment_t::production: return fmt::format_to(ctx.out(), "production");
                case environment_t::test: return fmt::format_to(ctx.out(), "test");
                default: return fmt::format_to(ctx.out(), "environment_t({})", static_cast<int>(e));
            }
        }
    };
}

/* This file is part of Shipyard project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include <arpa/inet.h>
#include <fstream>
#include <limits>
#include <boost/json.hpp>
#include <shipyard/common/file.hpp>
#include <shipyard/common/logger.hpp>
#include "config.hpp"

namespace shipyard::replication {
    namespace json = boost::json;

    static void require_readable(const std::string_view name, const std::string &path)
    {
        if (path.empty()) [[unlikely]]
            throw configuration_error(fmt::format("security is enabled but {} is not set", name));
        if (!std::filesystem::is_regular_file(path)) [[unlikely]]
            throw configuration_error(fmt::format("{} {} does not exist or is not a regular file", name, path));
        if (const std::ifstream is { path, std::ios::binary }; !is) [[unlikely]]
            throw configuration_error(fmt::format("{} {} is not readable", name, path));
    }

    static bool is_ip_literal(const std::string &host)
    {
        in6_addr addr6 {};
        if (inet_pton(AF_INET6, host.c_str(), &addr6) == 1)
            return true;
        in_addr addr4 {};
        return inet_pton(AF_INET, host.c_str(), &addr4) == 1;
    }

    void transport_config_t::validate() const
    {
        if (peer.host.empty()) [[unlikely]]
            throw configuration_error("the peer host must not be empty");
        if (peer.port == 0) [[unlikely]]
            throw configuration_error(fmt::format("the peer port of {} must not be zero", peer));
        if (max_inbound_message_size == 0 || max_inbound_message_size > std::numeric_limits<uint32_t>::max()) [[unlikely]]
            throw configuration_error(fmt::format("max_inbound_message_size must be within [1, {}] but got {}",
                std::numeric_limits<uint32_t>::max(), max_inbound_message_size));
        if (shutdown_grace.count() < 0) [[unlikely]]
            throw configuration_error("shutdown_grace must not be negative");
        if (connect_timeout.count() <= 0) [[unlikely]]
            throw configuration_error("connect_timeout must be positive");
        if (alpn.empty() || alpn.size() > 255) [[unlikely]]
            throw configuration_error(fmt::format("alpn must have between 1 and 255 characters but got {}", alpn.size()));
        if (!security.enabled) {
            if (security.test_authority_override)
                logger::warn("the test authority override has no effect when security is disabled");
            return;
        }
        require_readable("client certificate", security.client_cert_path);
        require_readable("client private key", security.client_key_path);
        if (security.trust_anchor_path)
            require_readable("trust anchor", *security.trust_anchor_path);
        if (security.test_authority_override && environment == environment_t::production) [[unlikely]]
            throw configuration_error("the test authority override must not be used in a production environment");
        if (security.test_authority_override && !is_ip_literal(peer.host)) [[unlikely]]
            throw configuration_error(fmt::format("the test authority override requires an IP address but got {}", peer.host));
    }

    static environment_t environment_from_str(const std::string_view s)
    {
        if (s == "production")
            return environment_t::production;
        if (s == "test")
            return environment_t::test;
        throw configuration_error(fmt::format("unsupported environment: '{}'", s));
    }

    template<typename T>
    static void set_if_present(const json::object &obj, const std::string_view key, T &val)
    {
        if (const auto *jv = obj.if_contains(key))
            val = json::value_to<T>(*jv);
    }

    static security_config_t security_from_json(const json::object &obj)
    {
        security_config_t sec {};
        set_if_present(obj, "enabled", sec.enabled);
        set_if_present(obj, "client_cert_path", sec.client_cert_path);
        set_if_present(obj, "client_key_path", sec.client_key_path);
        if (const auto *jv = obj.if_contains("trust_anchor_path"); jv && !jv->is_null())
            sec.trust_anchor_path.emplace(json::value_to<std::string>(*jv));
        set_if_present(obj, "require_client_auth", sec.require_client_auth);
        set_if_present(obj, "test_authority_override", sec.test_authority_override);
        return sec;
    }

    transport_config_t transport_config_t::from_json(const json::value &jv)
    {
        try {
            const auto &obj = jv.as_object();
            transport_config_t cfg {
                .peer = {
                    json::value_to<std::string>(obj.at("host")),
                    json::value_to<uint16_t>(obj.at("port"))
                }
            };
            if (const auto *sec = obj.if_contains("security"))
                cfg.security = security_from_json(sec->as_object());
            if (const auto *env = obj.if_contains("environment"))
                cfg.environment = environment_from_str(env->as_string());
            if (const auto *dir = obj.if_contains("working_dir"))
                cfg.working_dir = json::value_to<std::string>(*dir);
            set_if_present(obj, "max_inbound_message_size", cfg.max_inbound_message_size);
            if (const auto *ms = obj.if_contains("shutdown_grace_ms"))
                cfg.shutdown_grace = std::chrono::milliseconds { json::value_to<int64_t>(*ms) };
            if (const auto *ms = obj.if_contains("connect_timeout_ms"))
                cfg.connect_timeout = std::chrono::milliseconds { json::value_to<int64_t>(*ms) };
            set_if_present(obj, "app_name", cfg.app_name);
            set_if_present(obj, "alpn", cfg.alpn);
            return cfg;
        } catch (const configuration_error &) {
            throw;
        } catch (const std::exception &ex) {
            throw configuration_error("invalid transport configuration", ex);
        }
    }

    transport_config_t load_transport_config(const std::string &path)
    {
        uint8_vector bytes {};
        try {
            bytes = file::read(path);
        } catch (const std::exception &ex) {
            throw configuration_error(fmt::format("can't read the transport configuration from {}", path), ex);
        }
        boost::system::error_code ec {};
        const auto jv = json::parse(bytes.str(), ec);
        if (ec) [[unlikely]]
            throw configuration_error(fmt::format("can't parse {}: {}", path, ec.message()));
        return transport_config_t::from_json(jv);
    }
}

#pragma once
/* This file is part of Shipyard project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include <memory>
#include <string>
#include <string_view>
#include <shipyard/common/logger.hpp>
#include "../config.hpp"
#include "../errors.hpp"

// include it the last since it includes Windows headers
#include <msquic.hpp>

extern "C" const MsQuicApi *MsQuic;

namespace shipyard::replication::quic {
    // application error codes sent to the peer in stream and connection shutdowns
    static constexpr QUIC_UINT62 app_error_none = 0;
    static constexpr QUIC_UINT62 app_error_cancelled = 1;

    extern std::string status_name(QUIC_STATUS status);

    inline std::string status_message(const std::string_view msg, const QUIC_STATUS status)
    {
        return fmt::format("{}, status: {}", msg, status_name(status));
    }

    struct api_initializer_t {
        static void init_msquic_api()
        {
            static initializer_t api {};
        }

        api_initializer_t()
        {
            init_msquic_api();
        }
    private:
        struct initializer_t {
            initializer_t()
            {
                if (!_api.IsValid()) [[unlikely]]
                    throw tls_setup_error(status_message("failed to initialize MsQuic API", _api.GetInitStatus()));
                MsQuic = &_api;
            }
        private:
            MsQuicApi _api {};
        };
    };

    // The registration and the TLS configuration of a client connection built from a transport_config_t.
    struct client_config_t {
        explicit client_config_t(const transport_config_t &cfg);

        const MsQuicRegistration &reg() const
        {
            return *_reg;
        }

        const MsQuicConfiguration &config() const
        {
            return *_config;
        }
    private:
        const std::string _app_name;
        const std::string _alpn_id;
        const std::string _cert_path;
        const std::string _key_path;
        const std::string _ca_path;
        std::unique_ptr<MsQuicRegistration> _reg {};
        std::unique_ptr<MsQuicConfiguration> _config {};
    };
}

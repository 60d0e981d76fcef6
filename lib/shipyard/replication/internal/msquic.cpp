/* This file is part of Shipyard project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include <unordered_map>

#include "msquic.hpp"

extern "C" {
    const MsQuicApi *MsQuic = nullptr;
}

namespace shipyard::replication::quic {
    std::string status_name(const QUIC_STATUS status)
    {
        static const std::unordered_map<QUIC_STATUS, std::string> names {
            { QUIC_STATUS_SUCCESS, "QUIC_STATUS_SUCCESS" },
            { QUIC_STATUS_PENDING, "QUIC_STATUS_PENDING" },
            { QUIC_STATUS_CONTINUE, "QUIC_STATUS_CONTINUE" },
            { QUIC_STATUS_OUT_OF_MEMORY, "QUIC_STATUS_OUT_OF_MEMORY" },
            { QUIC_STATUS_INVALID_PARAMETER, "QUIC_STATUS_INVALID_PARAMETER" },
            { QUIC_STATUS_INVALID_STATE, "QUIC_STATUS_INVALID_STATE" },
            { QUIC_STATUS_NOT_SUPPORTED, "QUIC_STATUS_NOT_SUPPORTED" },
            { QUIC_STATUS_NOT_FOUND, "QUIC_STATUS_NOT_FOUND" },
            { QUIC_STATUS_BUFFER_TOO_SMALL, "QUIC_STATUS_BUFFER_TOO_SMALL" },
            { QUIC_STATUS_HANDSHAKE_FAILURE, "QUIC_STATUS_HANDSHAKE_FAILURE" },
            { QUIC_STATUS_ABORTED, "QUIC_STATUS_ABORTED" },
            { QUIC_STATUS_ADDRESS_IN_USE, "QUIC_STATUS_ADDRESS_IN_USE" },
            { QUIC_STATUS_INVALID_ADDRESS, "QUIC_STATUS_INVALID_ADDRESS" },
            { QUIC_STATUS_CONNECTION_TIMEOUT, "QUIC_STATUS_CONNECTION_TIMEOUT" },
            { QUIC_STATUS_CONNECTION_IDLE, "QUIC_STATUS_CONNECTION_IDLE" },
            { QUIC_STATUS_INTERNAL_ERROR, "QUIC_STATUS_INTERNAL_ERROR" },
            { QUIC_STATUS_UNREACHABLE, "QUIC_STATUS_UNREACHABLE" },
            { QUIC_STATUS_CONNECTION_REFUSED, "QUIC_STATUS_CONNECTION_REFUSED" },
            { QUIC_STATUS_PROTOCOL_ERROR, "QUIC_STATUS_PROTOCOL_ERROR" },
            { QUIC_STATUS_VER_NEG_ERROR, "QUIC_STATUS_VER_NEG_ERROR" },
            { QUIC_STATUS_USER_CANCELED, "QUIC_STATUS_USER_CANCELED" },
            { QUIC_STATUS_ALPN_NEG_FAILURE, "QUIC_STATUS_ALPN_NEG_FAILURE" },
            { QUIC_STATUS_STREAM_LIMIT_REACHED, "QUIC_STATUS_STREAM_LIMIT_REACHED" },
            { QUIC_STATUS_TLS_ERROR, "QUIC_STATUS_TLS_ERROR" },
            { QUIC_STATUS_CERT_EXPIRED, "QUIC_STATUS_CERT_EXPIRED" },
            { QUIC_STATUS_CERT_UNTRUSTED_ROOT, "QUIC_STATUS_CERT_UNTRUSTED_ROOT" },
            { QUIC_STATUS_CERT_NO_CERT, "QUIC_STATUS_CERT_NO_CERT" },
            { QUIC_STATUS_REQUIRED_CERTIFICATE, "QUIC_STATUS_REQUIRED_CERTIFICATE" },
            { QUIC_STATUS_BAD_CERTIFICATE, "QUIC_STATUS_BAD_CERTIFICATE" }
        };
        if (const auto it = names.find(status); it != names.end())
            return fmt::format("{} ({:08X})", it->second, status);
        return fmt::format("QUIC_STATUS_UNKNOWN {:08X}", status);
    }

    client_config_t::client_config_t(const transport_config_t &cfg):
        _app_name { cfg.app_name },
        _alpn_id { cfg.alpn },
        _cert_path { cfg.security.client_cert_path },
        _key_path { cfg.security.client_key_path },
        _ca_path { cfg.security.trust_anchor_path.value_or("") }
    {
        _reg = std::make_unique<MsQuicRegistration>(_app_name.c_str(), QUIC_EXECUTION_PROFILE_LOW_LATENCY, true);
        if (!_reg->IsValid()) [[unlikely]]
            throw tls_setup_error(status_message("failed to initialize MsQuicRegistration", _reg->GetInitStatus()));

        QUIC_CERTIFICATE_FILE cert_file {
            .PrivateKeyFile = _key_path.c_str(),
            .CertificateFile = _cert_path.c_str()
        };
        QUIC_CREDENTIAL_CONFIG cred_cfg {};
        cred_cfg.Type = QUIC_CREDENTIAL_TYPE_NONE;
        cred_cfg.Flags = QUIC_CREDENTIAL_FLAG_CLIENT;
        if (!cfg.security.enabled) {
            cred_cfg.Flags |= QUIC_CREDENTIAL_FLAG_NO_CERTIFICATE_VALIDATION;
        } else {
            cred_cfg.Type = QUIC_CREDENTIAL_TYPE_CERTIFICATE_FILE;
            cred_cfg.CertificateFile = &cert_file;
            cred_cfg.Flags |= QUIC_CREDENTIAL_FLAG_INDICATE_CERTIFICATE_RECEIVED;
            if (!_ca_path.empty()) {
                cred_cfg.Flags |= QUIC_CREDENTIAL_FLAG_SET_CA_CERTIFICATE_FILE;
                cred_cfg.CaCertificateFile = _ca_path.c_str();
            }
        }

        MsQuicSettings settings {};
        settings.SetHandshakeIdleTimeoutMs(static_cast<uint64_t>(cfg.connect_timeout.count()));
        settings.SetPeerBidiStreamCount(0);
        settings.SetPeerUnidiStreamCount(0);

        _config = std::make_unique<MsQuicConfiguration>(*_reg, MsQuicAlpn { _alpn_id.c_str() }, settings, MsQuicCredentialConfig { cred_cfg });
        if (!_config->IsValid()) [[unlikely]]
            throw tls_setup_error(status_message("failed to initialize MsQuicConfiguration", _config->GetInitStatus()));
    }
}

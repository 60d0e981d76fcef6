#pragma once
/* This file is part of Shipyard project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include <shipyard/common/error.hpp>

namespace shipyard::replication {
    // missing or unreadable security material, invalid addresses or tunables
    struct configuration_error final: error {
        using error::error;
    };

    // certificate or key material that cannot be loaded or a TLS context that cannot be built
    struct tls_setup_error final: error {
        using error::error;
    };

    // the stream failed or was torn down before the peer signalled completion
    struct transfer_error final: error {
        using error::error;
    };

    // the local sink failed to persist a chunk or to close
    struct sink_write_error final: error {
        using error::error;
    };

    struct busy_error final: error {
        using error::error;
    };

    // logged by client_t::shutdown and never propagated to its callers
    struct shutdown_error final: error {
        using error::error;
    };
}

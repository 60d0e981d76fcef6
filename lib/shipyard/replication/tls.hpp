#pragma once
/* This file is part of Shipyard project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include <string>
#include "config.hpp"

typedef struct x509_st X509;

namespace shipyard::replication::tls {
    // Loads the certificate, the private key and the trust anchor with OpenSSL and checks that the key
    // matches the certificate. Throws tls_setup_error.
    extern void check_material(const security_config_t &sec);

    [[nodiscard]] extern std::string describe_cert(const X509 *cert);

    // Generates an Ed25519 key and a self-signed certificate with name as its CN and DNS alt name.
    extern void write_self_signed_cert(const std::string &cert_path, const std::string &key_path, const std::string &name);
}

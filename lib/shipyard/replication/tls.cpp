/* This file is part of Shipyard project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include <array>
#include <cstdio>
#include <memory>

#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/pem.h>
#include <openssl/x509.h>
#include <openssl/x509v3.h>

#include <shipyard/common/logger.hpp>
#include "errors.hpp"
#include "tls.hpp"

namespace shipyard::replication::tls {
    namespace {
        struct file_deleter_t {
            void operator()(FILE *f) const { fclose(f); }
        };
        struct x509_deleter_t {
            void operator()(X509 *x) const { X509_free(x); }
        };
        struct pkey_deleter_t {
            void operator()(EVP_PKEY *k) const { EVP_PKEY_free(k); }
        };
        struct pkey_ctx_deleter_t {
            void operator()(EVP_PKEY_CTX *c) const { EVP_PKEY_CTX_free(c); }
        };
        struct bio_deleter_t {
            void operator()(BIO *b) const { BIO_free(b); }
        };
        struct gens_deleter_t {
            void operator()(GENERAL_NAMES *g) const { sk_GENERAL_NAME_pop_free(g, GENERAL_NAME_free); }
        };
        struct ext_deleter_t {
            void operator()(X509_EXTENSION *e) const { X509_EXTENSION_free(e); }
        };

        using file_ptr_t = std::unique_ptr<FILE, file_deleter_t>;
        using x509_ptr_t = std::unique_ptr<X509, x509_deleter_t>;
        using pkey_ptr_t = std::unique_ptr<EVP_PKEY, pkey_deleter_t>;
        using pkey_ctx_ptr_t = std::unique_ptr<EVP_PKEY_CTX, pkey_ctx_deleter_t>;
        using bio_ptr_t = std::unique_ptr<BIO, bio_deleter_t>;
        using gens_ptr_t = std::unique_ptr<GENERAL_NAMES, gens_deleter_t>;
        using ext_ptr_t = std::unique_ptr<X509_EXTENSION, ext_deleter_t>;

        std::string openssl_errors()
        {
            std::string res {};
            while (const auto code = ERR_get_error()) {
                std::array<char, 256> buf {};
                ERR_error_string_n(code, buf.data(), buf.size());
                if (!res.empty())
                    res += "; ";
                res += buf.data();
            }
            return res.empty() ? std::string { "no details" } : res;
        }

        template<typename E=tls_setup_error>
        file_ptr_t open_file(const std::string &path, const char *mode)
        {
            file_ptr_t f { fopen(path.c_str(), mode) };
            if (!f) [[unlikely]]
                throw E(fmt::format("can't open {}", path));
            return f;
        }

        void close_file(file_ptr_t &&f, const std::string &path)
        {
            if (fclose(f.release()) != 0) [[unlikely]]
                throw error_sys(fmt::format("failed to close {}", path));
        }

        x509_ptr_t load_cert(const std::string_view name, const std::string &path)
        {
            const auto f = open_file(path, "rb");
            x509_ptr_t cert { PEM_read_X509(f.get(), nullptr, nullptr, nullptr) };
            if (!cert) [[unlikely]]
                throw tls_setup_error(fmt::format("{} {} is not a PEM certificate: {}", name, path, openssl_errors()));
            return cert;
        }

        pkey_ptr_t load_key(const std::string &path)
        {
            const auto f = open_file(path, "rb");
            pkey_ptr_t key { PEM_read_PrivateKey(f.get(), nullptr, nullptr, nullptr) };
            if (!key) [[unlikely]]
                throw tls_setup_error(fmt::format("private key {} is not a PEM private key: {}", path, openssl_errors()));
            return key;
        }

        void set_alt_name(X509 *x509, const std::string &name)
        {
            gens_ptr_t gens { sk_GENERAL_NAME_new_null() };
            GENERAL_NAME *gen = GENERAL_NAME_new();
            ASN1_IA5STRING *dns = ASN1_IA5STRING_new();
            if (!gens || !gen || !dns) [[unlikely]] {
                GENERAL_NAME_free(gen);
                ASN1_IA5STRING_free(dns);
                throw tls_setup_error("failed to allocate a subject alt name");
            }
            if (!ASN1_STRING_set(dns, name.data(), static_cast<int>(name.size()))) [[unlikely]] {
                GENERAL_NAME_free(gen);
                ASN1_IA5STRING_free(dns);
                throw tls_setup_error(fmt::format("failed to set the alt name {}: {}", name, openssl_errors()));
            }
            // gen takes the ownership of dns and gens takes the ownership of gen
            GENERAL_NAME_set0_value(gen, GEN_DNS, dns);
            if (!sk_GENERAL_NAME_push(gens.get(), gen)) [[unlikely]] {
                GENERAL_NAME_free(gen);
                throw tls_setup_error("failed to add a subject alt name");
            }
            const ext_ptr_t ext { X509V3_EXT_i2d(NID_subject_alt_name, 0, gens.get()) };
            if (!ext || !X509_add_ext(x509, ext.get(), -1)) [[unlikely]]
                throw tls_setup_error(fmt::format("failed to add the alt name extension: {}", openssl_errors()));
        }
    }

    void check_material(const security_config_t &sec)
    {
        if (!sec.enabled)
            return;
        const auto cert = load_cert("client certificate", sec.client_cert_path);
        const auto key = load_key(sec.client_key_path);
        if (X509_check_private_key(cert.get(), key.get()) != 1) [[unlikely]]
            throw tls_setup_error(fmt::format("private key {} does not match certificate {}: {}",
                sec.client_key_path, sec.client_cert_path, openssl_errors()));
        logger::debug("tls: client certificate: {}", describe_cert(cert.get()));
        if (sec.trust_anchor_path) {
            const auto anchor = load_cert("trust anchor", *sec.trust_anchor_path);
            logger::debug("tls: trust anchor: {}", describe_cert(anchor.get()));
        }
    }

    std::string describe_cert(const X509 *cert)
    {
        if (!cert)
            return "nullptr";
        const bio_ptr_t bio { BIO_new(BIO_s_mem()) };
        if (!bio)
            return "failed to allocate a BIO for the cert";
        X509_NAME_print_ex(bio.get(), X509_get_subject_name(cert), 0, XN_FLAG_ONELINE);
        BIO_puts(bio.get(), " issued by ");
        X509_NAME_print_ex(bio.get(), X509_get_issuer_name(cert), 0, XN_FLAG_ONELINE);
        char *data = nullptr;
        const auto data_len = BIO_get_mem_data(bio.get(), &data);
        if (data_len <= 0 || !data)
            return "an empty certificate description";
        return { data, static_cast<size_t>(data_len) };
    }

    void write_self_signed_cert(const std::string &cert_path, const std::string &key_path, const std::string &name)
    {
        pkey_ptr_t pkey {};
        {
            const pkey_ctx_ptr_t ctx { EVP_PKEY_CTX_new_id(EVP_PKEY_ED25519, nullptr) };
            EVP_PKEY *raw_key = nullptr;
            if (!ctx || EVP_PKEY_keygen_init(ctx.get()) != 1 || EVP_PKEY_keygen(ctx.get(), &raw_key) != 1) [[unlikely]]
                throw tls_setup_error(fmt::format("failed to generate an Ed25519 key: {}", openssl_errors()));
            pkey.reset(raw_key);
        }

        const x509_ptr_t x509 { X509_new() };
        if (!x509) [[unlikely]]
            throw tls_setup_error("failed to create a x509 certificate!");
        X509_set_version(x509.get(), 2);
        ASN1_INTEGER_set(X509_get_serialNumber(x509.get()), 1);
        X509_gmtime_adj(X509_get_notBefore(x509.get()), 0);
        X509_gmtime_adj(X509_get_notAfter(x509.get()), 3600L * 24 * 365 * 10);
        if (X509_set_pubkey(x509.get(), pkey.get()) != 1) [[unlikely]]
            throw tls_setup_error(fmt::format("failed to set the public key: {}", openssl_errors()));
        set_alt_name(x509.get(), name);

        X509_NAME *subj = X509_get_subject_name(x509.get());
        X509_NAME_add_entry_by_txt(subj, "CN", MBSTRING_ASC, reinterpret_cast<const uint8_t *>(name.c_str()), -1, -1, 0);
        X509_set_issuer_name(x509.get(), subj);

        // the digest must be null for Ed25519
        if (X509_sign(x509.get(), pkey.get(), nullptr) <= 0) [[unlikely]]
            throw tls_setup_error(fmt::format("failed to sign the certificate: {}", openssl_errors()));

        {
            auto f = open_file<error>(key_path, "wb");
            if (PEM_write_PrivateKey(f.get(), pkey.get(), nullptr, nullptr, 0, nullptr, nullptr) != 1) [[unlikely]]
                throw error(fmt::format("failed to write the private key to {}: {}", key_path, openssl_errors()));
            close_file(std::move(f), key_path);
        }
        {
            auto f = open_file<error>(cert_path, "wb");
            if (PEM_write_X509(f.get(), x509.get()) != 1) [[unlikely]]
                throw error(fmt::format("failed to write the certificate to {}: {}", cert_path, openssl_errors()));
            close_file(std::move(f), cert_path);
        }
        logger::info("generated a self-signed certificate: {}", describe_cert(x509.get()));
        logger::info("key path: {}", key_path);
        logger::info("cert path: {}", cert_path);
    }
}

// Copyright 2025 The Rpcprobe Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <memory>
#include <stdexcept>
#include <string>

#include <openssl/bio.h>
#include <openssl/evp.h>
#include <openssl/obj_mac.h>
#include <openssl/pem.h>
#include <openssl/x509.h>
#include <openssl/x509v3.h>

#include <rpcprobe/infra/test_util/temporary_file.hpp>

namespace rpcprobe::rpc::test_util {

//! P-256 key and self-signed certificate written as PEM into temporary files
class SelfSignedCertificate {
  public:
    //! \param subject_alt_names the subjectAltName extension value, e.g. "IP:127.0.0.1,DNS:localhost"
    explicit SelfSignedCertificate(const std::string& subject_alt_names = "IP:127.0.0.1,DNS:localhost") {
        const auto key = generate_key();
        const auto certificate = sign_certificate(key.get(), subject_alt_names);

        const BioPtr cert_bio{BIO_new(BIO_s_mem())};
        const BioPtr key_bio{BIO_new(BIO_s_mem())};
        if (!cert_bio || !key_bio ||
            PEM_write_bio_X509(cert_bio.get(), certificate.get()) != 1 ||
            PEM_write_bio_PrivateKey(key_bio.get(), key.get(), nullptr, nullptr, 0, nullptr, nullptr) != 1) {
            throw std::runtime_error{"cannot encode self-signed certificate as PEM"};
        }
        cert_file_.write(to_string(cert_bio.get()));
        key_file_.write(to_string(key_bio.get()));
    }

    std::string cert_path() const { return cert_file_.path().string(); }
    std::string key_path() const { return key_file_.path().string(); }

  private:
    struct BioDeleter {
        void operator()(BIO* bio) const { BIO_free(bio); }
    };
    struct KeyDeleter {
        void operator()(EVP_PKEY* key) const { EVP_PKEY_free(key); }
    };
    struct KeyContextDeleter {
        void operator()(EVP_PKEY_CTX* context) const { EVP_PKEY_CTX_free(context); }
    };
    struct X509Deleter {
        void operator()(X509* certificate) const { X509_free(certificate); }
    };
    struct ExtensionDeleter {
        void operator()(X509_EXTENSION* extension) const { X509_EXTENSION_free(extension); }
    };
    using BioPtr = std::unique_ptr<BIO, BioDeleter>;
    using KeyPtr = std::unique_ptr<EVP_PKEY, KeyDeleter>;
    using X509Ptr = std::unique_ptr<X509, X509Deleter>;

    static KeyPtr generate_key() {
        const std::unique_ptr<EVP_PKEY_CTX, KeyContextDeleter> context{EVP_PKEY_CTX_new_id(EVP_PKEY_EC, nullptr)};
        EVP_PKEY* key{nullptr};
        if (!context ||
            EVP_PKEY_keygen_init(context.get()) != 1 ||
            EVP_PKEY_CTX_set_ec_paramgen_curve_nid(context.get(), NID_X9_62_prime256v1) != 1 ||
            EVP_PKEY_keygen(context.get(), &key) != 1) {
            throw std::runtime_error{"cannot generate P-256 key"};
        }
        return KeyPtr{key};
    }

    static void add_extension(X509* certificate, int nid, const std::string& value) {
        X509V3_CTX v3_context;
        X509V3_set_ctx_nodb(&v3_context);
        X509V3_set_ctx(&v3_context, certificate, certificate, nullptr, nullptr, 0);
        const std::unique_ptr<X509_EXTENSION, ExtensionDeleter> extension{
            X509V3_EXT_conf_nid(nullptr, &v3_context, nid, value.c_str())};
        if (!extension || X509_add_ext(certificate, extension.get(), -1) != 1) {
            throw std::runtime_error{"cannot add certificate extension " + value};
        }
    }

    static X509Ptr sign_certificate(EVP_PKEY* key, const std::string& subject_alt_names) {
        X509Ptr certificate{X509_new()};
        if (!certificate) {
            throw std::runtime_error{"cannot allocate certificate"};
        }
        X509* cert = certificate.get();
        X509_set_version(cert, 2);
        ASN1_INTEGER_set(X509_get_serialNumber(cert), 1);
        X509_gmtime_adj(X509_getm_notBefore(cert), -3600);
        X509_gmtime_adj(X509_getm_notAfter(cert), 24 * 3600);
        X509_set_pubkey(cert, key);

        X509_NAME* name = X509_get_subject_name(cert);
        X509_NAME_add_entry_by_txt(name, "CN", MBSTRING_ASC, reinterpret_cast<const unsigned char*>("rpcprobe test"), -1, -1, 0);
        X509_set_issuer_name(cert, name);

        add_extension(cert, NID_basic_constraints, "critical,CA:TRUE");
        add_extension(cert, NID_subject_alt_name, subject_alt_names);

        if (X509_sign(cert, key, EVP_sha256()) == 0) {
            throw std::runtime_error{"cannot sign certificate"};
        }
        return certificate;
    }

    static std::string to_string(BIO* bio) {
        char* data{nullptr};
        const auto size = BIO_get_mem_data(bio, &data);
        return std::string(data, static_cast<size_t>(size));
    }

    rpcprobe::test_util::TemporaryFile cert_file_;
    rpcprobe::test_util::TemporaryFile key_file_;
};

}  // namespace rpcprobe::rpc::test_util

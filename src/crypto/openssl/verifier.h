// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the Apache 2.0 License.
#pragma once

#include "certissuer/crypto/md_type.h"
#include "certissuer/crypto/verifier.h"
#include "crypto/openssl/openssl_wrappers.h"

#include <openssl/x509.h>

namespace certissuer::crypto
{
  class Verifier_OpenSSL : public Verifier
  {
  protected:
    mutable OpenSSL::Unique_X509 cert;

    static MDType get_md_type(int mdt);

  public:
    Verifier_OpenSSL(const std::vector<uint8_t>& c);
    Verifier_OpenSSL(Verifier_OpenSSL&& v) = default;
    Verifier_OpenSSL(const Verifier_OpenSSL&) = delete;
    ~Verifier_OpenSSL() override;

    std::vector<uint8_t> cert_der() override;
    Pem cert_pem() override;
    Pem public_key_pem() const override;

    bool verify_certificate(
      const std::vector<const Pem*>& trusted_certs,
      const std::vector<const Pem*>& chain = {},
      bool ignore_time = false,
      std::string* error_reason = nullptr) override;

    bool is_self_signed() const override;

    std::string serial_number() const override;

    std::pair<std::string, std::string> validity_period() const override;

    std::string subject() const override;
    std::string issuer() const override;
    std::string common_name() const override;
    std::vector<SubjectAltName> subject_alt_names() const override;

    bool is_ca() const override;
    bool is_extension_critical(const std::string& name) const override;
    std::vector<std::string> key_usage() const override;
    std::vector<std::string> extended_key_usage() const override;
    bool has_subject_key_identifier() const override;
    bool has_authority_key_identifier() const override;

    std::string signature_digest() const override;
  };
}

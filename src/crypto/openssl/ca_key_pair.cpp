// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the Apache 2.0 License.

#include "crypto/openssl/ca_key_pair.h"

#include "certissuer/ds/logger.h"
#include "crypto/openssl/cert_builder.h"

namespace certissuer::crypto
{
  using namespace OpenSSL;

  CAKeyPair_OpenSSL::CAKeyPair_OpenSSL(
    const Pem& private_key,
    const Pem& cert_pem,
    const std::optional<std::string>& passphrase)
  {
    Unique_BIO kmem(private_key);
    key = Unique_PKEY(kmem, passphrase);
    if (key == nullptr)
    {
      const auto ec = ERR_get_error();
      ERR_clear_error();
      throw std::invalid_argument(fmt::format(
        "could not parse CA private key{}: {}",
        passphrase.has_value() ? " (wrong passphrase?)" : "",
        error_string(ec)));
    }

    Unique_BIO cmem(cert_pem);
    cert = Unique_X509(cmem, true);
    if (cert == nullptr)
    {
      const auto ec = ERR_get_error();
      ERR_clear_error();
      throw std::invalid_argument(fmt::format(
        "could not parse CA certificate: {}", error_string(ec)));
    }

    if (X509_check_private_key(cert, key) != 1)
    {
      ERR_clear_error();
      throw std::invalid_argument(
        "CA private key does not match the CA certificate");
    }
  }

  Pem CAKeyPair_OpenSSL::cert_pem() const
  {
    return cert_to_pem(cert);
  }

  Pem CAKeyPair_OpenSSL::sign_csr(
    const Pem& signing_request,
    const std::string& serial,
    const std::string& valid_from,
    const std::string& valid_to,
    const ExtensionProfile& extensions,
    MDType md_type) const
  {
    Unique_BIO mem(signing_request);
    Unique_X509_REQ csr(mem);

    // First, verify self-signed CSR
    EVP_PKEY* req_pubkey = X509_REQ_get0_pubkey(csr);
    CHECKNULL(req_pubkey);
    if (X509_REQ_verify(csr, req_pubkey) != 1)
    {
      ERR_clear_error();
      throw std::invalid_argument(
        "Certificate signing request signature does not verify");
    }

    // Extensions requested by the CSR never reach the certificate
    Unique_STACK_OF_X509_EXTENSIONS requested(X509_REQ_get_extensions(csr));
    if (requested != nullptr && sk_X509_EXTENSION_num(requested) > 0)
    {
      LOG_DEBUG_FMT(
        "Ignoring {} extension(s) requested by the CSR",
        sk_X509_EXTENSION_num(requested));
    }

    auto crt = create_cert(
      key,
      cert,
      X509_REQ_get_subject_name(csr),
      req_pubkey,
      serial,
      valid_from,
      valid_to,
      extensions,
      md_type);
    return cert_to_pem(crt);
  }
}

// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the Apache 2.0 License.
#pragma once

#include "certissuer/crypto/distinguished_name.h"
#include "certissuer/crypto/extensions.h"
#include "certissuer/crypto/md_type.h"
#include "certissuer/crypto/pem.h"
#include "crypto/openssl/openssl_wrappers.h"

#include <string>
#include <vector>

namespace certissuer::crypto::OpenSSL
{
  /// Builds a name from typed UTF-8 entries, in the order given
  Unique_X509_NAME make_x509_name(const DistinguishedName& name);

  /// subjectAltName extension with one DNS or iPAddress GeneralName per entry
  Unique_X509_EXTENSION make_subject_alt_name_extension(
    const std::vector<SubjectAltName>& sans);

  /** Creates a request for @p key, with @p extensions as its
   * requested-extensions attribute, signed by @p key
   */
  Unique_X509_REQ create_req(
    EVP_PKEY* key,
    const DistinguishedName& subject_name,
    const ExtensionProfile& extensions,
    MDType md_type);

  /** Creates and signs a certificate.
   * @param issuer_key Key signing the certificate
   * @param issuer_cert Certificate of @p issuer_key, or nullptr for a
   *  self-signed certificate
   * @param subject_name Subject of the certificate (and issuer, when
   *  self-signed)
   * @param subject_key Public key of the certificate
   * @param serial Serial number as a hex string
   */
  Unique_X509 create_cert(
    EVP_PKEY* issuer_key,
    X509* issuer_cert,
    const X509_NAME* subject_name,
    EVP_PKEY* subject_key,
    const std::string& serial,
    const std::string& valid_from,
    const std::string& valid_to,
    const ExtensionProfile& extensions,
    MDType md_type);

  Pem req_to_pem(X509_REQ* req);
  Pem cert_to_pem(X509* cert);
}

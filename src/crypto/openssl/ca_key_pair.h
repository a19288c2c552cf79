// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the Apache 2.0 License.
#pragma once

#include "certissuer/crypto/ca_key_pair.h"
#include "crypto/openssl/openssl_wrappers.h"

#include <optional>
#include <string>

namespace certissuer::crypto
{
  class CAKeyPair_OpenSSL : public CAKeyPair
  {
  protected:
    OpenSSL::Unique_PKEY key;
    OpenSSL::Unique_X509 cert;

  public:
    CAKeyPair_OpenSSL(
      const Pem& private_key,
      const Pem& cert_pem,
      const std::optional<std::string>& passphrase);
    virtual ~CAKeyPair_OpenSSL() = default;

    virtual Pem cert_pem() const override;

    virtual Pem sign_csr(
      const Pem& signing_request,
      const std::string& serial,
      const std::string& valid_from,
      const std::string& valid_to,
      const ExtensionProfile& extensions,
      MDType md_type = MDType::SHA256) const override;
  };
}

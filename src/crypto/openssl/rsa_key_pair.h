// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the Apache 2.0 License.
#pragma once

#include "certissuer/crypto/key_pair.h"
#include "crypto/openssl/openssl_wrappers.h"

#include <string>
#include <vector>

namespace certissuer::crypto
{
  class RSAKeyPair_OpenSSL : public RSAKeyPair
  {
  protected:
    OpenSSL::Unique_PKEY key;

  public:
    RSAKeyPair_OpenSSL(size_t public_key_size, size_t public_exponent);
    RSAKeyPair_OpenSSL(const Pem& pem);
    virtual ~RSAKeyPair_OpenSSL() = default;

    virtual Pem private_key_pem() const override;
    virtual Pem public_key_pem() const override;
    virtual std::vector<uint8_t> public_key_der() const override;
    virtual size_t key_size() const override;

    virtual Pem create_csr(
      const DistinguishedName& subject_name,
      const ExtensionProfile& extensions,
      MDType md_type = MDType::SHA256) const override;

    virtual Pem self_sign(
      const DistinguishedName& subject_name,
      const std::string& valid_from,
      const std::string& valid_to,
      MDType md_type = MDType::SHA256) const override;
  };
}

// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the Apache 2.0 License.
#pragma once

#include "certissuer/crypto/distinguished_name.h"
#include "certissuer/crypto/key_pair.h"
#include "certissuer/crypto/pem.h"
#include "certissuer/ds/x509_time_fmt.h"
#include "crypto/certs.h"
#include "crypto/openssl/openssl_wrappers.h"

#include <chrono>
#include <optional>
#include <string>

namespace certissuer::crypto::test
{
  struct TestCA
  {
    RSAKeyPairPtr key_pair;
    Pem cert;
  };

  /// Self-signed RSA certificate authority, valid from one day ago
  static inline TestCA make_test_ca(
    const std::string& common_name = "Test CA",
    size_t validity_days = 365,
    std::optional<std::string> valid_from = std::nullopt)
  {
    using namespace std::chrono_literals;

    if (!valid_from.has_value())
    {
      valid_from =
        ds::to_x509_time_string(std::chrono::system_clock::now() - 24h);
    }

    DistinguishedName name;
    name.add("O", "certissuer tests");
    name.add("CN", common_name);

    auto key_pair = make_rsa_key_pair();
    auto cert =
      create_self_signed_ca_cert(key_pair, name, *valid_from, validity_days);
    return {key_pair, cert};
  }

  /// @p kp's private key, encrypted with @p passphrase
  static inline Pem encrypted_private_key_pem(
    const RSAKeyPairPtr& kp, const std::string& passphrase)
  {
    const auto plain = kp->private_key_pem();
    OpenSSL::Unique_BIO in(plain);
    OpenSSL::Unique_PKEY key(in, std::nullopt);
    OpenSSL::CHECKNULL(key);

    OpenSSL::Unique_BIO out;
    OpenSSL::CHECK1(PEM_write_bio_PrivateKey(
      out,
      key,
      EVP_aes_256_cbc(),
      reinterpret_cast<const unsigned char*>(passphrase.data()),
      static_cast<int>(passphrase.size()),
      nullptr,
      nullptr));
    return Pem(OpenSSL::bio_to_string(out));
  }
}

// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the Apache 2.0 License.
#pragma once

#include "certissuer/crypto/key_pair.h"
#include "certissuer/crypto/md_type.h"
#include "certissuer/crypto/pem.h"

#include <optional>
#include <string>

namespace certissuer::issuer
{
  static constexpr int default_key_size =
    static_cast<int>(crypto::default_rsa_public_key_size);
  static constexpr int default_validity_days = 825;

  struct IssuanceParameters
  {
    /// RSA modulus size, in bits
    int key_size = default_key_size;
    int validity_days = default_validity_days;
    crypto::MDType digest = crypto::MDType::SHA256;
    /// Start of the validity period; the current time when absent
    std::optional<std::string> valid_from = std::nullopt;

    bool operator==(const IssuanceParameters& other) const = default;
  };

  /// The certificate authority signing the new certificate
  struct CAInputs
  {
    crypto::Pem private_key;
    crypto::Pem certificate;
    std::optional<std::string> passphrase = std::nullopt;
  };

  struct IssuanceOutput
  {
    crypto::Pem private_key;
    crypto::Pem csr;
    crypto::Pem certificate;
    /// Serial number of the certificate, as upper-case hex
    std::string serial;
  };

  struct OutputPaths
  {
    std::string private_key;
    std::string csr;
    std::string certificate;

    bool operator==(const OutputPaths& other) const = default;
  };
}

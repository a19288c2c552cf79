// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the Apache 2.0 License.
#pragma once

#include "certissuer/crypto/distinguished_name.h"
#include "certissuer/crypto/extensions.h"
#include "certissuer/crypto/md_type.h"
#include "certissuer/crypto/pem.h"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace certissuer::crypto
{
  class RSAKeyPair
  {
  public:
    virtual ~RSAKeyPair() = default;

    virtual Pem private_key_pem() const = 0;
    virtual Pem public_key_pem() const = 0;
    virtual std::vector<uint8_t> public_key_der() const = 0;

    /// Size of the modulus, in bits
    virtual size_t key_size() const = 0;

    /** Create a certificate signing request for this key
     * @param subject_name Subject of the request
     * @param extensions Extensions to add as the requested-extensions
     *  attribute
     * @param md_type Digest used to sign the request with this key
     * @return PEM encoded request
     */
    virtual Pem create_csr(
      const DistinguishedName& subject_name,
      const ExtensionProfile& extensions,
      MDType md_type = MDType::SHA256) const = 0;

    /** Create a self-signed certificate authority certificate for this key,
     * with a random serial number
     * @param subject_name Subject and issuer of the certificate
     * @param valid_from Start of the validity period, in any format accepted
     *  by ds::time_point_from_string
     * @param valid_to End of the validity period (inclusive)
     * @param md_type Digest used to sign the certificate
     * @return PEM encoded certificate
     */
    virtual Pem self_sign(
      const DistinguishedName& subject_name,
      const std::string& valid_from,
      const std::string& valid_to,
      MDType md_type = MDType::SHA256) const = 0;
  };

  using RSAKeyPairPtr = std::shared_ptr<RSAKeyPair>;

  static constexpr size_t default_rsa_public_key_size = 2048;
  static constexpr size_t default_rsa_public_exponent = 65537;

  /**
   * Create a new public / private RSA key pair with specified size and exponent
   */
  RSAKeyPairPtr make_rsa_key_pair(
    size_t public_key_size = default_rsa_public_key_size,
    size_t public_exponent = default_rsa_public_exponent);

  /**
   * Create a public / private RSA key pair from existing private key data
   */
  RSAKeyPairPtr make_rsa_key_pair(const Pem& pem);
}

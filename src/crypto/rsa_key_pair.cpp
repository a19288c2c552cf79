// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the Apache 2.0 License.

#include "certissuer/crypto/key_pair.h"

#include "crypto/openssl/rsa_key_pair.h"

namespace certissuer::crypto
{
  using RSAKeyPairImpl = RSAKeyPair_OpenSSL;

  RSAKeyPairPtr make_rsa_key_pair(
    size_t public_key_size, size_t public_exponent)
  {
    return std::make_shared<RSAKeyPairImpl>(public_key_size, public_exponent);
  }

  RSAKeyPairPtr make_rsa_key_pair(const Pem& pem)
  {
    return std::make_shared<RSAKeyPairImpl>(pem);
  }
}

// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the Apache 2.0 License.

#include "certissuer/crypto/ca_key_pair.h"

#include "crypto/openssl/ca_key_pair.h"

namespace certissuer::crypto
{
  CAKeyPairPtr make_ca_key_pair(
    const Pem& private_key,
    const Pem& cert,
    const std::optional<std::string>& passphrase)
  {
    return std::make_unique<CAKeyPair_OpenSSL>(private_key, cert, passphrase);
  }
}

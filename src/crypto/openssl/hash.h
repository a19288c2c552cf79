// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the Apache 2.0 License.
#pragma once

#include "certissuer/crypto/md_type.h"

#include <openssl/evp.h>
#include <stdexcept>

namespace certissuer::crypto
{
  namespace OpenSSL
  {
    inline const EVP_MD* get_md_type(MDType type)
    {
      switch (type)
      {
        case MDType::NONE:
          return nullptr;
        case MDType::SHA1:
          return EVP_sha1();
        case MDType::SHA256:
          return EVP_sha256();
        case MDType::SHA384:
          return EVP_sha384();
        case MDType::SHA512:
          return EVP_sha512();
        default:
          throw std::runtime_error("Unsupported hash algorithm");
      }
      return nullptr;
    }

    /// Digest for signing requests and certificates; NONE means SHA-256
    inline const EVP_MD* get_signing_md_type(MDType type)
    {
      return type == MDType::NONE ? EVP_sha256() : get_md_type(type);
    }
  }
}

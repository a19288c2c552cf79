// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the Apache 2.0 License.
#include "certissuer/crypto/serial.h"

#include "crypto/openssl/openssl_wrappers.h"

#include <openssl/bn.h>
#include <openssl/crypto.h>
#include <openssl/rand.h>

namespace certissuer::crypto
{
  using namespace OpenSSL;

  namespace
  {
    std::string to_hex(const BIGNUM* bn)
    {
      char* hex = BN_bn2hex(bn);
      CHECKNULL(hex);
      std::string result(hex);
      OPENSSL_free(hex);
      return result;
    }
  }

  std::string random_serial(size_t num_bytes)
  {
    std::vector<unsigned char> rndbytes(num_bytes);
    CHECK1(RAND_bytes(rndbytes.data(), rndbytes.size()));

    // Serial numbers must be positive and non-zero (RFC 5280, 4.1.2.2)
    rndbytes[0] &= 0x7f;
    rndbytes[0] |= 0x01;

    Unique_BIGNUM bn;
    CHECKNULL(BN_bin2bn(rndbytes.data(), rndbytes.size(), bn));
    return to_hex(bn);
  }

  std::string next_serial(const std::string& serial)
  {
    if (
      serial.empty() ||
      serial.find_first_not_of("0123456789abcdefABCDEF") != std::string::npos)
    {
      throw std::invalid_argument(
        fmt::format("Serial number '{}' is not a hex number", serial));
    }

    BIGNUM* parsed = nullptr;
    CHECKPOSITIVE(BN_hex2bn(&parsed, serial.c_str()));
    Unique_BIGNUM bn(parsed, BN_free);
    CHECK1(BN_add_word(bn, 1));
    return to_hex(bn);
  }
}

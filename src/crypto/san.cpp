// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the Apache 2.0 License.
#include "certissuer/crypto/san.h"

#include <openssl/asn1.h>
#include <openssl/x509v3.h>

namespace certissuer::crypto
{
  bool is_ip_address(const std::string& s)
  {
    ASN1_OCTET_STRING* ip = a2i_IPADDRESS(s.c_str());
    if (ip == nullptr)
    {
      return false;
    }
    ASN1_OCTET_STRING_free(ip);
    return true;
  }
}

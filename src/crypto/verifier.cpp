// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the Apache 2.0 License.

#include "certissuer/crypto/verifier.h"

#include "crypto/openssl/verifier.h"

namespace certissuer::crypto
{
  VerifierUniquePtr make_unique_verifier(const std::vector<uint8_t>& cert)
  {
    return std::make_unique<Verifier_OpenSSL>(cert);
  }

  VerifierPtr make_verifier(const std::vector<uint8_t>& cert)
  {
    return std::make_shared<Verifier_OpenSSL>(cert);
  }

  VerifierUniquePtr make_unique_verifier(const Pem& pem)
  {
    return make_unique_verifier(pem.raw());
  }

  VerifierPtr make_verifier(const Pem& pem)
  {
    return make_verifier(pem.raw());
  }

  std::string get_subject_name(const Pem& cert)
  {
    return make_verifier(cert)->subject();
  }
}

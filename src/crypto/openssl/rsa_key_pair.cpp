// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the Apache 2.0 License.

#include "crypto/openssl/rsa_key_pair.h"

#include "certissuer/crypto/serial.h"
#include "crypto/openssl/cert_builder.h"
#include "crypto/openssl/openssl_wrappers.h"

namespace certissuer::crypto
{
  using namespace OpenSSL;

  RSAKeyPair_OpenSSL::RSAKeyPair_OpenSSL(
    size_t public_key_size, size_t public_exponent)
  {
    Unique_BIGNUM big_exp;
    CHECK1(BN_set_word(big_exp, public_exponent));

    Unique_EVP_PKEY_CTX pctx("RSA");
    CHECK1(EVP_PKEY_keygen_init(pctx));
    CHECKPOSITIVE(EVP_PKEY_CTX_set_rsa_keygen_bits(pctx, public_key_size));
    CHECKPOSITIVE(EVP_PKEY_CTX_set1_rsa_keygen_pubexp(pctx, big_exp));

    EVP_PKEY* generated = nullptr;
    CHECK1(EVP_PKEY_generate(pctx, &generated));
    key.reset(generated);
  }

  RSAKeyPair_OpenSSL::RSAKeyPair_OpenSSL(const Pem& pem)
  {
    Unique_BIO mem(pem);
    key.reset(PEM_read_bio_PrivateKey(mem, nullptr, nullptr, nullptr));
    if (key == nullptr)
    {
      ERR_clear_error();
      throw std::invalid_argument("could not parse PEM private key");
    }
    if (EVP_PKEY_get_base_id(key) != EVP_PKEY_RSA)
    {
      throw std::invalid_argument("private key is not an RSA key");
    }
  }

  Pem RSAKeyPair_OpenSSL::private_key_pem() const
  {
    Unique_BIO buf;

    CHECK1(PEM_write_bio_PrivateKey(
      buf, key, nullptr, nullptr, 0, nullptr, nullptr));

    return Pem(bio_to_string(buf));
  }

  Pem RSAKeyPair_OpenSSL::public_key_pem() const
  {
    Unique_BIO buf;

    CHECK1(PEM_write_bio_PUBKEY(buf, key));

    return Pem(bio_to_string(buf));
  }

  std::vector<uint8_t> RSAKeyPair_OpenSSL::public_key_der() const
  {
    Unique_BIO buf;

    CHECK1(i2d_PUBKEY_bio(buf, key));

    const auto der = bio_to_string(buf);
    return {der.begin(), der.end()};
  }

  size_t RSAKeyPair_OpenSSL::key_size() const
  {
    return EVP_PKEY_get_bits(key);
  }

  Pem RSAKeyPair_OpenSSL::create_csr(
    const DistinguishedName& subject_name,
    const ExtensionProfile& extensions,
    MDType md_type) const
  {
    auto req = create_req(key, subject_name, extensions, md_type);
    return req_to_pem(req);
  }

  Pem RSAKeyPair_OpenSSL::self_sign(
    const DistinguishedName& subject_name,
    const std::string& valid_from,
    const std::string& valid_to,
    MDType md_type) const
  {
    auto name = make_x509_name(subject_name);
    auto crt = create_cert(
      key,
      nullptr,
      name,
      key,
      random_serial(),
      valid_from,
      valid_to,
      ExtensionProfile::certificate_authority(),
      md_type);
    return cert_to_pem(crt);
  }
}

// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the Apache 2.0 License.

#include "crypto/openssl/verifier.h"

#include "certissuer/ds/logger.h"
#include "crypto/openssl/openssl_wrappers.h"
#include "x509_time.h"

#include <arpa/inet.h>
#include <openssl/evp.h>
#include <openssl/ossl_typ.h>
#include <openssl/x509.h>
#include <openssl/x509_vfy.h>
#include <openssl/x509v3.h>

namespace certissuer::crypto
{
  using namespace OpenSSL;

  namespace
  {
    std::string asn1_string_to_utf8(const ASN1_STRING* s)
    {
      unsigned char* utf8 = nullptr;
      const int len = ASN1_STRING_to_UTF8(&utf8, s);
      CHECKPOSITIVE(len + 1);
      std::string result(reinterpret_cast<char*>(utf8), len);
      OPENSSL_free(utf8);
      return result;
    }

    std::string print_name(const X509_NAME* name)
    {
      // Short names, "," separated, in certificate order, UTF-8 unescaped
      static constexpr unsigned long flags = XN_FLAG_SEP_COMMA_PLUS |
        XN_FLAG_FN_SN | ASN1_STRFLGS_UTF8_CONVERT | ASN1_STRFLGS_ESC_CTRL;

      Unique_BIO mem;
      CHECKPOSITIVE(X509_NAME_print_ex(mem, name, 0, flags) + 1);
      return bio_to_string(mem);
    }

    std::string ip_to_string(const ASN1_OCTET_STRING* ip)
    {
      char buf[INET6_ADDRSTRLEN] = {};
      const auto len = ASN1_STRING_length(ip);
      const int family = len == 4 ? AF_INET : (len == 16 ? AF_INET6 : -1);
      if (
        family == -1 ||
        inet_ntop(family, ASN1_STRING_get0_data(ip), buf, sizeof(buf)) ==
          nullptr)
      {
        throw std::runtime_error(
          fmt::format("Invalid iPAddress of length {}", len));
      }
      return buf;
    }

    static constexpr std::pair<uint32_t, const char*> key_usage_names[] = {
      {KU_DIGITAL_SIGNATURE, "digitalSignature"},
      {KU_NON_REPUDIATION, "nonRepudiation"},
      {KU_KEY_ENCIPHERMENT, "keyEncipherment"},
      {KU_DATA_ENCIPHERMENT, "dataEncipherment"},
      {KU_KEY_AGREEMENT, "keyAgreement"},
      {KU_KEY_CERT_SIGN, "keyCertSign"},
      {KU_CRL_SIGN, "cRLSign"},
      {KU_ENCIPHER_ONLY, "encipherOnly"},
      {KU_DECIPHER_ONLY, "decipherOnly"}};
  }

  MDType Verifier_OpenSSL::get_md_type(int mdt)
  {
    switch (mdt)
    {
      case NID_undef:
        return MDType::NONE;
      case NID_sha1:
        return MDType::SHA1;
      case NID_sha256:
        return MDType::SHA256;
      case NID_sha384:
        return MDType::SHA384;
      case NID_sha512:
        return MDType::SHA512;
      default:
        return MDType::NONE;
    }
    return MDType::NONE;
  }

  Verifier_OpenSSL::Verifier_OpenSSL(const std::vector<uint8_t>& c)
  {
    Unique_BIO certbio(c);
    cert = Unique_X509(certbio, true);
    if (cert == nullptr)
    {
      ERR_clear_error();
      BIO_reset(certbio);
      cert = Unique_X509(certbio, false);
      if (cert == nullptr)
      {
        const auto ec = ERR_get_error();
        ERR_clear_error();
        throw std::invalid_argument(
          fmt::format("OpenSSL error: {}", OpenSSL::error_string(ec)));
      }
    }
  }

  Verifier_OpenSSL::~Verifier_OpenSSL() = default;

  std::vector<uint8_t> Verifier_OpenSSL::cert_der()
  {
    Unique_BIO mem;
    CHECK1(i2d_X509_bio(mem, cert));

    BUF_MEM* bptr;
    BIO_get_mem_ptr(mem, &bptr);
    return {(uint8_t*)bptr->data, (uint8_t*)bptr->data + bptr->length};
  }

  Pem Verifier_OpenSSL::cert_pem()
  {
    Unique_BIO mem;
    CHECK1(PEM_write_bio_X509(mem, cert));

    BUF_MEM* bptr = nullptr;
    BIO_get_mem_ptr(mem, &bptr);
    return Pem((uint8_t*)bptr->data, bptr->length);
  }

  Pem Verifier_OpenSSL::public_key_pem() const
  {
    EVP_PKEY* pk = X509_get0_pubkey(cert);
    CHECKNULL(pk);

    Unique_BIO mem;
    CHECK1(PEM_write_bio_PUBKEY(mem, pk));
    return Pem(bio_to_string(mem));
  }

  bool Verifier_OpenSSL::verify_certificate(
    const std::vector<const Pem*>& trusted_certs,
    const std::vector<const Pem*>& chain,
    bool ignore_time,
    std::string* error_reason)
  {
    Unique_X509_STORE store;
    Unique_X509_STORE_CTX store_ctx;

    auto fail = [error_reason](const std::string& reason) {
      if (error_reason != nullptr)
      {
        *error_reason = reason;
      }
      return false;
    };

    for (const auto* pem : trusted_certs)
    {
      Unique_BIO tcbio(*pem);
      Unique_X509 tc(tcbio, true);
      if (tc == nullptr)
      {
        ERR_clear_error();
        LOG_DEBUG_FMT("Failed to load certificate from PEM: {}", pem->str());
        return fail("unable to load trusted certificate");
      }

      CHECK1(X509_STORE_add_cert(store, tc));
    }

    Unique_STACK_OF_X509 chain_stack;
    for (const auto* pem : chain)
    {
      Unique_BIO certbio(*pem);
      Unique_X509 chain_cert(certbio, true);
      if (chain_cert == nullptr)
      {
        ERR_clear_error();
        LOG_DEBUG_FMT("Failed to load certificate from PEM: {}", pem->str());
        return fail("unable to load chain certificate");
      }

      CHECKPOSITIVE(sk_X509_push(chain_stack, chain_cert));
      CHECK1(X509_up_ref(chain_cert));
    }

    // Allow to use intermediate CAs as trust anchors
    CHECK1(X509_STORE_set_flags(store, X509_V_FLAG_PARTIAL_CHAIN));

    CHECK1(X509_STORE_CTX_init(store_ctx, store, cert, chain_stack));

    if (ignore_time)
    {
      X509_VERIFY_PARAM_set_flags(
        X509_STORE_CTX_get0_param(store_ctx), X509_V_FLAG_NO_CHECK_TIME);
    }

    auto valid = X509_verify_cert(store_ctx) == 1;
    if (!valid)
    {
      auto error = X509_STORE_CTX_get_error(store_ctx);
      const auto* msg = X509_verify_cert_error_string(error);
      ERR_clear_error();
      LOG_DEBUG_FMT("Failed to verify certificate: {}", msg);
      LOG_TRACE_FMT("Target: {}", cert_pem().str());
      for (const auto* pem : chain)
      {
        LOG_TRACE_FMT("Chain: {}", pem->str());
      }
      for (const auto* pem : trusted_certs)
      {
        LOG_TRACE_FMT("Trusted: {}", pem->str());
      }
      return fail(msg);
    }
    return valid;
  }

  bool Verifier_OpenSSL::is_self_signed() const
  {
    return X509_get_extension_flags(cert) & EXFLAG_SS;
  }

  std::string Verifier_OpenSSL::serial_number() const
  {
    const ASN1_INTEGER* sn = X509_get0_serialNumber(cert);
    Unique_BIGNUM bn(ASN1_INTEGER_to_BN(sn, nullptr), BN_free);
    char* hex = BN_bn2hex(bn);
    CHECKNULL(hex);
    std::string result(hex);
    OPENSSL_free(hex);
    return result;
  }

  std::pair<std::string, std::string> Verifier_OpenSSL::validity_period() const
  {
    return std::make_pair(
      to_x509_time_string(X509_get0_notBefore(cert)),
      to_x509_time_string(X509_get0_notAfter(cert)));
  }

  std::string Verifier_OpenSSL::subject() const
  {
    return print_name(X509_get_subject_name(cert));
  }

  std::string Verifier_OpenSSL::issuer() const
  {
    return print_name(X509_get_issuer_name(cert));
  }

  std::string Verifier_OpenSSL::common_name() const
  {
    X509_NAME* name = X509_get_subject_name(cert);
    const int idx = X509_NAME_get_index_by_NID(name, NID_commonName, -1);
    if (idx < 0)
    {
      return "";
    }
    return asn1_string_to_utf8(
      X509_NAME_ENTRY_get_data(X509_NAME_get_entry(name, idx)));
  }

  std::vector<SubjectAltName> Verifier_OpenSSL::subject_alt_names() const
  {
    Unique_GENERAL_NAMES names(static_cast<GENERAL_NAMES*>(
      X509_get_ext_d2i(cert, NID_subject_alt_name, nullptr, nullptr)));

    std::vector<SubjectAltName> sans;
    if (names == nullptr)
    {
      return sans;
    }

    for (int i = 0; i < sk_GENERAL_NAME_num(names); ++i)
    {
      const GENERAL_NAME* gn = sk_GENERAL_NAME_value(names, i);
      if (gn->type == GEN_DNS)
      {
        sans.push_back({asn1_string_to_utf8(gn->d.dNSName), false});
      }
      else if (gn->type == GEN_IPADD)
      {
        sans.push_back({ip_to_string(gn->d.iPAddress), true});
      }
    }
    return sans;
  }

  bool Verifier_OpenSSL::is_ca() const
  {
    return X509_get_extension_flags(cert) & EXFLAG_CA;
  }

  bool Verifier_OpenSSL::is_extension_critical(const std::string& name) const
  {
    const int nid = OBJ_sn2nid(name.c_str());
    if (nid == NID_undef)
    {
      throw std::invalid_argument(
        fmt::format("Unknown extension name '{}'", name));
    }

    const int idx = X509_get_ext_by_NID(cert, nid, -1);
    if (idx < 0)
    {
      return false;
    }
    return X509_EXTENSION_get_critical(X509_get_ext(cert, idx)) == 1;
  }

  std::vector<std::string> Verifier_OpenSSL::key_usage() const
  {
    std::vector<std::string> usages;
    if ((X509_get_extension_flags(cert) & EXFLAG_KUSAGE) == 0)
    {
      return usages;
    }

    const uint32_t bits = X509_get_key_usage(cert);
    for (const auto& [bit, usage] : key_usage_names)
    {
      if ((bits & bit) != 0)
      {
        usages.emplace_back(usage);
      }
    }
    return usages;
  }

  std::vector<std::string> Verifier_OpenSSL::extended_key_usage() const
  {
    auto* eku = static_cast<EXTENDED_KEY_USAGE*>(
      X509_get_ext_d2i(cert, NID_ext_key_usage, nullptr, nullptr));

    std::vector<std::string> purposes;
    if (eku == nullptr)
    {
      return purposes;
    }

    for (int i = 0; i < sk_ASN1_OBJECT_num(eku); ++i)
    {
      purposes.emplace_back(
        OBJ_nid2sn(OBJ_obj2nid(sk_ASN1_OBJECT_value(eku, i))));
    }
    EXTENDED_KEY_USAGE_free(eku);
    return purposes;
  }

  bool Verifier_OpenSSL::has_subject_key_identifier() const
  {
    return X509_get0_subject_key_id(cert) != nullptr;
  }

  bool Verifier_OpenSSL::has_authority_key_identifier() const
  {
    return X509_get0_authority_key_id(cert) != nullptr;
  }

  std::string Verifier_OpenSSL::signature_digest() const
  {
    int mdnid = NID_undef, pknid = NID_undef, secbits = 0;
    CHECK1(X509_get_signature_info(cert, &mdnid, &pknid, &secbits, nullptr));
    return to_string(get_md_type(mdnid));
  }
}

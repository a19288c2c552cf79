// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the Apache 2.0 License.

#include "crypto/openssl/cert_builder.h"

#include "certissuer/ds/logger.h"
#include "crypto/openssl/hash.h"
#include "crypto/openssl/x509_time.h"

#include <functional>
#include <openssl/bn.h>
#include <openssl/x509.h>
#include <openssl/x509v3.h>

namespace certissuer::crypto::OpenSSL
{
  namespace
  {
    void add_conf_extension(
      X509V3_CTX* v3ctx,
      int nid,
      const std::string& value,
      const std::function<void(X509_EXTENSION*)>& add)
    {
      if (value.empty())
      {
        return;
      }

      Unique_X509_EXTENSION ext(
        X509V3_EXT_conf_nid(nullptr, v3ctx, nid, value.c_str()));
      add(ext);
    }

    /// Extensions shared by requests and certificates, in certificate order
    void add_profile_extensions(
      X509V3_CTX* v3ctx,
      const ExtensionProfile& profile,
      const std::function<void(X509_EXTENSION*)>& add)
    {
      add_conf_extension(
        v3ctx, NID_basic_constraints, profile.basic_constraints(), add);
      add_conf_extension(v3ctx, NID_key_usage, profile.key_usage, add);
      add_conf_extension(
        v3ctx, NID_ext_key_usage, profile.extended_key_usage, add);

      if (!profile.subject_alt_names.empty())
      {
        auto san = make_subject_alt_name_extension(profile.subject_alt_names);
        add(san);
      }
    }
  }

  Unique_X509_NAME make_x509_name(const DistinguishedName& name)
  {
    Unique_X509_NAME x509_name;

    for (const auto& [attribute, value] : name.entries)
    {
      if (X509_NAME_add_entry_by_txt(
            x509_name,
            attribute.c_str(),
            MBSTRING_UTF8,
            reinterpret_cast<const unsigned char*>(value.data()),
            static_cast<int>(value.size()),
            -1,
            0) != 1)
      {
        const auto ec = ERR_get_error();
        ERR_clear_error();
        throw std::invalid_argument(fmt::format(
          "Invalid name entry {}={}: {}", attribute, value, error_string(ec)));
      }
    }

    return x509_name;
  }

  Unique_X509_EXTENSION make_subject_alt_name_extension(
    const std::vector<SubjectAltName>& sans)
  {
    Unique_GENERAL_NAMES names;

    for (const auto& san : sans)
    {
      Unique_GENERAL_NAME gn;
      if (san.is_ip)
      {
        ASN1_OCTET_STRING* ip = a2i_IPADDRESS(san.san.c_str());
        if (ip == nullptr)
        {
          ERR_clear_error();
          throw std::invalid_argument(
            fmt::format("'{}' is not a valid IP address", san.san));
        }
        GENERAL_NAME_set0_value(gn, GEN_IPADD, ip);
      }
      else
      {
        ASN1_IA5STRING* dns = ASN1_IA5STRING_new();
        CHECKNULL(dns);
        const auto len = static_cast<int>(san.san.size());
        if (ASN1_STRING_set(dns, san.san.data(), len) != 1)
        {
          ASN1_IA5STRING_free(dns);
          CHECK1(0);
        }
        GENERAL_NAME_set0_value(gn, GEN_DNS, dns);
      }

      CHECKPOSITIVE(sk_GENERAL_NAME_push(names, gn));
      gn.release();
    }

    return Unique_X509_EXTENSION(
      X509V3_EXT_i2d(NID_subject_alt_name, 0, (GENERAL_NAMES*)names));
  }

  Unique_X509_REQ create_req(
    EVP_PKEY* key,
    const DistinguishedName& subject_name,
    const ExtensionProfile& extensions,
    MDType md_type)
  {
    Unique_X509_REQ req;

    CHECK1(X509_REQ_set_version(req, X509_REQ_VERSION_1));
    CHECK1(X509_REQ_set_pubkey(req, key));

    auto x509_name = make_x509_name(subject_name);
    CHECK1(X509_REQ_set_subject_name(req, x509_name));

    X509V3_CTX v3ctx;
    X509V3_set_ctx_nodb(&v3ctx);
    X509V3_set_ctx(&v3ctx, nullptr, nullptr, req, nullptr, 0);

    Unique_STACK_OF_X509_EXTENSIONS exts;
    add_profile_extensions(&v3ctx, extensions, [&exts](X509_EXTENSION* ext) {
      X509_EXTENSION* copy = X509_EXTENSION_dup(ext);
      CHECKNULL(copy);
      if (sk_X509_EXTENSION_push(exts, copy) <= 0)
      {
        X509_EXTENSION_free(copy);
        CHECKPOSITIVE(0);
      }
    });
    if (sk_X509_EXTENSION_num(exts) > 0)
    {
      CHECK1(X509_REQ_add_extensions(req, exts));
    }

    CHECKPOSITIVE(X509_REQ_sign(req, key, get_signing_md_type(md_type)));

    return req;
  }

  Unique_X509 create_cert(
    EVP_PKEY* issuer_key,
    X509* issuer_cert,
    const X509_NAME* subject_name,
    EVP_PKEY* subject_key,
    const std::string& serial,
    const std::string& valid_from,
    const std::string& valid_to,
    const ExtensionProfile& extensions,
    MDType md_type)
  {
    Unique_X509 crt;

    // Add version
    CHECK1(X509_set_version(crt, X509_VERSION_3));

    // Add serial number
    BIGNUM* parsed = nullptr;
    if (BN_hex2bn(&parsed, serial.c_str()) <= 0)
    {
      ERR_clear_error();
      throw std::invalid_argument(
        fmt::format("Serial number '{}' is not a hex number", serial));
    }
    Unique_BIGNUM bn(parsed, BN_free);
    Unique_ASN1_INTEGER serial_number(
      BN_to_ASN1_INTEGER(bn, nullptr), ASN1_INTEGER_free);
    CHECK1(X509_set_serialNumber(crt, serial_number));

    // Add issuer and subject names
    CHECK1(X509_set_subject_name(crt, subject_name));
    CHECK1(X509_set_issuer_name(
      crt,
      issuer_cert != nullptr ? X509_get_subject_name(issuer_cert) :
                               subject_name));

    Unique_X509_TIME not_before(valid_from);
    Unique_X509_TIME not_after(valid_to);
    if (!validate_chronological_times(not_before, not_after))
    {
      throw std::invalid_argument(fmt::format(
        "Certificate cannot be created with not_before date {} > not_after "
        "date {}",
        to_x509_time_string(not_before),
        to_x509_time_string(not_after)));
    }

    CHECK1(X509_set1_notBefore(crt, not_before));
    CHECK1(X509_set1_notAfter(crt, not_after));

    CHECK1(X509_set_pubkey(crt, subject_key));

    // Extensions
    X509V3_CTX v3ctx;
    X509V3_set_ctx_nodb(&v3ctx);
    X509V3_set_ctx(
      &v3ctx,
      issuer_cert != nullptr ? issuer_cert : (X509*)crt,
      crt,
      nullptr,
      nullptr,
      0);

    auto add_to_cert = [&crt](X509_EXTENSION* ext) {
      CHECK1(X509_add_ext(crt, ext, -1));
    };
    add_profile_extensions(&v3ctx, extensions, add_to_cert);

    // Key identifiers. The subject key identifier must be present before a
    // self-signed certificate can refer to it as its authority.
    add_conf_extension(&v3ctx, NID_subject_key_identifier, "hash", add_to_cert);
    add_conf_extension(
      &v3ctx,
      NID_authority_key_identifier,
      issuer_cert != nullptr ? "keyid,issuer" : "keyid:always",
      add_to_cert);

    // Sign
    CHECKPOSITIVE(X509_sign(crt, issuer_key, get_signing_md_type(md_type)));

    LOG_TRACE_FMT(
      "Signed certificate with serial {}, valid from {} to {}",
      serial,
      valid_from,
      valid_to);

    return crt;
  }

  Pem req_to_pem(X509_REQ* req)
  {
    Unique_BIO mem;
    CHECK1(PEM_write_bio_X509_REQ(mem, req));
    return Pem(bio_to_string(mem));
  }

  Pem cert_to_pem(X509* cert)
  {
    Unique_BIO mem;
    CHECK1(PEM_write_bio_X509(mem, cert));
    return Pem(bio_to_string(mem));
  }
}

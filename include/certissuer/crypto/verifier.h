// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the Apache 2.0 License.
#pragma once

#include "certissuer/crypto/pem.h"
#include "certissuer/crypto/san.h"

#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace certissuer::crypto
{
  class Verifier
  {
  public:
    Verifier() = default;
    virtual ~Verifier() = default;

    virtual std::vector<uint8_t> cert_der() = 0;
    virtual Pem cert_pem() = 0;

    /** Extract the public key of the certificate in PEM format
     * @return PEM encoded public key
     */
    virtual Pem public_key_pem() const = 0;

    /** Verify the certificate (held internally)
     * @param trusted_certs Vector of trusted certificates
     * @param chain Vector of ordered untrusted certificates used to
     *  build a chain to trusted certificates
     * @param ignore_time Flag to disable certificate expiry checks
     * @param error_reason If not null, set to OpenSSL's description of the
     *  failure when verification fails
     * @return true if the verification is successful
     */
    virtual bool verify_certificate(
      const std::vector<const Pem*>& trusted_certs,
      const std::vector<const Pem*>& chain = {},
      bool ignore_time = false,
      std::string* error_reason = nullptr) = 0;

    /** Indicates whether the certificate (held intenally) is self-signed */
    [[nodiscard]] virtual bool is_self_signed() const = 0;

    /** The serial number of the certificate, as upper-case hex */
    [[nodiscard]] virtual std::string serial_number() const = 0;

    /** The validity period of the certificate */
    [[nodiscard]] virtual std::pair<std::string, std::string> validity_period()
      const = 0;

    /** The subject name of the certificate */
    [[nodiscard]] virtual std::string subject() const = 0;

    /** The issuer name of the certificate */
    [[nodiscard]] virtual std::string issuer() const = 0;

    /** The first common name of the subject, empty if there is none */
    [[nodiscard]] virtual std::string common_name() const = 0;

    /** The DNS names and IP addresses of the subjectAltName extension, in
     * certificate order */
    [[nodiscard]] virtual std::vector<SubjectAltName> subject_alt_names()
      const = 0;

    /** Whether basicConstraints has CA:TRUE */
    [[nodiscard]] virtual bool is_ca() const = 0;

    /** Whether the extension with short name @p name ("basicConstraints",
     * "keyUsage", ...) is present and marked critical */
    [[nodiscard]] virtual bool is_extension_critical(
      const std::string& name) const = 0;

    /** The keyUsage bits that are set, by name ("digitalSignature",
     * "keyEncipherment", ...) */
    [[nodiscard]] virtual std::vector<std::string> key_usage() const = 0;

    /** The extendedKeyUsage purposes, by short name ("serverAuth", ...) */
    [[nodiscard]] virtual std::vector<std::string> extended_key_usage()
      const = 0;

    [[nodiscard]] virtual bool has_subject_key_identifier() const = 0;
    [[nodiscard]] virtual bool has_authority_key_identifier() const = 0;

    /** Name of the signature digest ("sha256", ...) */
    [[nodiscard]] virtual std::string signature_digest() const = 0;
  };

  using VerifierPtr = std::shared_ptr<Verifier>;
  using VerifierUniquePtr = std::unique_ptr<Verifier>;

  /**
   * Construct Verifier from a certificate in DER or PEM format
   * @param cert The certificate containing a public key
   * @throws std::invalid_argument if @p cert cannot be parsed
   */
  VerifierUniquePtr make_unique_verifier(const std::vector<uint8_t>& cert);

  /**
   * Construct Verifier from a certificate in PEM format
   * @param pem The certificate containing a public key
   */
  VerifierUniquePtr make_unique_verifier(const Pem& pem);

  VerifierPtr make_verifier(const std::vector<uint8_t>& cert);

  /** Construct a certificate verifier
   * @param pem The certificate containing a public key
   * @return A verifier
   */
  VerifierPtr make_verifier(const Pem& pem);

  std::string get_subject_name(const Pem& cert);
}

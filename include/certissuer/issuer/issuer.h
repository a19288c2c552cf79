// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the Apache 2.0 License.
#pragma once

#include "certissuer/crypto/pem.h"
#include "certissuer/issuer/alt_names.h"
#include "certissuer/issuer/issue_error.h"
#include "certissuer/issuer/parameters.h"
#include "certissuer/issuer/serial_file.h"
#include "certissuer/issuer/subject.h"

#include <optional>
#include <string>

namespace certissuer::issuer
{
  /**
   * Issues a leaf TLS certificate signed by a certificate authority.
   *
   * Generates a new RSA key, a CSR for @p subject signed by that key, and a
   * certificate for the CSR signed by the CA, with the serial number taken
   * from @p serial_file. The certificate is then parsed back and verified
   * against the CA certificate.
   *
   * Its subjectAltName is the common name, then @p alternates. Its
   * extensions are always basicConstraints critical CA:FALSE, keyUsage
   * critical digitalSignature and keyEncipherment, extendedKeyUsage
   * serverAuth and clientAuth, and subject and authority key identifiers.
   *
   * @throws IssueError naming the failed step. A missing common name, invalid
   *  alternate names and invalid parameters are reported before any key is
   *  generated, and no serial is allocated for a request that fails before
   *  signing.
   */
  IssuanceOutput issue_certificate(
    const CAInputs& ca,
    const SubjectDescriptor& subject,
    const AlternativeNames& alternates,
    const IssuanceParameters& params,
    SerialFile& serial_file);

  /** Parses @p certificate and verifies that it chains to @p ca_certificate
   * (a single certificate or a bundle, all of which are trusted).
   * @throws IssueError with kind MalformedCertificate or
   *  ChainVerificationFailed, carrying OpenSSL's reason
   */
  void verify_issued_certificate(
    const crypto::Pem& certificate, const crypto::Pem& ca_certificate);

  /** Writes the key (mode 0600), the CSR and the certificate. All three are
   * written to temporary siblings first, and none is renamed into place
   * unless every one of them was written.
   * @throws IssueError with kind InvalidArgument if a file cannot be written
   */
  void write_outputs(const IssuanceOutput& output, const OutputPaths& paths);

  /// Human-readable summary of a certificate, one field per line
  std::string describe_certificate(const crypto::Pem& certificate);

  /** Reads the CA key and certificate, and the passphrase (first line of
   * @p passphrase_file) if given.
   * @throws IssueError with kind InvalidArgument if a file cannot be read or
   *  does not hold PEM data
   */
  CAInputs load_ca_inputs(
    const std::string& key_path,
    const std::string& cert_path,
    const std::optional<std::string>& passphrase_file = std::nullopt);
}

// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the Apache 2.0 License.
#pragma once

#include "certissuer/crypto/extensions.h"
#include "certissuer/crypto/md_type.h"
#include "certissuer/crypto/pem.h"

#include <memory>
#include <optional>
#include <string>

namespace certissuer::crypto
{
  /** A certificate authority: its private key and the certificate for that
   * key. The key may be RSA or EC.
   */
  class CAKeyPair
  {
  public:
    virtual ~CAKeyPair() = default;

    virtual Pem cert_pem() const = 0;

    /** Sign a certificate signing request.
     *
     * The request's own signature is checked first. Subject and public key
     * are taken from the request; the extensions are exactly those of
     * @p extensions, and any extensions requested by the CSR are ignored.
     *
     * @param signing_request PEM encoded CSR
     * @param serial Serial number, as a hex string
     * @param valid_from Start of the validity period
     * @param valid_to End of the validity period (inclusive)
     * @param extensions Extensions of the issued certificate
     * @param md_type Digest used to sign the certificate
     * @return PEM encoded certificate
     */
    virtual Pem sign_csr(
      const Pem& signing_request,
      const std::string& serial,
      const std::string& valid_from,
      const std::string& valid_to,
      const ExtensionProfile& extensions,
      MDType md_type = MDType::SHA256) const = 0;
  };

  using CAKeyPairPtr = std::unique_ptr<CAKeyPair>;

  /**
   * Load a certificate authority.
   * @param private_key PEM encoded private key, possibly encrypted
   * @param cert PEM encoded certificate of @p private_key; if it is a bundle,
   *  the first certificate is used
   * @param passphrase Passphrase of an encrypted @p private_key
   * @throws std::invalid_argument if either cannot be parsed, or if the key
   *  does not belong to the certificate
   */
  CAKeyPairPtr make_ca_key_pair(
    const Pem& private_key,
    const Pem& cert,
    const std::optional<std::string>& passphrase = std::nullopt);
}

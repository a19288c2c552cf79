// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the Apache 2.0 License.
#pragma once

#include "certissuer/crypto/san.h"

#include <string>
#include <utility>
#include <vector>

namespace certissuer::crypto
{
  /** The v3 extensions to put on a request or certificate. The usage strings
   * are fixed by the profile constructors below and are in OpenSSL's
   * extension configuration syntax; subject alternative names are encoded as
   * typed GeneralNames.
   */
  struct ExtensionProfile
  {
    bool ca = false;
    std::string key_usage;
    std::string extended_key_usage;
    std::vector<SubjectAltName> subject_alt_names;

    /// End-entity TLS certificate, usable as server and client
    static ExtensionProfile leaf(std::vector<SubjectAltName> sans)
    {
      return {
        false,
        "critical,digitalSignature,keyEncipherment",
        "serverAuth,clientAuth",
        std::move(sans)};
    }

    /// Certificate authority, only used to create self-signed roots
    static ExtensionProfile certificate_authority()
    {
      return {true, "critical,keyCertSign,cRLSign", "", {}};
    }

    [[nodiscard]] std::string basic_constraints() const
    {
      return ca ? "critical,CA:TRUE" : "critical,CA:FALSE";
    }
  };
}

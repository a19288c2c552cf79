// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the Apache 2.0 License.
#pragma once

#include "certissuer/crypto/distinguished_name.h"

#include <optional>
#include <string>

namespace certissuer::issuer
{
  /** Subject of an issued certificate. Optional fields that are absent or
   * empty are left out of the distinguished name entirely.
   */
  struct SubjectDescriptor
  {
    std::optional<std::string> country = std::nullopt;
    std::optional<std::string> state = std::nullopt;
    std::optional<std::string> locality = std::nullopt;
    std::optional<std::string> organization = std::nullopt;
    std::optional<std::string> organizational_unit = std::nullopt;
    std::string common_name = {};
    std::optional<std::string> email = std::nullopt;

    bool operator==(const SubjectDescriptor& other) const = default;
  };

  /** Distinguished name of @p subject, in the order C, ST, L, O, OU, CN,
   * emailAddress
   * @throws std::invalid_argument if the common name is empty
   */
  crypto::DistinguishedName to_distinguished_name(
    const SubjectDescriptor& subject);
}

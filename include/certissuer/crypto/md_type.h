// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the Apache 2.0 License.
#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace certissuer::crypto
{
  enum class MDType : uint8_t
  {
    NONE = 0,
    SHA1,
    SHA256,
    SHA384,
    SHA512
  };

  /** Parses a digest name as accepted on the command line, case-insensitive,
   * with or without the dash: "sha256", "SHA-256", ...
   * @throws std::invalid_argument for unknown names
   */
  MDType md_type_from_string(std::string_view name);

  /// Lower-case name of the digest, as accepted by md_type_from_string
  std::string to_string(MDType md_type);
}

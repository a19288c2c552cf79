// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the Apache 2.0 License.
#include "certissuer/crypto/md_type.h"

#include "certissuer/ds/nonstd.h"

#define FMT_HEADER_ONLY
#include <fmt/format.h>
#include <stdexcept>

namespace certissuer::crypto
{
  MDType md_type_from_string(std::string_view name)
  {
    std::string n(name);
    nonstd::to_lower(n);
    std::erase(n, '-');

    if (n == "sha1")
    {
      return MDType::SHA1;
    }
    else if (n == "sha256")
    {
      return MDType::SHA256;
    }
    else if (n == "sha384")
    {
      return MDType::SHA384;
    }
    else if (n == "sha512")
    {
      return MDType::SHA512;
    }

    throw std::invalid_argument(fmt::format(
      "Unsupported digest '{}', must be one of: sha1, sha256, sha384, sha512",
      name));
  }

  std::string to_string(MDType md_type)
  {
    switch (md_type)
    {
      case MDType::NONE:
        return "none";
      case MDType::SHA1:
        return "sha1";
      case MDType::SHA256:
        return "sha256";
      case MDType::SHA384:
        return "sha384";
      case MDType::SHA512:
        return "sha512";
      default:
        throw std::logic_error("Unknown digest type");
    }
  }
}

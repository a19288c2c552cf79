// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the Apache 2.0 License.
#pragma once

#include <string>
#include <utility>
#include <vector>

namespace certissuer::crypto
{
  /** An ordered X.509 name. Each entry is a short attribute name understood
   * by OpenSSL ("C", "ST", "L", "O", "OU", "CN", "emailAddress") and its
   * value. Values are stored verbatim and are added to certificates as typed
   * UTF-8 strings, so they may contain any character, including ',' and '/'.
   */
  struct DistinguishedName
  {
    std::vector<std::pair<std::string, std::string>> entries;

    void add(const std::string& attribute, const std::string& value)
    {
      entries.emplace_back(attribute, value);
    }

    bool operator==(const DistinguishedName& other) const = default;

    /// Printable rendering, "C=US,O=Example,CN=example.test"
    [[nodiscard]] std::string str() const
    {
      std::string s;
      for (const auto& [attribute, value] : entries)
      {
        if (!s.empty())
        {
          s += ",";
        }
        s += attribute + "=" + value;
      }
      return s;
    }
  };
}

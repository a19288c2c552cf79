// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the Apache 2.0 License.
#pragma once

#include "certissuer/crypto/san.h"

#include <string>
#include <string_view>
#include <vector>

namespace certissuer::issuer
{
  /// Alternate names requested in addition to the common name
  struct AlternativeNames
  {
    std::vector<std::string> dns_names = {};
    std::vector<std::string> ip_addresses = {};

    bool operator==(const AlternativeNames& other) const = default;

    /** Parses comma-separated lists. Entries are trimmed, and empty entries
     * are ignored: from_lists("a, b,,", "") has dns_names {"a", "b"}.
     */
    static AlternativeNames from_lists(
      std::string_view dns_list, std::string_view ip_list);
  };

  /** The subjectAltName entries of a certificate for @p common_name: the
   * common name, then the alternate DNS names, then the IP addresses.
   * @throws std::invalid_argument if an IP address does not parse, or a DNS
   *  name is not printable ASCII
   */
  std::vector<crypto::SubjectAltName> make_subject_alt_names(
    const std::string& common_name, const AlternativeNames& alternates);

  /** Indexed rendering, numbered independently per type:
   * "DNS.1:example.test,DNS.2:www.example.test,IP.1:10.0.0.1"
   */
  std::string to_indexed_string(const std::vector<crypto::SubjectAltName>& sans);
}

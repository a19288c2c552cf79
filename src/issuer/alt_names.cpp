// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the Apache 2.0 License.

#include "certissuer/issuer/alt_names.h"

#include "certissuer/ds/nonstd.h"

#define FMT_HEADER_ONLY
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <stdexcept>

namespace certissuer::issuer
{
  namespace
  {
    // dNSName is an IA5String
    void check_dns_name(const std::string& name)
    {
      for (const unsigned char c : name)
      {
        if (c < 0x20 || c > 0x7e)
        {
          throw std::invalid_argument(fmt::format(
            "'{}' is not a valid DNS name: only printable ASCII is allowed, "
            "internationalised names must be given in punycode (xn--...)",
            name));
        }
      }
    }
  }

  AlternativeNames AlternativeNames::from_lists(
    std::string_view dns_list, std::string_view ip_list)
  {
    return {nonstd::split_list(dns_list), nonstd::split_list(ip_list)};
  }

  std::vector<crypto::SubjectAltName> make_subject_alt_names(
    const std::string& common_name, const AlternativeNames& alternates)
  {
    std::vector<crypto::SubjectAltName> sans;
    sans.reserve(
      1 + alternates.dns_names.size() + alternates.ip_addresses.size());

    check_dns_name(common_name);
    sans.push_back({common_name, false});

    for (const auto& dns : alternates.dns_names)
    {
      check_dns_name(dns);
      sans.push_back({dns, false});
    }

    for (const auto& ip : alternates.ip_addresses)
    {
      if (!crypto::is_ip_address(ip))
      {
        throw std::invalid_argument(
          fmt::format("'{}' is not a valid IP address", ip));
      }
      sans.push_back({ip, true});
    }

    return sans;
  }

  std::string to_indexed_string(const std::vector<crypto::SubjectAltName>& sans)
  {
    size_t dns_index = 0;
    size_t ip_index = 0;
    std::vector<std::string> entries;
    for (const auto& san : sans)
    {
      entries.push_back(
        san.is_ip ? fmt::format("IP.{}:{}", ++ip_index, san.san) :
                    fmt::format("DNS.{}:{}", ++dns_index, san.san));
    }
    return fmt::format("{}", fmt::join(entries, ","));
  }
}

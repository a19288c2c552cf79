// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the Apache 2.0 License.
#pragma once

#define FMT_HEADER_ONLY
#include <fmt/format.h>
#include <string>
#include <vector>

namespace certissuer::crypto
{
  struct SubjectAltName
  {
    std::string san;
    bool is_ip;

    bool operator==(const SubjectAltName& other) const = default;
    bool operator!=(const SubjectAltName& other) const = default;
  };

  /** Whether @p s is a textual IPv4 or IPv6 address that can be encoded in
   * an iPAddress subject alternative name
   */
  bool is_ip_address(const std::string& s);
}

FMT_BEGIN_NAMESPACE
template <>
struct formatter<certissuer::crypto::SubjectAltName>
{
  template <typename ParseContext>
  constexpr auto parse(ParseContext& ctx)
  {
    return ctx.begin();
  }

  template <typename FormatContext>
  auto format(
    const certissuer::crypto::SubjectAltName& san, FormatContext& ctx) const
    -> decltype(ctx.out())
  {
    return format_to(ctx.out(), "{}:{}", san.is_ip ? "IP" : "DNS", san.san);
  }
};
FMT_END_NAMESPACE

// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the Apache 2.0 License.
#pragma once

#define FMT_HEADER_ONLY
#include <fmt/format.h>
#include <stdexcept>
#include <string>
#include <string_view>

namespace certissuer::issuer
{
  enum class IssueErrorKind
  {
    /// Missing or malformed input, detected before or while using it
    InvalidArgument,
    /// Key generation or signing failed in the cryptographic library
    CryptoError,
    /// The issued certificate does not parse
    MalformedCertificate,
    /// The issued certificate does not chain to the CA certificate
    ChainVerificationFailed
  };

  constexpr std::string_view to_string(IssueErrorKind kind)
  {
    switch (kind)
    {
      case IssueErrorKind::InvalidArgument:
        return "InvalidArgument";
      case IssueErrorKind::CryptoError:
        return "CryptoError";
      case IssueErrorKind::MalformedCertificate:
        return "MalformedCertificate";
      case IssueErrorKind::ChainVerificationFailed:
        return "ChainVerificationFailed";
    }
    return "Unknown";
  }

  /// Failure of one issuance step; what() is "<step>: <message>"
  class IssueError : public std::runtime_error
  {
  private:
    IssueErrorKind kind_;
    std::string step_;

  public:
    IssueError(
      IssueErrorKind kind, const std::string& step, const std::string& msg) :
      std::runtime_error(fmt::format("{}: {}", step, msg)),
      kind_(kind),
      step_(step)
    {}

    [[nodiscard]] IssueErrorKind kind() const
    {
      return kind_;
    }

    [[nodiscard]] const std::string& step() const
    {
      return step_;
    }
  };
}

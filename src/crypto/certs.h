// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the Apache 2.0 License.
#pragma once

#include "certissuer/crypto/distinguished_name.h"
#include "certissuer/crypto/key_pair.h"
#include "certissuer/crypto/pem.h"
#include "certissuer/ds/x509_time_fmt.h"

#define FMT_HEADER_ONLY
#include <chrono>
#include <fmt/format.h>
#include <stdexcept>
#include <string>

namespace certissuer::crypto
{
  static std::string compute_cert_valid_to_string(
    const std::string& valid_from, size_t validity_period_days)
  {
    using namespace std::chrono_literals;
    const auto from = ds::sys_seconds_from_string(valid_from);

    // Note: As per RFC 5280, the validity period runs until "notAfter"
    // _inclusive_ so substract one second from the validity period.
    const auto max_days = from > ds::max_x509_time ?
      0 :
      std::chrono::floor<std::chrono::days>(ds::max_x509_time - from + 1s)
        .count();
    if (validity_period_days > static_cast<size_t>(max_days))
    {
      throw std::invalid_argument(fmt::format(
        "Validity period of {} days from {} ends after 9999-12-31",
        validity_period_days,
        valid_from));
    }

    const auto valid_to = from +
      std::chrono::days(static_cast<std::chrono::days::rep>(
        validity_period_days)) -
      1s;
    return ds::to_x509_time_string(valid_to);
  }

  static Pem create_self_signed_ca_cert(
    const RSAKeyPairPtr& key_pair,
    const DistinguishedName& subject_name,
    const std::string& valid_from,
    size_t validity_period_days)
  {
    return key_pair->self_sign(
      subject_name,
      valid_from,
      compute_cert_valid_to_string(valid_from, validity_period_days));
  }
}

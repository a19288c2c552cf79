// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the Apache 2.0 License.
#pragma once

#include <chrono>
#define FMT_HEADER_ONLY
#include <cstdio>
#include <cstring>
#include <ctime>
#include <fmt/chrono.h>
#include <fmt/format.h>
#include <stdexcept>
#include <string>
#include <time.h>
#include <utility>
#include <vector>

namespace certissuer::ds
{
  static inline std::string to_x509_time_string(const std::tm& time)
  {
    // Returns ASN1 time string (YYYYMMDDHHMMSSZ) from time_t, as per
    // https://www.openssl.org/docs/man1.1.1/man3/ASN1_UTCTIME_set.html
    return fmt::format("{:%Y%m%d%H%M%SZ}", time);
  }

  static inline std::string to_x509_time_string(
    const std::chrono::system_clock::time_point& time)
  {
    return to_x509_time_string(
      fmt::gmtime(std::chrono::system_clock::to_time_t(time)));
  }

  /// Latest time an X.509 GeneralizedTime can hold
  static constexpr std::chrono::sys_seconds max_x509_time =
    std::chrono::sys_days(
      std::chrono::year(9999) / std::chrono::December / 31) +
    std::chrono::hours(23) + std::chrono::minutes(59) +
    std::chrono::seconds(59);

  static inline std::string to_x509_time_string(
    const std::chrono::sys_seconds& time)
  {
    return to_x509_time_string(
      fmt::gmtime(static_cast<std::time_t>(time.time_since_epoch().count())));
  }

  /// Parses @p time at second precision, which covers every year an X.509
  /// certificate can carry
  static inline std::chrono::sys_seconds sys_seconds_from_string(
    const std::string& time)
  {
    const char* ts = time.c_str();

    auto accepted_formats = {
      "%y%m%d%H%M%SZ", // ASN.1
      "%Y%m%d%H%M%SZ", // Generalized ASN.1
      "%Y-%m-%d %H:%M:%S",
      "%Y-%m-%dT%H:%M:%SZ",
      "%Y-%m-%d"};

    for (auto afmt : accepted_formats)
    {
      // Sadly %y in std::get_time seems to be broken, so strptime it is.
      struct tm t = {};
      auto sres = strptime(ts, afmt, &t);
      if (sres != NULL && *sres == '\0')
      {
        return std::chrono::sys_seconds(std::chrono::seconds(timegm(&t)));
      }
    }

    // Then there are formats that strptime doesn't support, with a UTC offset
    std::vector<std::pair<const char*, int>> more_formats = {
      // Note: longest format to match first
      {"%04u-%02u-%02u %02u:%02u:%f %d:%02u", 8},
      {"%04u-%02u-%02uT%02u:%02u:%f %d:%02u", 8},
      {"%04u-%02u-%02uT%02u:%02u:%f", 6}};

    for (auto [pattern, n] : more_formats)
    {
      unsigned y = 0, m = 0, d = 0, h = 0, mn = 0, om = 0;
      int oh = 0;
      float s = 0.0;

      int rs = sscanf(ts, pattern, &y, &m, &d, &h, &mn, &s, &oh, &om);
      if (rs == n)
      {
        using namespace std::chrono;

        auto date = year_month_day(year(y), month(m), day(d));
        if (
          !date.ok() || h > 24 || mn > 60 || s < 0.0 || s > 60.0 ||
          (rs == 8 && (oh < -23 || oh > 23 || om > 60)))
        {
          continue;
        }

        auto r = sys_days(date) + hours(h) + minutes(mn) +
          seconds(static_cast<int>(s));
        if (rs == 8)
        {
          const int offset_minutes =
            oh < 0 ? -static_cast<int>(om) : static_cast<int>(om);
          r -= hours(oh) + minutes(offset_minutes);
        }
        return r;
      }
    }

    throw std::invalid_argument(
      fmt::format("'{}' does not match any accepted time format", time));
  }

  static inline std::chrono::system_clock::time_point time_point_from_string(
    const std::string& time)
  {
    return std::chrono::time_point_cast<std::chrono::system_clock::duration>(
      sys_seconds_from_string(time));
  }

  static inline std::string to_x509_time_string(const std::string& time)
  {
    return to_x509_time_string(sys_seconds_from_string(time));
  }
}

// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the Apache 2.0 License.
#pragma once

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <tuple>
#include <unistd.h>
#include <vector>

/**
 * String and file-descriptor helpers that are not available in the standard
 * library, shared by the issuer, the CLI and the tests.
 */
namespace certissuer::nonstd
{
  /** split is based on Python's str.split
   */
  static inline std::vector<std::string_view> split(
    const std::string_view& s,
    const std::string_view& separator = " ",
    size_t max_split = SIZE_MAX)
  {
    std::vector<std::string_view> result;

    size_t separator_end = 0;
    auto next_separator_start = s.find(separator);
    while (next_separator_start != std::string_view::npos &&
           result.size() < max_split)
    {
      result.push_back(
        s.substr(separator_end, next_separator_start - separator_end));

      separator_end = next_separator_start + separator.size();
      next_separator_start = s.find(separator, separator_end);
    }

    result.push_back(s.substr(separator_end));

    return result;
  }

  /* split_1 wraps split and allows writing things like:
   * auto [key, value] = certissuer::nonstd::split_1("CN=example.test", "=")
   */
  static inline std::tuple<std::string_view, std::string_view> split_1(
    const std::string_view& s, const std::string_view& separator)
  {
    const auto v = split(s, separator, 1);
    if (v.size() == 1)
    {
      // If separator is not present, return {s, ""};
      return std::make_tuple(v[0], "");
    }

    return std::make_tuple(v[0], v[1]);
  }

  /** These convert strings to upper or lower case, in-place
   */
  static inline void to_upper(std::string& s)
  {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
      return std::toupper(c);
    });
  }
  static inline void to_lower(std::string& s)
  {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
      return std::tolower(c);
    });
  }

  static inline std::string_view trim(
    std::string_view s, std::string_view trim_chars = " \t\r\n")
  {
    const auto start = std::min(s.find_first_not_of(trim_chars), s.size());
    const auto end = std::min(s.find_last_not_of(trim_chars) + 1, s.size());
    return s.substr(start, end - start);
  }

  /** Splits a separated list ("a, b,,c") into its trimmed, non-empty entries
   * ({"a", "b", "c"}), preserving order
   */
  static inline std::vector<std::string> split_list(
    const std::string_view& s, const std::string_view& separator = ",")
  {
    std::vector<std::string> entries;
    for (const auto& entry : split(s, separator))
    {
      const auto trimmed = trim(entry);
      if (!trimmed.empty())
      {
        entries.emplace_back(trimmed);
      }
    }
    return entries;
  }

  static void close_fd(int* fd)
  {
    if (fd != nullptr && *fd >= 0)
    {
      close(*fd);
      *fd = -1;
    }
  }
  using CloseFdGuard = std::unique_ptr<int, decltype(&close_fd)>;
  static inline CloseFdGuard make_close_fd_guard(int* fd)
  {
    return {fd, close_fd};
  }
}

// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the Apache 2.0 License.
#pragma once

#include "certissuer/crypto/md_type.h"
#include "certissuer/crypto/san.h"
#include "certissuer/ds/nonstd.h"

#include <CLI/CLI.hpp>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#define FMT_HEADER_ONLY
#include <fmt/format.h>

namespace certissuer::cli
{
  using ListValidator = std::function<void(const std::string&)>;

  /** Adds an option taking a comma-separated list, which may be repeated:
   * "-a a,b -a c" gives {"a", "b", "c"}. Entries are trimmed and empty
   * entries are ignored. @p validate throws to reject an entry.
   */
  static CLI::Option* add_list_option(
    CLI::App& app,
    std::optional<std::vector<std::string>>& parsed,
    const std::string& option_name,
    const std::string& option_desc,
    const ListValidator& validate = nullptr)
  {
    CLI::callback_t fun = [&parsed, option_name, validate](
                            const CLI::results_t& results) {
      std::vector<std::string> entries;
      for (const auto& result : results)
      {
        for (auto& entry : nonstd::split_list(result))
        {
          if (validate)
          {
            try
            {
              validate(entry);
            }
            catch (const std::exception& e)
            {
              throw CLI::ValidationError(option_name, e.what());
            }
          }
          entries.push_back(std::move(entry));
        }
      }
      parsed = std::move(entries);
      return true;
    };

    auto* option = app.add_option(option_name, fun, option_desc);
    option->type_name("LIST")
      ->expected(1)
      ->multi_option_policy(CLI::MultiOptionPolicy::TakeAll);

    return option;
  }

  static CLI::Option* add_ip_list_option(
    CLI::App& app,
    std::optional<std::vector<std::string>>& parsed,
    const std::string& option_name,
    const std::string& option_desc)
  {
    return add_list_option(
      app, parsed, option_name, option_desc, [](const std::string& ip) {
        if (!crypto::is_ip_address(ip))
        {
          throw std::invalid_argument(
            fmt::format("'{}' is not a valid IP address", ip));
        }
      });
  }

  static CLI::Option* add_digest_option(
    CLI::App& app,
    std::optional<crypto::MDType>& parsed,
    const std::string& option_name,
    const std::string& option_desc)
  {
    CLI::callback_t fun = [&parsed, option_name](const CLI::results_t& results) {
      if (results.size() != 1)
      {
        throw CLI::ValidationError(option_name, "Digest could not be parsed");
      }

      try
      {
        parsed = crypto::md_type_from_string(results[0]);
      }
      catch (const std::exception& e)
      {
        throw CLI::ValidationError(option_name, e.what());
      }
      return true;
    };

    auto* option = app.add_option(option_name, fun, option_desc);
    option->type_name("DIGEST")->expected(1);

    return option;
  }
}

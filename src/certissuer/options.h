// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the Apache 2.0 License.
#pragma once

#include "certissuer/crypto/md_type.h"
#include "certissuer/issuer/config.h"

#include <CLI/CLI.hpp>
#include <optional>
#include <string>
#include <vector>

namespace certissuer
{
  /// Values as given on the command line; absent options are std::nullopt
  struct CliArgs
  {
    std::string common_name;
    std::optional<int> key_size;
    std::optional<int> validity_days;
    std::optional<crypto::MDType> digest;

    std::optional<std::string> country;
    std::optional<std::string> state;
    std::optional<std::string> locality;
    std::optional<std::string> organization;
    std::optional<std::string> organizational_unit;
    std::optional<std::string> email;

    std::optional<std::vector<std::string>> alt_dns;
    std::optional<std::vector<std::string>> alt_ip;

    std::optional<std::string> serial_file;
    std::optional<std::string> ca_passphrase_file;
    std::optional<std::string> config_file;
    std::optional<issuer::LogFormat> log_format;
    bool verbose = false;

    std::string ca_key;
    std::string ca_cert;
    std::string key_out;
    std::string csr_out;
    std::string cert_out;
  };

  void add_options(CLI::App& app, CliArgs& args);

  /** Merges the command line with the configuration file it names, if any.
   * Command-line values win, then the file, then built-in defaults.
   * @throws std::invalid_argument if the configuration file is invalid
   */
  issuer::IssuerConfig resolve_config(const CliArgs& args);
}

// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the Apache 2.0 License.
#pragma once

#include "certissuer/ds/logger_level.h"
#include "certissuer/issuer/alt_names.h"
#include "certissuer/issuer/parameters.h"
#include "certissuer/issuer/subject.h"

#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace certissuer::issuer
{
  enum class LogFormat
  {
    TEXT,
    JSON
  };

  /// Parses "text" or "json"; @throws std::invalid_argument otherwise
  LogFormat log_format_from_string(std::string_view name);

  struct LoggingConfig
  {
    LoggerLevel level = LoggerLevel::INFO;
    LogFormat format = LogFormat::TEXT;

    bool operator==(const LoggingConfig& other) const = default;
  };

  /** Defaults read from a JSON configuration file. Every field is optional,
   * and values given on the command line take precedence.
   */
  struct ConfigFile
  {
    SubjectDescriptor subject = {};
    AlternativeNames alt_names = {};
    std::optional<int> key_size = std::nullopt;
    std::optional<int> validity_days = std::nullopt;
    std::optional<crypto::MDType> digest = std::nullopt;
    std::optional<std::string> serial_file = std::nullopt;
    std::optional<LoggerLevel> log_level = std::nullopt;
    std::optional<LogFormat> log_format = std::nullopt;
  };

  /** @throws std::invalid_argument on unknown keys, values of the wrong type,
   * unknown digests, log levels or log formats
   */
  void from_json(const nlohmann::json& j, ConfigFile& config);

  /// @throws std::invalid_argument if the file cannot be read or parsed
  ConfigFile load_config_file(const std::string& path);

  /// Everything one run of the tool needs, resolved once from the command
  /// line and the configuration file
  struct IssuerConfig
  {
    SubjectDescriptor subject = {};
    AlternativeNames alt_names = {};
    IssuanceParameters parameters = {};

    std::string ca_key_path = {};
    std::string ca_cert_path = {};
    std::optional<std::string> ca_passphrase_file = std::nullopt;
    std::string serial_file = {};

    OutputPaths outputs = {};
    LoggingConfig logging = {};
    bool verbose = false;
  };
}

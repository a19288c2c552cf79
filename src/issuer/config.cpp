// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the Apache 2.0 License.

#include "certissuer/issuer/config.h"

#include "certissuer/ds/logger.h"
#include "ds/files.h"

#define FMT_HEADER_ONLY
#include <fmt/format.h>
#include <set>

namespace certissuer::issuer
{
  namespace
  {
    using nlohmann::json;

    void check_keys(
      const json& j,
      const std::string& context,
      const std::set<std::string>& allowed)
    {
      if (!j.is_object())
      {
        throw std::invalid_argument(
          fmt::format("{} must be a JSON object", context));
      }

      for (const auto& item : j.items())
      {
        if (allowed.find(item.key()) == allowed.end())
        {
          throw std::invalid_argument(
            fmt::format("Unknown key '{}' in {}", item.key(), context));
        }
      }
    }

    template <typename T>
    std::optional<T> get_optional(const json& j, const std::string& key)
    {
      const auto it = j.find(key);
      if (it == j.end() || it->is_null())
      {
        return std::nullopt;
      }

      try
      {
        return it->get<T>();
      }
      catch (const json::type_error& e)
      {
        throw std::invalid_argument(
          fmt::format("Invalid value for '{}': {}", key, e.what()));
      }
    }

    std::vector<std::string> get_list(const json& j, const std::string& key)
    {
      return get_optional<std::vector<std::string>>(j, key)
        .value_or(std::vector<std::string>{});
    }

    SubjectDescriptor subject_from_json(const json& j)
    {
      check_keys(
        j,
        "subject",
        {"country",
         "state",
         "locality",
         "organization",
         "organizational_unit",
         "email"});

      SubjectDescriptor subject;
      subject.country = get_optional<std::string>(j, "country");
      subject.state = get_optional<std::string>(j, "state");
      subject.locality = get_optional<std::string>(j, "locality");
      subject.organization = get_optional<std::string>(j, "organization");
      subject.organizational_unit =
        get_optional<std::string>(j, "organizational_unit");
      subject.email = get_optional<std::string>(j, "email");
      return subject;
    }
  }

  LogFormat log_format_from_string(std::string_view name)
  {
    if (name == "text")
    {
      return LogFormat::TEXT;
    }
    else if (name == "json")
    {
      return LogFormat::JSON;
    }
    throw std::invalid_argument(fmt::format(
      "Unknown log format '{}', must be one of: text, json", name));
  }

  void from_json(const nlohmann::json& j, ConfigFile& config)
  {
    check_keys(
      j,
      "configuration",
      {"subject",
       "alt_dns",
       "alt_ip",
       "key_size",
       "validity_days",
       "digest",
       "serial_file",
       "logging"});

    config = {};

    if (j.contains("subject"))
    {
      config.subject = subject_from_json(j["subject"]);
    }

    config.alt_names.dns_names = get_list(j, "alt_dns");
    config.alt_names.ip_addresses = get_list(j, "alt_ip");
    config.key_size = get_optional<int>(j, "key_size");
    config.validity_days = get_optional<int>(j, "validity_days");
    config.serial_file = get_optional<std::string>(j, "serial_file");

    if (const auto digest = get_optional<std::string>(j, "digest"))
    {
      config.digest = crypto::md_type_from_string(*digest);
    }

    if (j.contains("logging"))
    {
      const auto& logging = j["logging"];
      check_keys(logging, "logging", {"level", "format"});

      if (const auto level = get_optional<std::string>(logging, "level"))
      {
        config.log_level = logger::level_from_string(*level);
      }
      if (const auto format = get_optional<std::string>(logging, "format"))
      {
        config.log_format = log_format_from_string(*format);
      }
    }
  }

  ConfigFile load_config_file(const std::string& path)
  {
    const auto j = files::slurp_json(path);
    try
    {
      return j.get<ConfigFile>();
    }
    catch (const std::invalid_argument& e)
    {
      throw std::invalid_argument(
        fmt::format("Invalid configuration file {}: {}", path, e.what()));
    }
  }
}

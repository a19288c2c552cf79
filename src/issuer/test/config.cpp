// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the Apache 2.0 License.
#include "certissuer/issuer/config.h"

#include "ds/files.h"
#include "issuer/test/temp_dir.h"

#include <doctest/doctest.h>

using namespace certissuer;
using namespace certissuer::issuer;
using nlohmann::json;

TEST_CASE("Empty configuration")
{
  const auto config = json::object().get<ConfigFile>();
  REQUIRE(config.subject == SubjectDescriptor{});
  REQUIRE(config.alt_names == AlternativeNames{});
  REQUIRE(!config.key_size.has_value());
  REQUIRE(!config.validity_days.has_value());
  REQUIRE(!config.digest.has_value());
  REQUIRE(!config.serial_file.has_value());
  REQUIRE(!config.log_level.has_value());
  REQUIRE(!config.log_format.has_value());
}

TEST_CASE("Full configuration")
{
  const auto j = json::parse(R"({
    "subject": {
      "country": "US",
      "state": "Washington",
      "locality": "Redmond",
      "organization": "Example",
      "organizational_unit": "Ops",
      "email": "ops@example.test"
    },
    "alt_dns": ["www.example.test", "api.example.test"],
    "alt_ip": ["10.0.0.1"],
    "key_size": 3072,
    "validity_days": 90,
    "digest": "sha384",
    "serial_file": "/var/lib/ca/ca.srl",
    "logging": {"level": "debug", "format": "json"}
  })");

  const auto config = j.get<ConfigFile>();
  REQUIRE(config.subject.country == "US");
  REQUIRE(config.subject.state == "Washington");
  REQUIRE(config.subject.locality == "Redmond");
  REQUIRE(config.subject.organization == "Example");
  REQUIRE(config.subject.organizational_unit == "Ops");
  REQUIRE(config.subject.email == "ops@example.test");
  REQUIRE(config.subject.common_name.empty());
  REQUIRE(
    config.alt_names.dns_names ==
    std::vector<std::string>{"www.example.test", "api.example.test"});
  REQUIRE(config.alt_names.ip_addresses == std::vector<std::string>{"10.0.0.1"});
  REQUIRE(config.key_size == 3072);
  REQUIRE(config.validity_days == 90);
  REQUIRE(config.digest == crypto::MDType::SHA384);
  REQUIRE(config.serial_file == "/var/lib/ca/ca.srl");
  REQUIRE(config.log_level == LoggerLevel::DEBUG);
  REQUIRE(config.log_format == LogFormat::JSON);
}

TEST_CASE("Invalid configuration")
{
  const auto invalid = {
    R"([])",
    R"({"common_name": "example.test"})",
    R"({"subject": {"common_name": "example.test"}})",
    R"({"subject": "CN=example.test"})",
    R"({"key_size": "big"})",
    R"({"alt_dns": "www.example.test"})",
    R"({"digest": "md5"})",
    R"({"logging": {"level": "loud"}})",
    R"({"logging": {"format": "xml"}})",
    R"({"logging": {"colour": true}})"};

  for (const auto& s : invalid)
  {
    INFO(s);
    REQUIRE_THROWS_AS(json::parse(s).get<ConfigFile>(), std::invalid_argument);
  }
}

TEST_CASE("Load configuration files")
{
  test::TempDir dir;
  const auto path = dir.path("certissuer.json");

  files::dump_atomic(R"({"validity_days": 30, "alt_ip": ["::1"]})", path);
  const auto config = load_config_file(path);
  REQUIRE(config.validity_days == 30);
  REQUIRE(config.alt_names.ip_addresses == std::vector<std::string>{"::1"});

  files::dump_atomic(R"({"validity_days": 30,)", path);
  REQUIRE_THROWS_AS(load_config_file(path), std::invalid_argument);

  files::dump_atomic(R"({"validity": 30})", path);
  REQUIRE_THROWS_WITH_AS(
    load_config_file(path),
    doctest::Contains("Unknown key 'validity'"),
    std::invalid_argument);

  REQUIRE_THROWS_AS(
    load_config_file(dir.path("missing.json")), std::invalid_argument);
}

TEST_CASE("Log formats")
{
  REQUIRE(log_format_from_string("text") == LogFormat::TEXT);
  REQUIRE(log_format_from_string("json") == LogFormat::JSON);
  REQUIRE_THROWS_AS(log_format_from_string("JSON"), std::invalid_argument);
}

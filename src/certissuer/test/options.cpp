// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the Apache 2.0 License.
#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include "certissuer/options.h"

#include "ds/files.h"
#include "issuer/test/temp_dir.h"

#include <algorithm>
#include <doctest/doctest.h>

using namespace certissuer;

namespace
{
  struct Fixture
  {
    test::TempDir dir;
    std::string ca_key = dir.path("ca.key");
    std::string ca_cert = dir.path("ca.pem");

    Fixture()
    {
      // Only their existence is checked while parsing
      files::dump_atomic("key", ca_key);
      files::dump_atomic("cert", ca_cert);
    }

    CliArgs parse(std::vector<std::string> extra)
    {
      CLI::App app;
      CliArgs args;
      add_options(app, args);

      std::vector<std::string> argv = {
        ca_key, ca_cert, "out.key", "out.csr", "out.pem"};
      argv.insert(argv.begin(), extra.begin(), extra.end());
      std::reverse(argv.begin(), argv.end());
      app.parse(argv);
      return args;
    }
  };
}

TEST_CASE("Defaults")
{
  Fixture f;
  const auto args = f.parse({"-n", "example.test"});
  const auto config = resolve_config(args);

  REQUIRE(config.subject.common_name == "example.test");
  REQUIRE(!config.subject.country.has_value());
  REQUIRE(!config.subject.organization.has_value());
  REQUIRE(config.alt_names == issuer::AlternativeNames{});
  REQUIRE(config.parameters == issuer::IssuanceParameters{});
  REQUIRE(config.parameters.key_size == 2048);
  REQUIRE(config.parameters.validity_days == 825);
  REQUIRE(config.parameters.digest == crypto::MDType::SHA256);
  REQUIRE(config.ca_key_path == f.ca_key);
  REQUIRE(config.ca_cert_path == f.ca_cert);
  REQUIRE(!config.ca_passphrase_file.has_value());
  REQUIRE(config.serial_file == f.dir.path("ca.srl"));
  REQUIRE(
    config.outputs == issuer::OutputPaths{"out.key", "out.csr", "out.pem"});
  REQUIRE(config.logging == issuer::LoggingConfig{});
  REQUIRE(!config.verbose);
}

TEST_CASE("Command-line options")
{
  Fixture f;
  const auto passphrase = f.dir.path("passphrase");
  files::dump_atomic("secret\n", passphrase);

  const auto args = f.parse(
    {"--cn",
     "example.test",
     "-k",
     "4096",
     "--days",
     "30",
     "-m",
     "sha512",
     "-C",
     "US",
     "--state",
     "Washington",
     "-L",
     "Redmond",
     "--org",
     "Example",
     "-U",
     "Ops",
     "--email",
     "ops@example.test",
     "-a",
     "www.example.test,api.example.test",
     "--alt-ip",
     "10.0.0.1",
     "-i",
     "::1",
     "-s",
     "custom.srl",
     "-p",
     passphrase,
     "--log-format",
     "JSON",
     "-v"});
  const auto config = resolve_config(args);

  REQUIRE(config.subject.country == "US");
  REQUIRE(config.subject.state == "Washington");
  REQUIRE(config.subject.locality == "Redmond");
  REQUIRE(config.subject.organization == "Example");
  REQUIRE(config.subject.organizational_unit == "Ops");
  REQUIRE(config.subject.email == "ops@example.test");
  REQUIRE(
    config.alt_names.dns_names ==
    std::vector<std::string>{"www.example.test", "api.example.test"});
  REQUIRE(
    config.alt_names.ip_addresses ==
    std::vector<std::string>{"10.0.0.1", "::1"});
  REQUIRE(config.parameters.key_size == 4096);
  REQUIRE(config.parameters.validity_days == 30);
  REQUIRE(config.parameters.digest == crypto::MDType::SHA512);
  REQUIRE(config.serial_file == "custom.srl");
  REQUIRE(config.ca_passphrase_file == passphrase);
  REQUIRE(config.logging.level == LoggerLevel::DEBUG);
  REQUIRE(config.logging.format == issuer::LogFormat::JSON);
  REQUIRE(config.verbose);
}

TEST_CASE("Configuration file defaults")
{
  Fixture f;
  const auto config_path = f.dir.path("certissuer.json");
  files::dump_atomic(
    R"({
      "subject": {"country": "GB", "organization": "From file"},
      "alt_dns": ["file.example.test"],
      "alt_ip": ["192.168.0.1"],
      "key_size": 3072,
      "validity_days": 90,
      "digest": "sha384",
      "serial_file": "file.srl",
      "logging": {"level": "fail", "format": "json"}
    })",
    config_path);

  {
    INFO("The file fills in what the command line leaves out");
    const auto config =
      resolve_config(f.parse({"-n", "example.test", "-c", config_path}));
    REQUIRE(config.subject.country == "GB");
    REQUIRE(config.subject.organization == "From file");
    REQUIRE(config.subject.common_name == "example.test");
    REQUIRE(
      config.alt_names.dns_names ==
      std::vector<std::string>{"file.example.test"});
    REQUIRE(
      config.alt_names.ip_addresses == std::vector<std::string>{"192.168.0.1"});
    REQUIRE(config.parameters.key_size == 3072);
    REQUIRE(config.parameters.validity_days == 90);
    REQUIRE(config.parameters.digest == crypto::MDType::SHA384);
    REQUIRE(config.serial_file == "file.srl");
    REQUIRE(config.logging.level == LoggerLevel::FAIL);
    REQUIRE(config.logging.format == issuer::LogFormat::JSON);
  }

  {
    INFO("The command line wins");
    const auto config = resolve_config(f.parse(
      {"-n",
       "example.test",
       "-c",
       config_path,
       "-C",
       "US",
       "-a",
       "cli.example.test",
       "-d",
       "7",
       "-m",
       "sha256",
       "-s",
       "cli.srl",
       "--log-format",
       "text",
       "-v"}));
    REQUIRE(config.subject.country == "US");
    REQUIRE(config.subject.organization == "From file");
    REQUIRE(
      config.alt_names.dns_names ==
      std::vector<std::string>{"cli.example.test"});
    REQUIRE(
      config.alt_names.ip_addresses == std::vector<std::string>{"192.168.0.1"});
    REQUIRE(config.parameters.key_size == 3072);
    REQUIRE(config.parameters.validity_days == 7);
    REQUIRE(config.parameters.digest == crypto::MDType::SHA256);
    REQUIRE(config.serial_file == "cli.srl");
    REQUIRE(config.logging.level == LoggerLevel::DEBUG);
    REQUIRE(config.logging.format == issuer::LogFormat::TEXT);
  }

  {
    INFO("Invalid configuration files are reported when resolving");
    files::dump_atomic(R"({"key_size": "large"})", config_path);
    const auto args = f.parse({"-n", "example.test", "-c", config_path});
    REQUIRE_THROWS_AS(resolve_config(args), std::invalid_argument);
  }
}

TEST_CASE("Usage errors")
{
  Fixture f;

  INFO("Missing common name");
  REQUIRE_THROWS_AS(f.parse({}), CLI::RequiredError);

  INFO("Non-positive numbers");
  REQUIRE_THROWS_AS(
    f.parse({"-n", "example.test", "-k", "0"}), CLI::ValidationError);
  REQUIRE_THROWS_AS(
    f.parse({"-n", "example.test", "-d", "-5"}), CLI::ParseError);

  INFO("Unknown digest");
  REQUIRE_THROWS_AS(
    f.parse({"-n", "example.test", "-m", "md5"}), CLI::ValidationError);

  INFO("Invalid IP address");
  REQUIRE_THROWS_AS(
    f.parse({"-n", "example.test", "-i", "not-an-ip"}), CLI::ValidationError);

  INFO("Unknown log format");
  REQUIRE_THROWS_AS(
    f.parse({"-n", "example.test", "--log-format", "xml"}), CLI::ParseError);

  INFO("The common name help describes its character set");
  CLI::App app;
  CliArgs args;
  add_options(app, args);
  REQUIRE(app.help().find("punycode") != std::string::npos);

  INFO("Missing files");
  REQUIRE_THROWS_AS(
    f.parse({"-n", "example.test", "-c", f.dir.path("missing.json")}),
    CLI::ValidationError);
}

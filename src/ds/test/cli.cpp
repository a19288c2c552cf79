// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the Apache 2.0 License.

#include "ds/cli_helper.h"

#include <algorithm>
#include <doctest/doctest.h>

using namespace certissuer;

namespace
{
  void parse(CLI::App& app, std::vector<std::string> args)
  {
    // CLI11 consumes arguments from the back
    std::reverse(args.begin(), args.end());
    app.parse(args);
  }
}

TEST_CASE("List options" * doctest::test_suite("cli"))
{
  CLI::App app;
  std::optional<std::vector<std::string>> names;
  cli::add_list_option(app, names, "-a,--alt-dns", "DNS names");

  parse(app, {});
  REQUIRE(!names.has_value());

  app.clear();
  parse(app, {"-a", "a.test, b.test,,", "--alt-dns", "c.test"});
  REQUIRE(names.has_value());
  REQUIRE(
    *names == std::vector<std::string>{"a.test", "b.test", "c.test"});

  app.clear();
  names.reset();
  parse(app, {"-a", " , "});
  REQUIRE(names.has_value());
  REQUIRE(names->empty());
}

TEST_CASE("IP list options" * doctest::test_suite("cli"))
{
  CLI::App app;
  std::optional<std::vector<std::string>> ips;
  cli::add_ip_list_option(app, ips, "-i,--alt-ip", "IP addresses");

  parse(app, {"-i", "10.0.0.1,::1"});
  REQUIRE(*ips == std::vector<std::string>{"10.0.0.1", "::1"});

  app.clear();
  REQUIRE_THROWS_AS(
    parse(app, {"-i", "10.0.0.1,10.0.0.300"}), CLI::ValidationError);
}

TEST_CASE("Digest options" * doctest::test_suite("cli"))
{
  CLI::App app;
  std::optional<crypto::MDType> digest;
  cli::add_digest_option(app, digest, "-m,--digest", "Digest");

  parse(app, {});
  REQUIRE(!digest.has_value());

  app.clear();
  parse(app, {"--digest", "SHA-384"});
  REQUIRE(digest == crypto::MDType::SHA384);

  app.clear();
  REQUIRE_THROWS_AS(parse(app, {"-m", "md5"}), CLI::ValidationError);
}

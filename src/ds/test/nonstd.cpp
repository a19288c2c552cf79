// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the Apache 2.0 License.

#include "certissuer/ds/nonstd.h"

#include <doctest/doctest.h>
#include <string>

using namespace certissuer;

TEST_CASE("split" * doctest::test_suite("nonstd"))
{
  const auto s = "Good afternoon, good evening, and good night!";

  {
    INFO("Split by spaces");
    auto v = nonstd::split(s, " ");
    REQUIRE(v.size() == 7);
    REQUIRE(v[0] == "Good");
    REQUIRE(v[1] == "afternoon,");
    REQUIRE(v[6] == "night!");
  }

  {
    INFO("Split by comma-with-space");
    auto v = nonstd::split(s, ", ");
    REQUIRE(v.size() == 3);
    REQUIRE(v[0] == "Good afternoon");
    REQUIRE(v[1] == "good evening");
    REQUIRE(v[2] == "and good night!");
  }

  {
    INFO("split(max_splits=3)");
    auto v = nonstd::split(s, " ", 3);
    // NB: max_splits=3 => 4 returned segments
    REQUIRE(v.size() == 4);
    REQUIRE(v[3] == "evening, and good night!");
  }

  {
    INFO("Separator not present");
    auto v = nonstd::split(s, "morning");
    REQUIRE(v.size() == 1);
    REQUIRE(v[0] == s);
  }

  {
    INFO("split_1");
    auto t = nonstd::split_1("CN=example.test=x", "=");
    REQUIRE(std::get<0>(t) == "CN");
    REQUIRE(std::get<1>(t) == "example.test=x");

    auto u = nonstd::split_1("no separator", "=");
    REQUIRE(std::get<0>(u) == "no separator");
    REQUIRE(std::get<1>(u).empty());
  }
}

TEST_CASE("trim" * doctest::test_suite("nonstd"))
{
  REQUIRE(nonstd::trim("  a b \t\r\n") == "a b");
  REQUIRE(nonstd::trim("a") == "a");
  REQUIRE(nonstd::trim("   ").empty());
  REQUIRE(nonstd::trim("").empty());
  REQUIRE(nonstd::trim("secret\r", "\r") == "secret");
  REQUIRE(nonstd::trim(" secret\r", "\r") == " secret");
}

TEST_CASE("split_list" * doctest::test_suite("nonstd"))
{
  REQUIRE(nonstd::split_list("").empty());
  REQUIRE(nonstd::split_list(" , ,").empty());
  REQUIRE(
    nonstd::split_list("a, b,,c ") == std::vector<std::string>{"a", "b", "c"});
  REQUIRE(
    nonstd::split_list("10.0.0.1;::1", ";") ==
    std::vector<std::string>{"10.0.0.1", "::1"});
}

TEST_CASE("case" * doctest::test_suite("nonstd"))
{
  std::string s = "Sha-256";
  nonstd::to_lower(s);
  REQUIRE(s == "sha-256");
  nonstd::to_upper(s);
  REQUIRE(s == "SHA-256");
}

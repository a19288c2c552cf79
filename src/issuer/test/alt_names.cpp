// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the Apache 2.0 License.
#include "certissuer/issuer/alt_names.h"

#include "certissuer/issuer/subject.h"

#include <doctest/doctest.h>
#include <string>

using namespace certissuer;
using namespace certissuer::issuer;

TEST_CASE("Alternate names from lists")
{
  REQUIRE(AlternativeNames::from_lists("", "") == AlternativeNames{});

  const auto names =
    AlternativeNames::from_lists(" a.test, b.test,,", "10.0.0.1 ,::1");
  REQUIRE(names.dns_names == std::vector<std::string>{"a.test", "b.test"});
  REQUIRE(names.ip_addresses == std::vector<std::string>{"10.0.0.1", "::1"});
}

TEST_CASE("Subject alternative names start with the common name")
{
  AlternativeNames alternates{{"www.example.test"}, {"10.0.0.1", "::1"}};
  const auto sans = make_subject_alt_names("example.test", alternates);

  REQUIRE(
    sans ==
    std::vector<crypto::SubjectAltName>{
      {"example.test", false},
      {"www.example.test", false},
      {"10.0.0.1", true},
      {"::1", true}});
  REQUIRE(
    to_indexed_string(sans) ==
    "DNS.1:example.test,DNS.2:www.example.test,IP.1:10.0.0.1,IP.2:::1");

  REQUIRE(to_indexed_string(make_subject_alt_names("solo.test", {})) ==
          "DNS.1:solo.test");
}

TEST_CASE("Invalid alternate names")
{
  REQUIRE_THROWS_AS(
    make_subject_alt_names("example.test", {{}, {"10.0.0.256"}}),
    std::invalid_argument);
  REQUIRE_THROWS_AS(
    make_subject_alt_names("example.test", {{}, {"example.test"}}),
    std::invalid_argument);
  REQUIRE_THROWS_AS(
    make_subject_alt_names("example.test", {{"b\xc3\xbc" "cher.test"}, {}}),
    std::invalid_argument);
  REQUIRE_THROWS_AS(
    make_subject_alt_names("tab\there.test", {}), std::invalid_argument);

  INFO("Non-ASCII names point to punycode");
  try
  {
    make_subject_alt_names("b\xc3\xbc" "cher.test", {});
    FAIL("Expected a non-ASCII common name to be rejected");
  }
  catch (const std::invalid_argument& e)
  {
    REQUIRE(std::string(e.what()).find("punycode") != std::string::npos);
  }
  REQUIRE_NOTHROW(make_subject_alt_names("xn--bcher-kva.test", {}));
}

TEST_CASE("Subject distinguished names")
{
  SubjectDescriptor subject;
  subject.common_name = "example.test";
  REQUIRE(to_distinguished_name(subject).str() == "CN=example.test");

  subject.country = "US";
  subject.state = "Washington";
  subject.locality = "";
  subject.organization = "Example";
  subject.organizational_unit = "Ops";
  subject.email = "ops@example.test";
  REQUIRE(
    to_distinguished_name(subject).str() ==
    "C=US,ST=Washington,O=Example,OU=Ops,CN=example.test,"
    "emailAddress=ops@example.test");

  subject.common_name = "";
  REQUIRE_THROWS_AS(to_distinguished_name(subject), std::invalid_argument);
}

// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the Apache 2.0 License.
#include "certissuer/crypto/md_type.h"
#include "certissuer/ds/x509_time_fmt.h"
#include "crypto/certs.h"
#include "crypto/openssl/hash.h"
#include "crypto/openssl/x509_time.h"

#include <chrono>
#include <doctest/doctest.h>

using namespace certissuer;
using namespace certissuer::crypto;

TEST_CASE("Digest names" * doctest::test_suite("md_type"))
{
  REQUIRE(md_type_from_string("sha256") == MDType::SHA256);
  REQUIRE(md_type_from_string("SHA-256") == MDType::SHA256);
  REQUIRE(md_type_from_string("Sha384") == MDType::SHA384);
  REQUIRE(md_type_from_string("sha-512") == MDType::SHA512);
  REQUIRE(md_type_from_string("sha1") == MDType::SHA1);

  REQUIRE_THROWS_AS(md_type_from_string("md5"), std::invalid_argument);
  REQUIRE_THROWS_AS(md_type_from_string(""), std::invalid_argument);

  for (auto md :
       {MDType::SHA1, MDType::SHA256, MDType::SHA384, MDType::SHA512})
  {
    REQUIRE(md_type_from_string(to_string(md)) == md);
    REQUIRE(OpenSSL::get_md_type(md) != nullptr);
  }

  REQUIRE(OpenSSL::get_md_type(MDType::NONE) == nullptr);
  REQUIRE(OpenSSL::get_signing_md_type(MDType::NONE) == EVP_sha256());
}

TEST_CASE("X509 time strings" * doctest::test_suite("x509_time"))
{
  using namespace std::chrono;

  const auto expected = sys_days(2025y / January / 2) + 3h + 4min + 5s;
  for (const auto& s :
       {"250102030405Z",
        "20250102030405Z",
        "2025-01-02 03:04:05",
        "2025-01-02T03:04:05Z",
        "2025-01-02 05:04:05 +02:00",
        "2025-01-02T03:04:05.250"})
  {
    INFO(s);
    REQUIRE(ds::time_point_from_string(s) == expected);
    REQUIRE(ds::to_x509_time_string(s) == "20250102030405Z");
  }

  REQUIRE(
    ds::time_point_from_string("2025-01-02") == sys_days(2025y / January / 2));

  REQUIRE_THROWS_AS(
    ds::time_point_from_string("yesterday"), std::invalid_argument);
  REQUIRE_THROWS_AS(
    ds::time_point_from_string("2025-02-30 00:00:00 +00:00"),
    std::invalid_argument);
}

TEST_CASE("Validity periods" * doctest::test_suite("x509_time"))
{
  INFO("notAfter is inclusive");
  REQUIRE(
    compute_cert_valid_to_string("20250101000000Z", 1) == "20250101235959Z");
  REQUIRE(
    compute_cert_valid_to_string("2024-02-28 12:00:00", 2) ==
    "20240301115959Z");

  OpenSSL::Unique_X509_TIME from("20250101000000Z");
  OpenSSL::Unique_X509_TIME to("20250101235959Z");
  REQUIRE(OpenSSL::validate_chronological_times(from, to));
  REQUIRE(!OpenSSL::validate_chronological_times(to, from));
  REQUIRE(!OpenSSL::validate_chronological_times(from, from));
  REQUIRE(OpenSSL::validate_chronological_times(from, to, 1));
  REQUIRE(OpenSSL::to_x509_time_string(to) == "20250101235959Z");
}

TEST_CASE("Long validity periods" * doctest::test_suite("x509_time"))
{
  REQUIRE(
    compute_cert_valid_to_string("20261018000000Z", 100000) ==
    "23000802235959Z");
  REQUIRE(
    compute_cert_valid_to_string("20261018000000Z", 214329) ==
    "26130810235959Z");
  REQUIRE(
    compute_cert_valid_to_string("20000101000000Z", 146097) ==
    "23991231235959Z");

  INFO("The last representable notAfter is 9999-12-31 23:59:59");
  REQUIRE(
    compute_cert_valid_to_string("20261018000000Z", 2912153) ==
    "99991231235959Z");
  REQUIRE_THROWS_AS(
    compute_cert_valid_to_string("20261018000000Z", 2912154),
    std::invalid_argument);
  REQUIRE_THROWS_AS(
    compute_cert_valid_to_string("20261018000000Z", 3000000000),
    std::invalid_argument);

  OpenSSL::Unique_X509_TIME far("26130810235959Z");
  REQUIRE(OpenSSL::to_x509_time_string(far) == "26130810235959Z");
  REQUIRE(ds::to_x509_time_string("9999-12-31 23:59:59") == "99991231235959Z");
}

// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the Apache 2.0 License.
#pragma once

#include <cstdint>
#include <cstring>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace certissuer::crypto
{
  // Convenience class ensuring null termination of PEM-encoded keys, requests
  // and certificates
  class Pem
  {
  private:
    std::string s;
    void check_pem_format();

  public:
    Pem() = default;
    Pem(std::string pem_string);
    Pem(const uint8_t* data, size_t size);

    explicit Pem(std::span<const uint8_t> s) : Pem(s.data(), s.size()) {}
    explicit Pem(const std::vector<uint8_t>& v) : Pem(v.data(), v.size()) {}

    bool operator==(const Pem& rhs) const
    {
      return s == rhs.s;
    }

    bool operator!=(const Pem& rhs) const
    {
      return !(*this == rhs);
    }

    [[nodiscard]] const std::string& str() const
    {
      return s;
    }

    uint8_t* data()
    {
      return reinterpret_cast<uint8_t*>(s.data());
    }

    [[nodiscard]] const uint8_t* data() const
    {
      return reinterpret_cast<const uint8_t*>(s.data());
    }

    [[nodiscard]] size_t size() const
    {
      return s.size();
    }

    [[nodiscard]] bool empty() const
    {
      return s.empty();
    }

    [[nodiscard]] std::vector<uint8_t> raw() const
    {
      return {data(), data() + size()};
    }
  };

  /** Splits a PEM bundle into its individual certificates, in file order.
   * Trailing data that is not a complete certificate is ignored.
   */
  std::vector<Pem> split_x509_cert_bundle(const std::string_view& pem);
}

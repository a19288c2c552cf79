// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the Apache 2.0 License.
#pragma once

#include <cstddef>
#include <string>

namespace certissuer::crypto
{
  /// Random positive serial number of @p num_bytes bytes, as upper-case hex
  std::string random_serial(size_t num_bytes = 16);

  /** Serial number following @p serial
   * @param serial Hex string, case-insensitive
   * @return @p serial + 1, as upper-case hex
   * @throws std::invalid_argument if @p serial is not a hex number
   */
  std::string next_serial(const std::string& serial);
}

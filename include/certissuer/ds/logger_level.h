// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the Apache 2.0 License.
#pragma once

#include <cstdint>
namespace certissuer
{
  enum class LoggerLevel : uint8_t
  {
    TRACE,
    DEBUG, // each issuance step and its inputs
    INFO, // the issued certificate and where it was written
    FAIL, // survivable failures that should always be logged
    FATAL, // errors that abort the issuance
    MAX_LOG_LEVEL
  };
}

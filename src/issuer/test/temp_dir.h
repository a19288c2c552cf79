// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the Apache 2.0 License.
#pragma once

#define FMT_HEADER_ONLY
#include <filesystem>
#include <fmt/format.h>
#include <random>
#include <string>
#include <unistd.h>

namespace certissuer::test
{
  /// Fresh directory under the system temporary directory, removed with its
  /// contents on destruction
  class TempDir
  {
  private:
    std::filesystem::path root;

  public:
    TempDir()
    {
      std::random_device rd;
      root = std::filesystem::temp_directory_path() /
        fmt::format("certissuer-test-{}-{:08x}", ::getpid(), rd());
      std::filesystem::create_directories(root);
    }

    ~TempDir()
    {
      std::error_code ec;
      std::filesystem::remove_all(root, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    [[nodiscard]] std::string path(const std::string& name) const
    {
      return (root / name).string();
    }
  };
}

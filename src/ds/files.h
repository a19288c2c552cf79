// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the Apache 2.0 License.
#pragma once

#include "certissuer/ds/nonstd.h"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <optional>
#include <stdexcept>
#include <string>
#include <sys/stat.h>
#include <unistd.h>
#include <utility>
#include <vector>

#define FMT_HEADER_ONLY
#include <fmt/format.h>

namespace certissuer::files
{
  namespace fs = std::filesystem;

  /**
   * @brief Checks if a path exists
   *
   * @param file file to check
   * @return true if the file exists.
   */
  static bool exists(const std::string& file)
  {
    std::ifstream f(file.c_str());
    return f.good();
  }

  /**
   * @brief Reads a file as byte vector.
   *
   * @param file the path
   * @return vector<uint8_t> the file contents as bytes.
   * @throws std::invalid_argument if the file cannot be opened or read
   */
  static std::vector<uint8_t> slurp(const std::string& file)
  {
    std::ifstream f(file, std::ios::binary | std::ios::ate);

    if (!f)
    {
      throw std::invalid_argument(
        fmt::format("Could not open file {}", file));
    }

    auto size = f.tellg();
    f.seekg(0, std::ios::beg);

    std::vector<uint8_t> data(size);
    f.read(reinterpret_cast<char*>(data.data()), size);

    if (!f)
    {
      throw std::invalid_argument(
        fmt::format("Could not read file {}", file));
    }
    return data;
  }

  /**
   * @brief Reads a file as string
   *
   * @param file the path
   * @return std::string the file contents as a string.
   */
  static std::string slurp_string(const std::string& file)
  {
    auto v = slurp(file);
    return {v.begin(), v.end()};
  }

  /**
   * @brief Reads a file as JSON.
   *
   * @param file the path
   * @return nlohmann::json JSON object containing the parsed file
   * @throws std::invalid_argument if the file cannot be read or is not JSON
   */
  static nlohmann::json slurp_json(const std::string& file)
  {
    auto v = slurp(file);
    try
    {
      return nlohmann::json::parse(v.begin(), v.end());
    }
    catch (const nlohmann::json::parse_error& e)
    {
      throw std::invalid_argument(
        fmt::format("Could not parse JSON in {}: {}", file, e.what()));
    }
  }

  static void rename(const fs::path& src, const fs::path& dst)
  {
    std::error_code ec;
    fs::rename(src, dst, ec);
    if (ec)
    {
      throw std::logic_error(fmt::format(
        "Could not rename file {} to {}: {}",
        src.string(),
        dst.string(),
        ec.message()));
    }
  }

  /**
   * @brief A file written to a uniquely named temporary sibling of its
   * target, moved into place by commit(). The temporary file is removed if
   * it is never committed.
   */
  class StagedFile
  {
  private:
    std::string tmp;
    std::string target;

  public:
    StagedFile(std::string tmp_, std::string target_) :
      tmp(std::move(tmp_)),
      target(std::move(target_))
    {}

    StagedFile(const StagedFile&) = delete;
    StagedFile& operator=(const StagedFile&) = delete;

    StagedFile(StagedFile&& other) noexcept :
      tmp(std::exchange(other.tmp, {})),
      target(std::move(other.target))
    {}

    ~StagedFile()
    {
      if (!tmp.empty())
      {
        ::unlink(tmp.c_str());
      }
    }

    const std::string& temp_path() const
    {
      return tmp;
    }

    void commit()
    {
      rename(tmp, target);
      tmp.clear();
    }
  };

  /**
   * @brief Writes @p data to a new temporary sibling of @p file and flushes
   * it to disk. The temporary file is created exclusively, so an existing
   * file or link in its place is never written through.
   *
   * @param data string to write
   * @param file the final path
   * @param mode permissions of the new file
   */
  static StagedFile stage(
    const std::string& data, const std::string& file, mode_t mode = 0644)
  {
    std::string tmp = fmt::format("{}.XXXXXX", file);

    // Created with mode 0600, O_CREAT and O_EXCL
    int fd = ::mkostemp(tmp.data(), O_CLOEXEC);
    if (fd < 0)
    {
      throw std::logic_error(fmt::format(
        "Could not create temporary file for {}: {}",
        file,
        std::strerror(errno)));
    }
    StagedFile staged(tmp, file);
    auto guard = nonstd::make_close_fd_guard(&fd);

    // Not subject to the umask
    if (::fchmod(fd, mode) != 0)
    {
      throw std::logic_error(fmt::format(
        "Could not set permissions of {}: {}", tmp, std::strerror(errno)));
    }

    size_t written = 0;
    while (written < data.size())
    {
      const auto rc =
        ::write(fd, data.data() + written, data.size() - written);
      if (rc < 0)
      {
        if (errno == EINTR)
        {
          continue;
        }
        throw std::logic_error(fmt::format(
          "Failed to write to file {}: {}", tmp, std::strerror(errno)));
      }
      written += rc;
    }

    if (::fsync(fd) != 0)
    {
      throw std::logic_error(fmt::format(
        "Failed to sync file {}: {}", tmp, std::strerror(errno)));
    }
    return staged;
  }

  /**
   * @brief Writes @p data to a temporary sibling of @p file, flushes it to
   * disk, then renames it over @p file. Readers see either the previous
   * content or the new content, never a partial write.
   *
   * @param data string to write
   * @param file the path
   * @param mode permissions of the new file
   */
  static void dump_atomic(
    const std::string& data, const std::string& file, mode_t mode = 0644)
  {
    stage(data, file, mode).commit();
  }
}

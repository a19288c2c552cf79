// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the Apache 2.0 License.

#include "certissuer/issuer/serial_file.h"

#include "certissuer/crypto/serial.h"
#include "certissuer/ds/logger.h"
#include "certissuer/ds/nonstd.h"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <stdexcept>
#include <sys/file.h>
#include <unistd.h>

namespace certissuer::issuer
{
  namespace
  {
    std::runtime_error io_error(const std::string& what, const std::string& path)
    {
      return std::runtime_error(
        fmt::format("{} {}: {}", what, path, std::strerror(errno)));
    }

    class FileLock
    {
    private:
      int fd;

    public:
      FileLock(int fd_, const std::string& path) : fd(fd_)
      {
        while (::flock(fd, LOCK_EX) != 0)
        {
          if (errno != EINTR)
          {
            throw io_error("Could not lock serial file", path);
          }
        }
      }

      ~FileLock()
      {
        ::flock(fd, LOCK_UN);
      }

      FileLock(const FileLock&) = delete;
      FileLock& operator=(const FileLock&) = delete;
    };

    std::string read_all(int fd, const std::string& path)
    {
      std::string content;
      char buf[256];
      while (true)
      {
        const auto n = ::read(fd, buf, sizeof(buf));
        if (n < 0)
        {
          if (errno == EINTR)
          {
            continue;
          }
          throw io_error("Could not read serial file", path);
        }
        if (n == 0)
        {
          return content;
        }
        content.append(buf, n);
      }
    }

    void write_all(int fd, const std::string& data, const std::string& path)
    {
      if (::ftruncate(fd, 0) != 0 || ::lseek(fd, 0, SEEK_SET) != 0)
      {
        throw io_error("Could not truncate serial file", path);
      }

      size_t written = 0;
      while (written < data.size())
      {
        const auto n =
          ::write(fd, data.data() + written, data.size() - written);
        if (n < 0)
        {
          if (errno == EINTR)
          {
            continue;
          }
          throw io_error("Could not write serial file", path);
        }
        written += n;
      }

      if (::fsync(fd) != 0)
      {
        throw io_error("Could not sync serial file", path);
      }
    }
  }

  SerialFile::SerialFile(std::string path_) : path(std::move(path_)) {}

  std::string SerialFile::default_path_for(const std::string& ca_cert_path)
  {
    std::filesystem::path p(ca_cert_path);
    p.replace_extension(".srl");
    return p.string();
  }

  std::string SerialFile::next()
  {
    int fd = ::open(path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
    if (fd < 0)
    {
      throw io_error("Could not open serial file", path);
    }
    auto guard = nonstd::make_close_fd_guard(&fd);
    FileLock lock(fd, path);

    const auto content = read_all(fd, path);
    const auto last = std::string(nonstd::trim(content));

    std::string serial;
    if (last.empty())
    {
      serial = crypto::next_serial(crypto::random_serial());
      LOG_DEBUG_FMT("Created serial file {}", path);
    }
    else
    {
      serial = crypto::next_serial(last);
    }

    write_all(fd, serial + "\n", path);
    LOG_DEBUG_FMT("Allocated serial {} from {}", serial, path);

    return serial;
  }
}

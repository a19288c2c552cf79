// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the Apache 2.0 License.
#pragma once

#include "certissuer/ds/logger_level.h"

#define FMT_HEADER_ONLY
#include <ctime>
#include <fmt/chrono.h>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <iostream>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace certissuer::logger
{
  static constexpr LoggerLevel MOST_VERBOSE = LoggerLevel::TRACE;

  static constexpr const char* LevelNames[] = {
    "trace", "debug", "info", "fail", "fatal"};

  static constexpr const char* to_string(LoggerLevel l)
  {
    return LevelNames[static_cast<int>(l)];
  }

  static inline LoggerLevel level_from_string(std::string_view name)
  {
    for (size_t i = 0; i < static_cast<size_t>(LoggerLevel::MAX_LOG_LEVEL);
         ++i)
    {
      if (name == LevelNames[i])
      {
        return static_cast<LoggerLevel>(i);
      }
    }
    throw std::invalid_argument(fmt::format(
      "Unknown log level '{}', must be one of: {}",
      name,
      fmt::join(LevelNames, ", ")));
  }

  static constexpr auto preamble_length = 40u;

  struct LogLine
  {
  public:
    friend struct Out;
    LoggerLevel log_level;
    std::string file_name;
    size_t line_number;

    std::ostringstream ss;
    std::string msg;

    LogLine(
      LoggerLevel level_, std::string_view file_name_, size_t line_number_) :
      log_level(level_),
      file_name(file_name_),
      line_number(line_number_)
    {
      // Only the basename is worth printing
      auto sep = file_name.find_last_of('/');
      if (sep != std::string::npos)
      {
        file_name = file_name.substr(sep + 1);
      }
    }

    template <typename T>
    LogLine& operator<<(const T& item)
    {
      ss << item;
      return *this;
    }

    LogLine& operator<<(std::ostream& (*f)(std::ostream&))
    {
      ss << f;
      return *this;
    }

    void finalize()
    {
      msg = ss.str();
    }
  };

  static std::string get_timestamp(const std::tm& tm, const ::timespec& ts)
  {
    // Sample: "2019-07-19T18:53:25.690267Z"
    return fmt::format("{:%Y-%m-%dT%H:%M:%S}.{:0>6}Z", tm, ts.tv_nsec / 1000);
  }

  class AbstractLogger
  {
  public:
    AbstractLogger() = default;
    virtual ~AbstractLogger() = default;

    // Standard output is left to the tool's own results
    virtual void emit(const std::string& s)
    {
      std::cerr.write(s.c_str(), s.size());
      std::cerr.flush();
    }

    virtual void write(const LogLine& ll) = 0;
  };

  class JsonConsoleLogger : public AbstractLogger
  {
  public:
    void write(const LogLine& ll) override
    {
      ::timespec host_ts;
      ::timespec_get(&host_ts, TIME_UTC);
      std::tm host_tm;
      ::gmtime_r(&host_ts.tv_sec, &host_tm);

      nlohmann::json j;
      j["ts"] = get_timestamp(host_tm, host_ts);
      j["level"] = to_string(ll.log_level);
      j["file"] = ll.file_name;
      j["number"] = ll.line_number;
      j["msg"] = ll.msg;

      emit(j.dump() + "\n");
    }
  };

  static std::string format_to_text(const LogLine& ll)
  {
    ::timespec host_ts;
    ::timespec_get(&host_ts, TIME_UTC);
    std::tm host_tm;
    ::gmtime_r(&host_ts.tv_sec, &host_tm);

    auto file_line = fmt::format("{}:{} ", ll.file_name, ll.line_number);
    auto file_line_data = file_line.data();

    // The preamble is the level, then file line. If the file line is too
    // long, the final characters are retained.
    auto preamble = fmt::format("[{:<5}] ", to_string(ll.log_level))
                      .substr(0, preamble_length);
    const auto max_file_line_len = preamble_length - preamble.size();

    const auto len = file_line.size();
    if (len > max_file_line_len)
    {
      file_line_data += len - max_file_line_len;
    }

    preamble += file_line_data;

    return fmt::format(
      "{} {:<40}| {}\n", get_timestamp(host_tm, host_ts), preamble, ll.msg);
  }

  class TextConsoleLogger : public AbstractLogger
  {
  public:
    void write(const LogLine& ll) override
    {
      emit(format_to_text(ll));
    }
  };

  class config
  {
  public:
    static inline std::vector<std::unique_ptr<AbstractLogger>>& loggers()
    {
      return get_loggers();
    }

    static inline void add_text_console_logger()
    {
      get_loggers().emplace_back(std::make_unique<TextConsoleLogger>());
    }

    static inline void add_json_console_logger()
    {
      get_loggers().emplace_back(std::make_unique<JsonConsoleLogger>());
    }

    static inline void default_init()
    {
      get_loggers().clear();
      add_text_console_logger();
    }

    static inline LoggerLevel& level()
    {
      static LoggerLevel the_level = LoggerLevel::INFO;

      return the_level;
    }

    static inline bool ok(LoggerLevel l)
    {
      return l >= level();
    }

  private:
    static inline std::vector<std::unique_ptr<AbstractLogger>>& get_loggers()
    {
      static std::vector<std::unique_ptr<AbstractLogger>> the_loggers;
      return the_loggers;
    }
  };

  struct Out
  {
    bool operator==(LogLine& line)
    {
      line.finalize();

      for (auto const& logger : config::loggers())
      {
        logger->write(line);
      }

      return true;
    }
  };

#ifdef __clang__
#  pragma clang diagnostic push
#  pragma clang diagnostic ignored "-Wgnu-zero-variadic-macro-arguments"
#endif

// The == operator is being used to:
// 1. Be a lower precedence than <<, such that using << on the LogLine will
// happen before the LogLine is "equalitied" with the Out.
// 2. Be a higher precedence than &&, such that the log statement is bound
// more tightly than the short-circuiting.
// This allows:
// CERTISSUER_LOG_OUT(DEBUG) << "this " << "msg";
#define CERTISSUER_LOG_OUT(LVL) \
  certissuer::logger::config::ok(certissuer::LoggerLevel::LVL) && \
    certissuer::logger::Out() == \
      certissuer::logger::LogLine( \
        certissuer::LoggerLevel::LVL, __FILE__, __LINE__)

// To avoid repeating the (s, ...) args for every macro, we cheat with a curried
// macro here by ending the macro with another macro name, which then accepts
// the trailing arguments
#define CERTISSUER_LOG_FMT_2(s, ...) fmt::format(FMT_STRING(s), ##__VA_ARGS__)
#define CERTISSUER_LOG_FMT(LVL) CERTISSUER_LOG_OUT(LVL) << CERTISSUER_LOG_FMT_2

#define LOG_TRACE_FMT CERTISSUER_LOG_FMT(TRACE)
#define LOG_DEBUG_FMT CERTISSUER_LOG_FMT(DEBUG)
#define LOG_INFO_FMT CERTISSUER_LOG_FMT(INFO)
#define LOG_FAIL_FMT CERTISSUER_LOG_FMT(FAIL)
#define LOG_FATAL_FMT CERTISSUER_LOG_FMT(FATAL)

#ifdef __clang__
#  pragma clang diagnostic pop
#endif
}

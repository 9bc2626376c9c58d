// Copyright (c) 2025 Omnilink Authors
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Omnilink, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <atomic>
#include <cctype>
#include <chrono>
#include <ctime>
#include <fstream>
#include <functional>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <thread>

namespace omnilink
{
namespace core
{

namespace detail
{
  /// \brief Extract filename from full path at compile-time
  constexpr const char *basename(const char *path)
  {
    const char *file = path;
    while (*path)
    {
      if (*path == '/' || *path == '\\')
      {
        file = path + 1;
      }
      ++path;
    }
    return file;
  }
} // namespace detail

/// \brief Thread-safe process-wide logger with log levels, console or file
/// output, and an optional external handler.
class Logger
{
public:
  enum class Level
  {
    Trace,
    Debug,
    Info,
    Warning,
    Error,
    Fatal
  };

  /// \brief External log handler function type
  /// Takes log level, formatted message, and original message without timestamp/level prefix
  using ExternalHandler = std::function<void(Level level, const std::string &formattedMessage,
                                             const std::string &rawMessage)>;

  /// \brief Configure level and destination. An empty \p filePath logs to
  /// stdout.
  static void init(Level level = Level::Info, const std::string &filePath = "",
                   const std::string &timeFormat = "%Y-%m-%d %H:%M:%S")
  {
    auto &data = getData();
    std::lock_guard<std::mutex> lock(data.mutex);

    data.minLevel.store(level, std::memory_order_relaxed);
    data.timestampFormat = timeFormat;
    data.fileStream.reset();
    if (!filePath.empty())
    {
      data.fileStream = std::make_unique<std::ofstream>(filePath, std::ios::app);
      if (!data.fileStream->is_open())
      {
        std::cerr << "[Logger] Failed to open log file: " << filePath << std::endl;
        data.fileStream.reset();
      }
    }
  }

  static void setLevel(Level level)
  {
    getData().minLevel.store(level, std::memory_order_relaxed);
  }

  static Level getLevel() { return getData().minLevel.load(std::memory_order_relaxed); }

  /// \brief Register an external log handler
  /// When an external handler is registered, file logging and console output are disabled
  static void setExternalHandler(ExternalHandler handler)
  {
    auto &data = getData();
    std::lock_guard<std::mutex> lock(data.mutex);
    data.externalHandler = std::move(handler);
  }

  /// \brief Remove external log handler and restore normal logging
  static void clearExternalHandler()
  {
    auto &data = getData();
    std::lock_guard<std::mutex> lock(data.mutex);
    data.externalHandler = nullptr;
  }

  static void flush()
  {
    auto &data = getData();
    std::lock_guard<std::mutex> lock(data.mutex);
    if (data.fileStream)
    {
      data.fileStream->flush();
    }
    else
    {
      std::cout.flush();
    }
  }

  static void trace(const std::string &message) { log(Level::Trace, message); }
  static void debug(const std::string &message) { log(Level::Debug, message); }
  static void info(const std::string &message) { log(Level::Info, message); }
  static void warning(const std::string &message) { log(Level::Warning, message); }
  static void error(const std::string &message) { log(Level::Error, message); }
  static void fatal(const std::string &message) { log(Level::Fatal, message); }

  static void log(Level level, const std::string &message)
  {
    write(level, message, nullptr, 0);
  }

  /// \brief Log a message with source location information
  /// \param level The log level
  /// \param message The message to log
  /// \param file Source file name (from __FILE__)
  /// \param line Source line number (from __LINE__)
  static void log(Level level, const std::string &message, const char *file, int line)
  {
    write(level, message, file, line);
  }

  static const char *levelToString(Level level)
  {
    switch (level)
    {
    case Level::Trace:
      return "TRACE";
    case Level::Debug:
      return "DEBUG";
    case Level::Info:
      return "INFO";
    case Level::Warning:
      return "WARN";
    case Level::Error:
      return "ERROR";
    case Level::Fatal:
      return "FATAL";
    default:
      return "UNKNOWN";
    }
  }

  /// \brief Parse a level name (case-insensitive): trace, debug, info,
  /// warn/warning, error, fatal.
  static std::optional<Level> parseLevel(const std::string &name)
  {
    std::string lower;
    lower.reserve(name.size());
    for (char c : name)
    {
      lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    if (lower == "trace")
    {
      return Level::Trace;
    }
    if (lower == "debug")
    {
      return Level::Debug;
    }
    if (lower == "info")
    {
      return Level::Info;
    }
    if (lower == "warn" || lower == "warning")
    {
      return Level::Warning;
    }
    if (lower == "error")
    {
      return Level::Error;
    }
    if (lower == "fatal")
    {
      return Level::Fatal;
    }
    return std::nullopt;
  }

private:
  struct LoggerData
  {
    std::mutex mutex;
    std::atomic<Level> minLevel{Level::Info};
    std::string timestampFormat{"%Y-%m-%d %H:%M:%S"};
    std::unique_ptr<std::ofstream> fileStream;
    ExternalHandler externalHandler;
  };

  static LoggerData &getData()
  {
    static LoggerData data;
    return data;
  }

  static std::string timestamp(const std::string &format)
  {
    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

    std::tm tm{};
    ::localtime_r(&t, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, format.c_str());
    if (format.find("%S") != std::string::npos)
    {
      oss << '.' << std::setfill('0') << std::setw(3) << ms.count();
    }
    return oss.str();
  }

  static void write(Level level, const std::string &message, const char *file, int line)
  {
    auto &data = getData();
    if (level < data.minLevel.load(std::memory_order_relaxed))
    {
      return;
    }

    std::lock_guard<std::mutex> lock(data.mutex);

    std::ostringstream oss;
    oss << "[" << timestamp(data.timestampFormat) << "] [" << levelToString(level) << "] ";
    if (file != nullptr)
    {
      oss << "[" << detail::basename(file) << ":" << line << "] ";
    }
    oss << message << "\n";
    const std::string output = oss.str();

    if (data.externalHandler)
    {
      data.externalHandler(level, output, message);
    }
    else if (data.fileStream)
    {
      (*data.fileStream) << output;
      data.fileStream->flush();
    }
    else
    {
      std::cout << output;
    }
  }
};

/// \brief Stream-style logging macro with source location support
#define OMNILINK_LOG_WITH_LEVEL(level, msg)                                                        \
  do                                                                                               \
  {                                                                                                \
    if (omnilink::core::Logger::Level::level >= omnilink::core::Logger::getLevel())               \
    {                                                                                              \
      std::ostringstream _oss;                                                                     \
      _oss << msg;                                                                                 \
      omnilink::core::Logger::log(omnilink::core::Logger::Level::level, _oss.str(), __FILE__,     \
                                  __LINE__);                                                       \
    }                                                                                              \
  } while (0)

#define OMNILINK_LOG_TRACE(msg) OMNILINK_LOG_WITH_LEVEL(Trace, msg)
#define OMNILINK_LOG_DEBUG(msg) OMNILINK_LOG_WITH_LEVEL(Debug, msg)
#define OMNILINK_LOG_INFO(msg) OMNILINK_LOG_WITH_LEVEL(Info, msg)
#define OMNILINK_LOG_WARN(msg) OMNILINK_LOG_WITH_LEVEL(Warning, msg)
#define OMNILINK_LOG_ERROR(msg) OMNILINK_LOG_WITH_LEVEL(Error, msg)
#define OMNILINK_LOG_FATAL(msg) OMNILINK_LOG_WITH_LEVEL(Fatal, msg)

} // namespace core
} // namespace omnilink

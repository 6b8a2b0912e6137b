// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Gossamer, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <algorithm>
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

namespace gossamer
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

/// \brief Process-wide, thread-safe logger with levels, optional file output
/// and an optional external sink.
///
/// The transport components log through the GOSSAMER_LOG_* macros, which
/// capture the source location. Embedders that already own a logging
/// pipeline install an external handler; console and file output are then
/// bypassed.
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

  /// \brief External log handler: level, formatted line, raw message.
  using ExternalHandler = std::function<void(Level level, const std::string &formattedMessage,
                                             const std::string &rawMessage)>;

  /// \brief Configure the minimum level and the output file ("" = stdout).
  static void init(Level level = Level::Info, const std::string &filePath = "",
                   bool showSourceLocation = false)
  {
    auto &data = getData();
    std::lock_guard<std::mutex> lock(data.mutex);
    data.minLevel = level;
    data.showSourceLocation = showSourceLocation;
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
    auto &data = getData();
    std::lock_guard<std::mutex> lock(data.mutex);
    data.minLevel = level;
  }

  static Level getLevel()
  {
    auto &data = getData();
    std::lock_guard<std::mutex> lock(data.mutex);
    return data.minLevel;
  }

  /// \brief Route every log line to \p handler instead of console/file.
  static void setExternalHandler(ExternalHandler handler)
  {
    auto &data = getData();
    std::lock_guard<std::mutex> lock(data.mutex);
    data.externalHandler = std::move(handler);
  }

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
    log(level, message, nullptr, 0, nullptr);
  }

  /// \brief Log a message with source location information
  static void log(Level level, const std::string &message, const char *file, int line,
                  const char *function)
  {
    auto &data = getData();
    std::lock_guard<std::mutex> lock(data.mutex);
    if (level < data.minLevel)
    {
      return;
    }

    std::ostringstream oss;
    oss << '[' << timestamp() << "] [" << levelToString(level) << "] ";
    if (data.showSourceLocation && file)
    {
      oss << '[' << detail::basename(file) << ':' << line << ' ' << (function ? function : "")
          << "] ";
    }
    oss << message << '\n';

    if (data.externalHandler)
    {
      data.externalHandler(level, oss.str(), message);
    }
    else if (data.fileStream)
    {
      (*data.fileStream) << oss.str();
      data.fileStream->flush();
    }
    else
    {
      std::cout << oss.str();
    }
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
    }
    return "UNKNOWN";
  }

  /// \brief Parse a level name as used in configuration files.
  static std::optional<Level> parseLevel(std::string name)
  {
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (name == "trace")
      return Level::Trace;
    if (name == "debug")
      return Level::Debug;
    if (name == "info")
      return Level::Info;
    if (name == "warn" || name == "warning")
      return Level::Warning;
    if (name == "error")
      return Level::Error;
    if (name == "fatal")
      return Level::Fatal;
    return std::nullopt;
  }

private:
  struct LoggerData
  {
    std::mutex mutex;
    Level minLevel{Level::Info};
    bool showSourceLocation{false};
    std::unique_ptr<std::ofstream> fileStream;
    ExternalHandler externalHandler;
  };

  static LoggerData &getData()
  {
    static LoggerData data;
    return data;
  }

  static std::string timestamp()
  {
    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;
    std::tm tm{};
    ::localtime_r(&t, &tm);

    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S") << '.' << std::setfill('0') << std::setw(3)
        << ms.count();
    return oss.str();
  }
};

} // namespace core
} // namespace gossamer

/// \brief Stream-style logging macro with source location support
#define GOSSAMER_LOG_WITH_LEVEL(level, msg)                                                        \
  do                                                                                               \
  {                                                                                                \
    std::ostringstream _oss;                                                                       \
    _oss << msg;                                                                                   \
    gossamer::core::Logger::log(gossamer::core::Logger::Level::level, _oss.str(), __FILE__,        \
                                __LINE__, __func__);                                               \
  } while (0)

#define GOSSAMER_LOG_TRACE(msg) GOSSAMER_LOG_WITH_LEVEL(Trace, msg)
#define GOSSAMER_LOG_DEBUG(msg) GOSSAMER_LOG_WITH_LEVEL(Debug, msg)
#define GOSSAMER_LOG_INFO(msg) GOSSAMER_LOG_WITH_LEVEL(Info, msg)
#define GOSSAMER_LOG_WARN(msg) GOSSAMER_LOG_WITH_LEVEL(Warning, msg)
#define GOSSAMER_LOG_ERROR(msg) GOSSAMER_LOG_WITH_LEVEL(Error, msg)
#define GOSSAMER_LOG_FATAL(msg) GOSSAMER_LOG_WITH_LEVEL(Fatal, msg)

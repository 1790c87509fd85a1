// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of jsonflow, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <cctype>
#include <chrono>
#include <ctime>
#include <fstream>
#include <functional>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>

namespace jsonflow
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

class LoggerStream;

/// \brief Thread-safe synchronous logger with levels, an optional log file and
/// an external handler hook.
///
/// Output goes to stderr unless a file is configured, so that stdout stays
/// free for the NDJSON event stream.
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
  /// Takes log level, formatted message, and original message without
  /// timestamp/level prefix
  using ExternalHandler = std::function<void(Level level, const std::string &formattedMessage,
                                             const std::string &rawMessage)>;

  struct Endl
  {
  };
  static inline constexpr Endl endl{};

  /// \brief (Re)initializes the logger. An empty \p filePath logs to stderr.
  static void init(Level level = Level::Info, const std::string &filePath = "")
  {
    auto &data = getData();
    std::lock_guard<std::mutex> lock(data.mutex);

    data.minLevel = level;
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
      std::cerr.flush();
    }
  }

  /// \brief Flushes and closes the log file; later messages go to stderr.
  static void shutdown()
  {
    flush();
    auto &data = getData();
    std::lock_guard<std::mutex> lock(data.mutex);
    data.fileStream.reset();
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

  /// \brief Register an external log handler
  /// While a handler is registered, file and stderr output are disabled.
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

  static void trace(const std::string &message) { log(Level::Trace, message); }
  static void debug(const std::string &message) { log(Level::Debug, message); }
  static void info(const std::string &message) { log(Level::Info, message); }
  static void warning(const std::string &message) { log(Level::Warning, message); }
  static void error(const std::string &message) { log(Level::Error, message); }
  static void fatal(const std::string &message) { log(Level::Fatal, message); }

  static LoggerStream stream(Level level);

  static void log(Level level, const std::string &message)
  {
    log(level, message, nullptr, 0, nullptr);
  }

  /// \brief Log a message with source location information
  /// \param file Source file name (from __FILE__), may be null
  /// \param line Source line number (from __LINE__)
  /// \param function Function name (from __func__), may be null
  static void log(Level level, const std::string &message, const char *file, int line,
                  const char *function)
  {
    auto &data = getData();
    std::lock_guard<std::mutex> lock(data.mutex);
    if (level < data.minLevel)
    {
      return;
    }

    std::string output = formatLogMessage(level, message, file, line, function);
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
      std::cerr << output;
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
    default:
      return "UNKNOWN";
    }
  }

  /// \brief Parses a configuration level name; unknown names map to Info.
  static Level levelFromString(const std::string &s)
  {
    std::string v;
    v.reserve(s.size());
    for (char c : s)
    {
      v.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    if (v == "trace")
    {
      return Level::Trace;
    }
    if (v == "debug")
    {
      return Level::Debug;
    }
    if (v == "warn" || v == "warning")
    {
      return Level::Warning;
    }
    if (v == "error")
    {
      return Level::Error;
    }
    if (v == "fatal")
    {
      return Level::Fatal;
    }
    return Level::Info;
  }

private:
  struct LoggerData
  {
    std::mutex mutex;
    Level minLevel = Level::Info;
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
    localtime_r(&t, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S") << '.' << std::setfill('0') << std::setw(3)
        << ms.count();
    return oss.str();
  }

  static std::string formatLogMessage(Level level, const std::string &message, const char *file,
                                      int line, const char *function)
  {
    std::ostringstream oss;
    oss << '[' << timestamp() << "] [" << levelToString(level) << "] ";
    if (file)
    {
      oss << '[' << detail::basename(file) << ':' << line;
      if (function)
      {
        oss << ' ' << function;
      }
      oss << "] ";
    }
    oss << message << '\n';
    return oss.str();
  }
};

/// \brief Stream interface for composing and emitting log messages with
/// levels.
class LoggerStream
{
public:
  explicit LoggerStream(Logger::Level level) : _level(level), _flushed(false) {}

  template <typename T> LoggerStream &operator<<(const T &value)
  {
    _stream << value;
    return *this;
  }

  LoggerStream &operator<<(Logger::Endl)
  {
    flush();
    return *this;
  }

  ~LoggerStream()
  {
    try
    {
      if (!_flushed && !_stream.str().empty())
      {
        flush();
      }
    }
    catch (const std::exception &e)
    {
      std::cerr << "[Logger] Failed to emit log message: " << e.what() << std::endl;
    }
  }

private:
  Logger::Level _level;
  std::ostringstream _stream;
  bool _flushed;

  void flush()
  {
    Logger::log(_level, _stream.str());
    _flushed = true;
  }
};

inline LoggerStream Logger::stream(Logger::Level level) { return LoggerStream(level); }

} // namespace core
} // namespace jsonflow

/// \brief Stream-style logging macro with source location
#define JSONFLOW_LOG_WITH_LEVEL(level, msg)                                                        \
  do                                                                                               \
  {                                                                                                \
    std::ostringstream _oss;                                                                       \
    _oss << msg;                                                                                   \
    jsonflow::core::Logger::log(jsonflow::core::Logger::Level::level, _oss.str(), __FILE__,        \
                                __LINE__, __func__);                                               \
  } while (0)

#define JSONFLOW_LOG_TRACE(msg) JSONFLOW_LOG_WITH_LEVEL(Trace, msg)
#define JSONFLOW_LOG_DEBUG(msg) JSONFLOW_LOG_WITH_LEVEL(Debug, msg)
#define JSONFLOW_LOG_INFO(msg) JSONFLOW_LOG_WITH_LEVEL(Info, msg)
#define JSONFLOW_LOG_WARN(msg) JSONFLOW_LOG_WITH_LEVEL(Warning, msg)
#define JSONFLOW_LOG_ERROR(msg) JSONFLOW_LOG_WITH_LEVEL(Error, msg)
#define JSONFLOW_LOG_FATAL(msg) JSONFLOW_LOG_WITH_LEVEL(Fatal, msg)

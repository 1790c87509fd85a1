// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of jsonflow, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#define CATCH_CONFIG_MAIN
#include "test_helpers.hpp"
#include <catch2/catch.hpp>

#include <cstdio>
#include <fstream>
#include <sstream>
#include <string>
#include <unistd.h>
#include <vector>

using jsonflow::core::Logger;

namespace
{
struct LogCapture
{
  Logger::Level level;
  std::string formattedMessage;
  std::string rawMessage;
};

std::vector<LogCapture> capturedLogs;

void externalLogHandler(Logger::Level level, const std::string &formattedMessage,
                        const std::string &rawMessage)
{
  capturedLogs.push_back({level, formattedMessage, rawMessage});
}

/// \brief Routes log output into capturedLogs for the lifetime of a test.
struct CaptureScope
{
  explicit CaptureScope(Logger::Level level)
  {
    capturedLogs.clear();
    Logger::setExternalHandler(externalLogHandler);
    Logger::setLevel(level);
  }
  ~CaptureScope()
  {
    Logger::clearExternalHandler();
    Logger::setLevel(Logger::Level::Info);
  }
};
} // namespace

TEST_CASE("Logger level filtering", "[logger][level]")
{
  CaptureScope scope(Logger::Level::Warning);

  Logger::debug("hidden debug");
  Logger::info("hidden info");
  Logger::warning("shown warning");
  Logger::error("shown error");
  Logger::fatal("shown fatal");

  REQUIRE(capturedLogs.size() == 3);
  REQUIRE(capturedLogs[0].level == Logger::Level::Warning);
  REQUIRE(capturedLogs[1].level == Logger::Level::Error);
  REQUIRE(capturedLogs[2].level == Logger::Level::Fatal);
  REQUIRE(Logger::getLevel() == Logger::Level::Warning);
}

TEST_CASE("Logger message format", "[logger][format]")
{
  CaptureScope scope(Logger::Level::Trace);

  SECTION("Plain messages carry timestamp and level")
  {
    Logger::info("plain message");
    REQUIRE(capturedLogs.size() == 1);
    REQUIRE(capturedLogs[0].rawMessage == "plain message");
    REQUIRE(capturedLogs[0].formattedMessage.front() == '[');
    REQUIRE(capturedLogs[0].formattedMessage.find("] [INFO] plain message\n") !=
            std::string::npos);
  }

  SECTION("Macros add the source location and stream their arguments")
  {
    JSONFLOW_LOG_WARN("cycle " << 3 << " left " << 12 << " bytes");
    REQUIRE(capturedLogs.size() == 1);
    REQUIRE(capturedLogs[0].rawMessage == "cycle 3 left 12 bytes");
    REQUIRE(capturedLogs[0].formattedMessage.find("[WARN]") != std::string::npos);
    REQUIRE(capturedLogs[0].formattedMessage.find("[jsonflow_test_logger.cpp:") !=
            std::string::npos);
  }

  SECTION("LoggerStream emits on endl or destruction")
  {
    Logger::stream(Logger::Level::Debug) << "streamed " << 42 << Logger::endl;
    {
      auto s = Logger::stream(Logger::Level::Error);
      s << "on destruction";
    }
    REQUIRE(capturedLogs.size() == 2);
    REQUIRE(capturedLogs[0].rawMessage == "streamed 42");
    REQUIRE(capturedLogs[0].level == Logger::Level::Debug);
    REQUIRE(capturedLogs[1].rawMessage == "on destruction");
  }
}

TEST_CASE("Logger level names", "[logger][level]")
{
  REQUIRE(std::string(Logger::levelToString(Logger::Level::Warning)) == "WARN");
  REQUIRE(Logger::levelFromString("DEBUG") == Logger::Level::Debug);
  REQUIRE(Logger::levelFromString("warning") == Logger::Level::Warning);
  REQUIRE(Logger::levelFromString("warn") == Logger::Level::Warning);
  REQUIRE(Logger::levelFromString("trace") == Logger::Level::Trace);
  REQUIRE(Logger::levelFromString("fatal") == Logger::Level::Fatal);
  REQUIRE(Logger::levelFromString("loud") == Logger::Level::Info);
}

TEST_CASE("Logger writes to a log file", "[logger][file]")
{
  const std::string path = "/tmp/jsonflow_test_logger_" + std::to_string(::getpid()) + ".log";
  std::remove(path.c_str());

  Logger::init(Logger::Level::Info, path);
  Logger::debug("not written");
  JSONFLOW_LOG_INFO("written to file");
  Logger::shutdown();

  std::ifstream in(path);
  REQUIRE(in.is_open());
  std::stringstream content;
  content << in.rdbuf();
  REQUIRE(content.str().find("written to file") != std::string::npos);
  REQUIRE(content.str().find("not written") == std::string::npos);

  std::remove(path.c_str());
  Logger::init(Logger::Level::Info);
}

// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of jsonflow, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

/// \file todo_stream.cpp
/// \brief Replays a recorded model response as a fragment stream and prints
/// the todo-list events as they become available.
///
/// The input (a file, or stdin) is cut into fragments of \c fragment_size
/// bytes and handed to the feed loop by a producer thread, optionally with a
/// delay between fragments to mimic a model generating text. Events go to
/// stdout as NDJSON or as plain text; logs go to stderr or the log file.

#include <jsonflow/jsonflow.hpp>

#include <chrono>
#include <csignal>
#include <cstdlib>
#include <fstream>
#include <functional>
#include <iostream>
#include <iterator>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace
{

constexpr int EXIT_PARSE_ERROR = 1;
constexpr int EXIT_USAGE_ERROR = 2;
constexpr int EXIT_CANCELLED = 130;

/// \brief Bad command line or configuration.
class UsageError : public std::runtime_error
{
public:
  using std::runtime_error::runtime_error;
};

struct Config
{
  std::optional<std::string> configFile;
  std::optional<std::string> input;
  std::optional<std::size_t> chunkBufferSize;
  std::optional<std::size_t> fragmentSize;
  std::optional<std::size_t> fragmentDelayMs;
  std::optional<std::size_t> maxDepth;
  std::optional<std::string> logLevel;
  std::optional<std::string> logFile;
  std::optional<std::string> outputFormat;
};

jsonflow::core::CancellationToken &cancellation()
{
  static jsonflow::core::CancellationToken token;
  return token;
}

void printHelp()
{
  std::cout << "Usage: todo_stream [options] [input-file]\n"
            << "Reads the model response from input-file, or stdin when omitted or '-'.\n\n"
            << "  -h, --help                     Show this help message\n"
            << "  -c, --config <file>            Configuration file path\n"
            << "  -b, --chunk-buffer-size <n>    Fragments per drive cycle (default: 48)\n"
            << "      --fragment-size <n>        Bytes per replayed fragment (default: 16)\n"
            << "      --fragment-delay-ms <n>    Delay between fragments (default: 0)\n"
            << "      --max-depth <n>            Maximum JSON nesting depth (default: 64)\n"
            << "  -l, --log-level <level>        Log level (trace, debug, info, warning, "
               "error, fatal)\n"
            << "  -f, --log-file <file>          Log file path (default: stderr)\n"
            << "  -o, --output <format>          ndjson or text (default: ndjson)\n";
}

std::size_t parsePositive(const std::string &option, const std::string &value, bool allowZero)
{
  try
  {
    std::size_t used = 0;
    long long parsed = std::stoll(value, &used);
    if (used != value.size() || parsed < 0 || (parsed == 0 && !allowZero))
    {
      throw std::invalid_argument(value);
    }
    return static_cast<std::size_t>(parsed);
  }
  catch (const std::exception &)
  {
    throw UsageError("Invalid value for " + option + ": " + value);
  }
}

/// \return false if help was requested
bool parseCliArgs(int argc, char **argv, Config &config)
{
  for (int i = 1; i < argc; ++i)
  {
    std::string arg = argv[i];
    auto value = [&]() -> std::string
    {
      if (i + 1 >= argc)
      {
        throw UsageError("Missing value for " + arg);
      }
      return argv[++i];
    };

    if (arg == "-h" || arg == "--help")
    {
      printHelp();
      return false;
    }
    else if (arg == "-c" || arg == "--config")
    {
      config.configFile = value();
    }
    else if (arg == "-b" || arg == "--chunk-buffer-size")
    {
      config.chunkBufferSize = parsePositive(arg, value(), false);
    }
    else if (arg == "--fragment-size")
    {
      config.fragmentSize = parsePositive(arg, value(), false);
    }
    else if (arg == "--fragment-delay-ms")
    {
      config.fragmentDelayMs = parsePositive(arg, value(), true);
    }
    else if (arg == "--max-depth")
    {
      config.maxDepth = parsePositive(arg, value(), false);
    }
    else if (arg == "-l" || arg == "--log-level")
    {
      config.logLevel = value();
    }
    else if (arg == "-f" || arg == "--log-file")
    {
      config.logFile = value();
    }
    else if (arg == "-o" || arg == "--output")
    {
      config.outputFormat = value();
    }
    else if (arg != "-" && arg.length() > 0 && arg[0] == '-')
    {
      throw UsageError("Unknown option: " + arg);
    }
    else if (config.input)
    {
      throw UsageError("Only one input file may be given");
    }
    else
    {
      config.input = arg;
    }
  }
  return true;
}

/// \brief Fills the settings not given on the command line from the TOML
/// file, then applies defaults.
void applyTomlConfig(Config &config)
{
  if (config.configFile)
  {
    jsonflow::core::ConfigLoader loader(*config.configFile);
    try
    {
      loader.load();
      if (!config.chunkBufferSize)
      {
        config.chunkBufferSize = loader.getPositive("stream.chunk_buffer_size");
      }
      if (!config.fragmentSize)
      {
        config.fragmentSize = loader.getPositive("stream.fragment_size");
      }
      if (!config.fragmentDelayMs)
      {
        if (auto delay = loader.getInt("stream.fragment_delay_ms"))
        {
          if (*delay < 0)
          {
            throw std::invalid_argument("'stream.fragment_delay_ms' must not be negative");
          }
          config.fragmentDelayMs = static_cast<std::size_t>(*delay);
        }
      }
      if (!config.maxDepth)
      {
        config.maxDepth = loader.getPositive("stream.max_depth");
      }
      if (!config.logLevel)
      {
        config.logLevel = loader.getString("log.level");
      }
      if (!config.logFile)
      {
        config.logFile = loader.getString("log.file");
      }
      if (!config.outputFormat)
      {
        config.outputFormat = loader.getString("output.format");
      }
    }
    catch (const std::exception &e)
    {
      throw UsageError(e.what());
    }
  }

  if (!config.chunkBufferSize)
  {
    config.chunkBufferSize = 48;
  }
  if (!config.fragmentSize)
  {
    config.fragmentSize = 16;
  }
  if (!config.fragmentDelayMs)
  {
    config.fragmentDelayMs = 0;
  }
  if (!config.maxDepth)
  {
    config.maxDepth = 64;
  }
  if (!config.logLevel)
  {
    config.logLevel = "info";
  }
  if (!config.logFile)
  {
    config.logFile = "";
  }
  if (!config.outputFormat)
  {
    config.outputFormat = "ndjson";
  }
  if (*config.outputFormat != "ndjson" && *config.outputFormat != "text")
  {
    throw UsageError("Unknown output format: " + *config.outputFormat);
  }
}

std::string readInput(const Config &config)
{
  if (!config.input || *config.input == "-")
  {
    return std::string(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
  }
  std::ifstream file(*config.input, std::ios::binary);
  if (!file)
  {
    throw UsageError("Cannot open input file: " + *config.input);
  }
  return std::string(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
}

/// \brief Producer side: pushes the recorded response one fragment at a time.
void produce(jsonflow::stream::QueueFragmentSource &source,
             std::vector<jsonflow::stream::Fragment> fragments, std::chrono::milliseconds delay)
{
  try
  {
    for (auto &fragment : fragments)
    {
      if (cancellation().isCancelled())
      {
        break;
      }
      if (delay.count() > 0)
      {
        std::this_thread::sleep_for(delay);
      }
      if (!source.push(std::move(fragment)))
      {
        JSONFLOW_LOG_DEBUG("Consumer closed the stream; producer stopping");
        return;
      }
    }
    source.complete();
  }
  catch (const std::exception &)
  {
    source.fail(std::current_exception());
  }
}

int run(const Config &config)
{
  using namespace jsonflow;

  std::string response = readInput(config);
  auto fragments = stream::splitFragments(response, *config.fragmentSize);
  JSONFLOW_LOG_INFO("Replaying " << response.size() << " byte(s) as " << fragments.size()
                                 << " fragment(s)");

  std::unique_ptr<stream::IEventSink<todo::TodoListEvent>> sink;
  if (*config.outputFormat == "text")
  {
    sink = std::make_unique<todo::TodoListTextSink>(std::cout);
  }
  else
  {
    sink = std::make_unique<stream::NdjsonStreamSink<todo::TodoListEvent>>(std::cout);
  }

  stream::FeederOptions options;
  options.chunkBufferSize = *config.chunkBufferSize;
  options.reader.maxDepth = *config.maxDepth;

  todo::TodoListJsonParser parser;
  stream::JsonStreamFeeder<todo::TodoListEvent> feeder(parser, options);

  stream::QueueFragmentSource source(256, cancellation());
  std::thread producer(produce, std::ref(source), std::move(fragments),
                       std::chrono::milliseconds(*config.fragmentDelayMs));

  int exitCode = EXIT_SUCCESS;
  try
  {
    auto result = feeder.feed(source, *sink, &cancellation());
    if (result.cancelled)
    {
      exitCode = EXIT_CANCELLED;
    }
  }
  catch (const parsers::JsonReaderException &e)
  {
    std::cerr << "Malformed JSON at line " << e.line() << ", column " << e.column() << ": "
              << e.reason() << std::endl;
    exitCode = EXIT_PARSE_ERROR;
  }
  catch (const stream::JsonStreamError &e)
  {
    std::cerr << "Invalid todo list: " << e.what() << std::endl;
    exitCode = EXIT_PARSE_ERROR;
  }
  catch (const std::exception &e)
  {
    std::cerr << "Stream failed: " << e.what() << std::endl;
    exitCode = EXIT_PARSE_ERROR;
  }
  producer.join();
  return exitCode;
}

} // namespace

int main(int argc, char **argv)
{
  Config config;
  try
  {
    if (!parseCliArgs(argc, argv, config))
    {
      return EXIT_SUCCESS;
    }
    applyTomlConfig(config);
    jsonflow::core::Logger::init(jsonflow::core::Logger::levelFromString(*config.logLevel),
                                 *config.logFile);
    if (config.configFile)
    {
      JSONFLOW_LOG_INFO("Using config file: " << *config.configFile);
    }
  }
  catch (const std::exception &e)
  {
    std::cerr << "Error: " << e.what() << std::endl;
    printHelp();
    return EXIT_USAGE_ERROR;
  }

  cancellation();
  std::signal(SIGINT, [](int) { cancellation().cancel(); });

  int exitCode = EXIT_SUCCESS;
  try
  {
    exitCode = run(config);
  }
  catch (const UsageError &e)
  {
    std::cerr << "Error: " << e.what() << std::endl;
    exitCode = EXIT_USAGE_ERROR;
  }
  catch (const std::exception &e)
  {
    JSONFLOW_LOG_FATAL("todo_stream failed: " << e.what());
    exitCode = EXIT_FAILURE;
  }
  jsonflow::core::Logger::shutdown();
  return exitCode;
}

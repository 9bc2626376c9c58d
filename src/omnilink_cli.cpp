// Copyright (c) 2025 Omnilink Authors
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Omnilink, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#include <omnilink/omnilink.hpp>

#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace
{

struct CliOptions
{
  std::optional<std::string> configFile;
  std::vector<std::string> endpoints;
  std::optional<std::uint64_t> chainId;
  std::string method;
  std::string params{"[]"};
  std::optional<std::chrono::milliseconds> timeout;
  std::optional<std::string> logLevel;
  std::optional<std::string> logFile;
};

/// \brief Print help message
void printHelp()
{
  std::cout << "Usage: omnilink_cli [options] -m <method>\n"
            << "  -h, --help                 Show this help message\n"
            << "  -c, --config <file>        JSON configuration file\n"
            << "  -e, --endpoint <uri>       ws:// or wss:// endpoint (repeatable)\n"
            << "      --chain-id <id>        Chain id (default: 1)\n"
            << "  -m, --method <name>        Method to call, e.g. eth_getBalance\n"
            << "  -p, --params <json>        Parameters as JSON (default: [])\n"
            << "  -t, --timeout <ms>         Call timeout in milliseconds\n"
            << "  -l, --log-level <level>    Log level (trace, debug, info, warning, error, "
               "fatal)\n"
            << "  -f, --log-file <file>      Log file path\n";
}

std::uint64_t parseNumber(const std::string &what, const std::string &text)
{
  try
  {
    std::size_t used = 0;
    auto value = std::stoull(text, &used);
    if (used != text.size())
    {
      throw std::invalid_argument(text);
    }
    return value;
  }
  catch (const std::exception &)
  {
    throw std::runtime_error("Invalid " + what + ": " + text);
  }
}

/// \brief Parse command-line arguments
CliOptions parseCliArgs(int argc, char **argv)
{
  CliOptions options;
  for (int i = 1; i < argc; ++i)
  {
    std::string arg = argv[i];
    if ((arg == "-c" || arg == "--config") && i + 1 < argc)
    {
      options.configFile = argv[++i];
    }
    else if ((arg == "-e" || arg == "--endpoint") && i + 1 < argc)
    {
      options.endpoints.push_back(argv[++i]);
    }
    else if (arg == "--chain-id" && i + 1 < argc)
    {
      options.chainId = parseNumber("chain id", argv[++i]);
    }
    else if ((arg == "-m" || arg == "--method") && i + 1 < argc)
    {
      options.method = argv[++i];
    }
    else if ((arg == "-p" || arg == "--params") && i + 1 < argc)
    {
      options.params = argv[++i];
    }
    else if ((arg == "-t" || arg == "--timeout") && i + 1 < argc)
    {
      options.timeout = std::chrono::milliseconds(parseNumber("timeout", argv[++i]));
    }
    else if ((arg == "-l" || arg == "--log-level") && i + 1 < argc)
    {
      options.logLevel = argv[++i];
    }
    else if ((arg == "-f" || arg == "--log-file") && i + 1 < argc)
    {
      options.logFile = argv[++i];
    }
    else if (arg == "-h" || arg == "--help")
    {
      printHelp();
      std::exit(0);
    }
    else
    {
      throw std::runtime_error("Unknown or incomplete option: " + arg);
    }
  }
  if (options.method.empty())
  {
    throw std::runtime_error("No method given (use -m)");
  }
  return options;
}

/// \brief Apply logging settings; command line wins over "log.*" keys.
void initLogging(const CliOptions &options, const omnilink::core::ConfigLoader *loader)
{
  std::string level = "warning";
  std::string file;
  if (loader)
  {
    if (auto v = loader->getString("log.level"))
    {
      level = *v;
    }
    if (auto v = loader->getString("log.file"))
    {
      file = *v;
    }
  }
  if (options.logLevel)
  {
    level = *options.logLevel;
  }
  if (options.logFile)
  {
    file = *options.logFile;
  }

  auto parsed = omnilink::core::Logger::parseLevel(level);
  if (!parsed)
  {
    throw std::runtime_error("Invalid log level: " + level);
  }
  omnilink::core::Logger::init(*parsed, file);
}

} // namespace

int main(int argc, char **argv)
{
  using omnilink::core::Json;

  try
  {
    CliOptions options = parseCliArgs(argc, argv);

    std::unique_ptr<omnilink::core::ConfigLoader> configLoader;
    if (options.configFile)
    {
      configLoader = std::make_unique<omnilink::core::ConfigLoader>(*options.configFile);
    }
    initLogging(options, configLoader.get());

    omnilink::client::ClientConfig config;
    if (configLoader)
    {
      config = omnilink::client::ClientConfig::fromLoader(*configLoader);
      OMNILINK_LOG_INFO("Using config file: " << *options.configFile);
    }
    if (!options.endpoints.empty())
    {
      config.endpoints = options.endpoints;
    }
    if (options.chainId)
    {
      config.chainId = *options.chainId;
    }

    Json params = Json::parse(options.params, nullptr, false);
    if (params.is_discarded())
    {
      throw std::runtime_error("Params are not valid JSON: " + options.params);
    }

    omnilink::client::Client client(config);
    client.connect();
    if (!client.waitForConnected(std::chrono::seconds(10)))
    {
      OMNILINK_LOG_WARN("No connection after 10s to " << config.endpoints.size() << " endpoint(s)");
    }
    Json result = client.call(options.method, params, options.timeout);
    std::cout << result.dump(2) << std::endl;
  }
  catch (const omnilink::rpc::RemoteError &e)
  {
    std::cerr << "Remote error " << e.code() << ": " << e.message() << std::endl;
    omnilink::core::Logger::flush();
    return EXIT_FAILURE;
  }
  catch (const std::exception &ex)
  {
    std::cerr << "Error: " << ex.what() << std::endl;
    omnilink::core::Logger::flush();
    return EXIT_FAILURE;
  }

  omnilink::core::Logger::flush();
  return 0;
}

// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of VaultRelay, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#include <vaultrelay/vaultrelay.hpp>

#include <chrono>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <future>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace
{

volatile std::sig_atomic_t g_stopRequested = 0;

void onSignal(int) { g_stopRequested = 1; }

struct CliOptions
{
  std::optional<std::string> configFile;
  std::optional<std::string> endpoint;
  std::optional<std::string> logLevel;
  std::optional<std::string> logFile;
  bool logAsync{false};
  std::optional<std::chrono::milliseconds> simulateDisconnect;
};

/// \brief Print help message
void printHelp()
{
  std::cout << "VaultRelay Options:\n"
            << "  -h, --help                       Show this help message\n"
            << "  -c, --config <file>              Configuration file path (default: "
            << VAULTRELAY_DEFAULT_CONFIG_FILE_PATH << ")\n"
            << "  -e, --endpoint <url>             Event source endpoint\n"
            << "  -l, --log-level <level>          Log level (trace, debug, info, "
               "warning, error, fatal)\n"
            << "  -f, --log-file <file>            Log file path\n"
            << "      --log-async                  Enable async logging\n"
            << "      --simulate-disconnect <ms>   Sever every session after <ms> "
               "(diagnostics only)\n";
}

/// \brief Parse command-line arguments
/// \return false if help was requested
bool parseCliArgs(int argc, char **argv, CliOptions &options)
{
  for (int i = 1; i < argc; ++i)
  {
    std::string arg = argv[i];
    if ((arg == "-c" || arg == "--config") && i + 1 < argc)
    {
      options.configFile = argv[++i];
    }
    else if ((arg == "-e" || arg == "--endpoint") && i + 1 < argc)
    {
      options.endpoint = argv[++i];
    }
    else if ((arg == "-l" || arg == "--log-level") && i + 1 < argc)
    {
      options.logLevel = argv[++i];
    }
    else if ((arg == "-f" || arg == "--log-file") && i + 1 < argc)
    {
      options.logFile = argv[++i];
    }
    else if (arg == "--log-async")
    {
      options.logAsync = true;
    }
    else if (arg == "--simulate-disconnect" && i + 1 < argc)
    {
      try
      {
        options.simulateDisconnect = std::chrono::milliseconds(std::stoll(argv[++i]));
      }
      catch (const std::exception &)
      {
        throw std::runtime_error("Invalid disconnect delay: " + std::string(argv[i]));
      }
    }
    else if (arg == "-h" || arg == "--help")
    {
      return false;
    }
    else
    {
      throw std::runtime_error("Unknown or incomplete option: " + arg);
    }
  }
  return true;
}

/// \brief Load the TOML file and apply command-line overrides.
vaultrelay::service::RelayConfig loadConfig(const CliOptions &options, std::string &configFile)
{
  using vaultrelay::core::ConfigLoader;
  using vaultrelay::service::ConfigError;
  using vaultrelay::service::RelayConfig;

  ConfigLoader loader;
  if (options.configFile)
  {
    configFile = *options.configFile;
    loader = ConfigLoader(configFile);
  }
  else if (std::filesystem::exists(VAULTRELAY_DEFAULT_CONFIG_FILE_PATH))
  {
    configFile = VAULTRELAY_DEFAULT_CONFIG_FILE_PATH;
    loader = ConfigLoader(configFile);
  }

  RelayConfig config = RelayConfig::fromLoader(loader);
  if (options.endpoint)
  {
    config.connection.endpoint = *options.endpoint;
  }
  if (options.logLevel)
  {
    try
    {
      config.log.level = vaultrelay::core::Logger::parseLevel(*options.logLevel);
    }
    catch (const std::invalid_argument &e)
    {
      throw ConfigError(e.what());
    }
  }
  if (options.logFile)
  {
    config.log.file = *options.logFile;
  }
  if (options.logAsync)
  {
    config.log.async = true;
  }
  if (options.simulateDisconnect)
  {
    config.connection.simulateDisconnect = true;
    config.connection.simulateDisconnectAfter = *options.simulateDisconnect;
  }
  config.validate();
  return config;
}

/// \brief Relative paths in the configuration are taken from the directory
/// of the configuration file.
std::string resolvePath(const std::string &path, const std::string &configFile)
{
  std::filesystem::path p(path);
  if (p.is_absolute() || configFile.empty())
  {
    return path;
  }
  return (std::filesystem::path(configFile).parent_path() / p).string();
}

} // namespace

int main(int argc, char **argv)
{
  using namespace vaultrelay;

  CliOptions options;
  service::RelayConfig config;
  std::string configFile;
  try
  {
    if (!parseCliArgs(argc, argv, options))
    {
      printHelp();
      return 0;
    }
    config = loadConfig(options, configFile);
  }
  catch (const std::exception &e)
  {
    std::cerr << "Error loading configuration: " << e.what() << std::endl;
    return static_cast<int>(service::ExitCode::StartupFailed);
  }

  core::Logger::init(config.log.level, config.log.file, config.log.async, config.log.retentionDays,
                     config.log.timeFormat);
  core::Logger::setLogFormat(config.log.format);
  if (!configFile.empty())
  {
    VAULTRELAY_LOG_INFO("Using config file: " << configFile);
  }

  int status = static_cast<int>(service::ExitCode::Ok);
  try
  {
    if (config.replay.feed.empty())
    {
      throw service::ConfigError("replay.feed is not set");
    }
    sim::ReplayScript script = sim::ReplayScript::load(resolvePath(config.replay.feed, configFile));

    core::EventLoop loop;
    sim::ReplayTransportFactory factory(loop, std::move(script));
    sim::StaticSnapshotSource source(config.replay.window,
                                     sync::Quantity::parse(config.replay.balance));

    std::vector<std::unique_ptr<sim::JournalSyncTarget>> journals;
    std::vector<sync::SyncTarget *> targets;
    for (const auto &name : config.targets)
    {
      sim::JournalConfig journal;
      journal.name = name;
      journal.path = resolvePath(config.replay.journal, configFile);
      journal.confirmDelay = config.replay.confirmDelay;
      journal.rejectFirst = config.replay.rejectFirst;
      journals.push_back(std::make_unique<sim::JournalSyncTarget>(loop, journal));
      targets.push_back(journals.back().get());
    }

    service::RelayService relay(loop, factory, source, targets, journals.front().get(),
                                config.connection, config.retry);

    std::signal(SIGINT, onSignal);
    std::signal(SIGTERM, onSignal);

    loop.start();
    std::promise<void> started;
    auto startedFuture = started.get_future();
    loop.post([&relay, &started] {
      try
      {
        relay.start();
        started.set_value();
      }
      catch (...)
      {
        started.set_exception(std::current_exception());
      }
    });
    try
    {
      startedFuture.get();
    }
    catch (const std::exception &)
    {
      loop.stop();
      throw;
    }

    bool stopPosted = false;
    while (!relay.waitForTermination(std::chrono::milliseconds(200)))
    {
      if (g_stopRequested && !stopPosted)
      {
        VAULTRELAY_LOG_INFO("Termination requested, stopping");
        loop.post([&relay] { relay.stop(); });
        stopPosted = true;
      }
    }

    std::promise<void> drained;
    auto drainedFuture = drained.get_future();
    loop.post([&drained] { drained.set_value(); });
    drainedFuture.wait_for(std::chrono::seconds(1));
    loop.stop();
    status = static_cast<int>(relay.exitCode());
  }
  catch (const sync::StartupError &e)
  {
    VAULTRELAY_LOG_FATAL("Startup failed: " << e.what());
    status = static_cast<int>(service::ExitCode::StartupFailed);
  }
  catch (const std::exception &e)
  {
    VAULTRELAY_LOG_FATAL("Error initializing VaultRelay: " << e.what());
    status = static_cast<int>(service::ExitCode::StartupFailed);
  }

  core::Logger::shutdown();
  return status;
}

// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of VaultRelay, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <vaultrelay/core/config_loader.hpp>
#include <vaultrelay/core/logger.hpp>
#include <vaultrelay/net/connection_manager.hpp>
#include <vaultrelay/sync/events.hpp>
#include <vaultrelay/sync/field_sync.hpp>

namespace vaultrelay
{
namespace service
{

class ConfigError : public std::runtime_error
{
public:
  using std::runtime_error::runtime_error;
};

struct LogConfig
{
  core::Logger::Level level{core::Logger::Level::Info};
  std::string file;
  bool async{false};
  int retentionDays{7};
  std::string timeFormat{"%Y-%m-%d %H:%M:%S"};
  std::string format{"[%T] [%L] %m"};
};

/// \brief Settings of the dry-run collaborators wired by the daemon.
struct ReplayConfig
{
  std::string feed;
  std::string journal{"vaultrelay-journal.log"};
  std::chrono::milliseconds confirmDelay{0};
  unsigned rejectFirst{0};
  sync::SaleWindow window;
  std::string balance{"0"};
};

/// \brief Everything the daemon reads from its TOML file.
struct RelayConfig
{
  net::ConnectionConfig connection;
  sync::SyncRetryPolicy retry;
  std::vector<std::string> targets{"bnb-vault"};
  LogConfig log;
  ReplayConfig replay;

  /// \brief Read every known key, falling back to defaults for missing
  /// ones, then apply the VAULTRELAY_ENDPOINT environment override.
  /// \throws ConfigError for wrong types and out-of-range values
  static RelayConfig fromLoader(const core::ConfigLoader &loader)
  {
    RelayConfig cfg;
    try
    {
      auto &c = cfg.connection;
      c.name = loader.getString("connection.name").value_or(c.name);
      c.endpoint = loader.getString("connection.endpoint").value_or("");
      c.keepAlive.interval =
        loader.getMillis("connection.keep_alive_interval_ms").value_or(c.keepAlive.interval);
      c.keepAlive.pongTimeout =
        loader.getMillis("connection.pong_timeout_ms").value_or(c.keepAlive.pongTimeout);
      c.reconnect.baseDelay =
        loader.getMillis("connection.reconnect.base_delay_ms").value_or(c.reconnect.baseDelay);
      c.reconnect.maxAttempts =
        unsignedValue(loader, "connection.reconnect.max_attempts", c.reconnect.maxAttempts);
      c.simulateDisconnect =
        loader.getBool("connection.diagnostics.simulate_disconnect").value_or(false);
      c.simulateDisconnectAfter =
        loader.getMillis("connection.diagnostics.simulate_disconnect_after_ms")
          .value_or(c.simulateDisconnectAfter);

      cfg.retry.maxRetries =
        unsignedValue(loader, "sync.retry_max_attempts", cfg.retry.maxRetries);
      cfg.retry.baseDelay =
        loader.getMillis("sync.retry_base_delay_ms").value_or(cfg.retry.baseDelay);
      cfg.targets = loader.getStringArray("sync.targets").value_or(cfg.targets);

      auto &l = cfg.log;
      if (auto level = loader.getString("log.level"))
      {
        l.level = core::Logger::parseLevel(*level);
      }
      l.file = loader.getString("log.file").value_or("");
      l.async = loader.getBool("log.async").value_or(false);
      l.retentionDays = static_cast<int>(loader.getInt("log.retention_days").value_or(7));
      l.timeFormat = loader.getString("log.time_format").value_or(l.timeFormat);
      l.format = loader.getString("log.format").value_or(l.format);

      auto &r = cfg.replay;
      r.feed = loader.getString("replay.feed").value_or("");
      r.journal = loader.getString("replay.journal").value_or(r.journal);
      r.confirmDelay = loader.getMillis("replay.confirm_delay_ms").value_or(r.confirmDelay);
      r.rejectFirst = unsignedValue(loader, "replay.reject_first", 0);
      r.window.start = unsignedValue64(loader, "replay.snapshot.start_sale_date");
      r.window.end = unsignedValue64(loader, "replay.snapshot.end_sale_date");
      // written as a string when it does not fit in 64 bits
      auto balance = loader.table().at_path("replay.snapshot.token_balance");
      if (balance.is_integer())
      {
        r.balance = std::to_string(*balance.as<std::int64_t>());
      }
      else if (balance)
      {
        r.balance = loader.getString("replay.snapshot.token_balance").value_or("");
      }
    }
    catch (const core::ConfigTypeError &e)
    {
      throw ConfigError(e.what());
    }
    catch (const std::invalid_argument &e)
    {
      throw ConfigError(e.what());
    }

    if (const char *endpoint = std::getenv("VAULTRELAY_ENDPOINT"))
    {
      if (*endpoint != '\0')
      {
        cfg.connection.endpoint = endpoint;
      }
    }
    return cfg;
  }

  /// \brief Check the settings against each other and against the longest
  /// delay the event loop accepts for a timer.
  /// \throws ConfigError describing the first invalid setting
  void validate(std::chrono::milliseconds maxTimerDelay = std::chrono::hours(24)) const
  {
    if (connection.endpoint.empty())
    {
      throw ConfigError("connection.endpoint is not set");
    }
    if (connection.keepAlive.interval.count() <= 0)
    {
      throw ConfigError("connection.keep_alive_interval_ms must be positive");
    }
    if (connection.keepAlive.pongTimeout.count() <= 0)
    {
      throw ConfigError("connection.pong_timeout_ms must be positive");
    }
    if (connection.reconnect.maxAttempts == 0)
    {
      throw ConfigError("connection.reconnect.max_attempts must be at least 1");
    }
    if (connection.simulateDisconnect && connection.simulateDisconnectAfter.count() <= 0)
    {
      throw ConfigError("connection.diagnostics.simulate_disconnect_after_ms must be positive");
    }
    if (targets.empty())
    {
      throw ConfigError("sync.targets must name at least one target");
    }
    for (auto it = targets.begin(); it != targets.end(); ++it)
    {
      if (std::find(targets.begin(), it, *it) != it)
      {
        throw ConfigError("sync.targets names '" + *it + "' more than once");
      }
    }

    auto checkDelay = [maxTimerDelay](const std::string &key, std::chrono::milliseconds delay) {
      if (delay > maxTimerDelay)
      {
        throw ConfigError(key + " leads to a " + std::to_string(delay.count()) +
                          " ms delay, above the " + std::to_string(maxTimerDelay.count()) +
                          " ms timer limit");
      }
    };
    checkDelay("connection.keep_alive_interval_ms", connection.keepAlive.interval);
    checkDelay("connection.pong_timeout_ms", connection.keepAlive.pongTimeout);
    checkDelay("connection.reconnect.max_attempts",
               connection.reconnect.delayFor(connection.reconnect.maxAttempts - 1));
    if (connection.simulateDisconnect)
    {
      checkDelay("connection.diagnostics.simulate_disconnect_after_ms",
                 connection.simulateDisconnectAfter);
    }
    if (retry.maxRetries > 0)
    {
      checkDelay("sync.retry_max_attempts", retry.delayFor(retry.maxRetries - 1));
    }
    checkDelay("replay.confirm_delay_ms", replay.confirmDelay);
    try
    {
      sync::Quantity::parse(replay.balance);
    }
    catch (const std::invalid_argument &e)
    {
      throw ConfigError(std::string("replay.snapshot.token_balance: ") + e.what());
    }
  }

private:
  static unsigned unsignedValue(const core::ConfigLoader &loader, const std::string &key,
                                unsigned fallback)
  {
    auto value = loader.getInt(key);
    if (!value)
    {
      return fallback;
    }
    if (*value < 0 || *value > 1000000)
    {
      throw ConfigError(key + " is out of range");
    }
    return static_cast<unsigned>(*value);
  }

  static std::uint64_t unsignedValue64(const core::ConfigLoader &loader, const std::string &key)
  {
    auto value = loader.getInt(key).value_or(0);
    if (value < 0)
    {
      throw ConfigError(key + " must not be negative");
    }
    return static_cast<std::uint64_t>(value);
  }
};

} // namespace service
} // namespace vaultrelay

// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of VaultRelay, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>

#include <vaultrelay/core/executor.hpp>
#include <vaultrelay/core/logger.hpp>
#include <vaultrelay/net/transport.hpp>

namespace vaultrelay
{
namespace net
{

struct KeepAliveConfig
{
  /// Time between liveness probes.
  std::chrono::milliseconds interval{7500};
  /// Time allowed for a pong after the oldest unanswered probe.
  std::chrono::milliseconds pongTimeout{15000};
};

struct KeepAliveStats
{
  std::uint64_t probesSent{0};
  std::uint64_t probeFailures{0};
  std::uint64_t pongsReceived{0};
  std::uint64_t expirations{0};
};

/// \brief Probes one session at a fixed interval and reports it dead when
/// no pong arrives within the timeout.
///
/// The deadline is armed by the first unanswered probe and is not pushed out
/// by later probes, so expiry happens exactly pongTimeout after that probe.
/// A pong disarms it. All timers belong to the session passed to start();
/// stop() or a new start() cancels them. Must be driven from the executor
/// thread.
class KeepAliveMonitor
{
public:
  /// \brief Sends one probe; returns false if it could not be written.
  using Probe = std::function<bool()>;
  using ExpiryHandler = std::function<void(SessionId)>;

  /// \throws std::invalid_argument if either duration is not positive
  KeepAliveMonitor(core::Executor &executor, KeepAliveConfig config)
      : _executor(executor), _config(config), _alive(std::make_shared<char>(0))
  {
    if (_config.interval.count() <= 0 || _config.pongTimeout.count() <= 0)
    {
      throw std::invalid_argument("keep-alive interval and pong timeout must be positive");
    }
  }

  ~KeepAliveMonitor() { stop(); }

  KeepAliveMonitor(const KeepAliveMonitor &) = delete;
  KeepAliveMonitor &operator=(const KeepAliveMonitor &) = delete;

  void start(SessionId session, Probe probe, ExpiryHandler onExpired)
  {
    stop();
    _session = session;
    _probe = std::move(probe);
    _onExpired = std::move(onExpired);
    scheduleTick();
  }

  /// \brief Record a pong. Pongs for another session are ignored.
  void onPong(SessionId session)
  {
    if (session != _session || _session == 0)
    {
      return;
    }
    ++_stats.pongsReceived;
    VAULTRELAY_LOG_DEBUG("Received pong, session " << session << " is alive");
    if (_deadlineTimer != 0)
    {
      _executor.cancel(_deadlineTimer);
      _deadlineTimer = 0;
      _deadlineAt.reset();
    }
  }

  void stop()
  {
    if (_tickTimer != 0)
    {
      _executor.cancel(_tickTimer);
      _tickTimer = 0;
    }
    if (_deadlineTimer != 0)
    {
      _executor.cancel(_deadlineTimer);
      _deadlineTimer = 0;
    }
    _deadlineAt.reset();
    _session = 0;
    _probe = nullptr;
    _onExpired = nullptr;
  }

  bool active() const { return _session != 0; }
  SessionId session() const { return _session; }
  bool awaitingPong() const { return _deadlineTimer != 0; }

  /// \brief When the session will be declared dead, if a probe is
  /// unanswered.
  std::optional<core::Executor::TimePoint> deadline() const { return _deadlineAt; }

  const KeepAliveConfig &config() const { return _config; }
  const KeepAliveStats &stats() const { return _stats; }

private:
  void scheduleTick()
  {
    std::weak_ptr<char> alive = _alive;
    SessionId session = _session;
    _tickTimer = _executor.scheduleAfter(_config.interval, [this, alive, session] {
      if (alive.lock() && session == _session)
      {
        _tickTimer = 0;
        tick();
      }
    });
    if (_tickTimer == 0)
    {
      refused("probe", _config.interval);
    }
  }

  /// A session whose liveness cannot be checked is treated as dead; the
  /// expiry is posted so it never runs inside start().
  void refused(const char *what, std::chrono::milliseconds delay)
  {
    VAULTRELAY_LOG_ERROR("Could not schedule the keep-alive " << what << " in " << delay.count()
                                                              << " ms for session " << _session);
    std::weak_ptr<char> alive = _alive;
    SessionId session = _session;
    _executor.post([this, alive, session] {
      if (alive.lock() && session == _session && session != 0)
      {
        expire();
      }
    });
  }

  void tick()
  {
    VAULTRELAY_LOG_DEBUG("Checking if session " << _session << " is alive, sending a ping");
    ++_stats.probesSent;
    if (!_probe || !_probe())
    {
      ++_stats.probeFailures;
      VAULTRELAY_LOG_WARN("Ping could not be sent on session " << _session);
    }

    if (_deadlineTimer == 0)
    {
      std::weak_ptr<char> alive = _alive;
      SessionId session = _session;
      _deadlineAt = _executor.now() + _config.pongTimeout;
      _deadlineTimer = _executor.scheduleAfter(_config.pongTimeout, [this, alive, session] {
        if (alive.lock() && session == _session)
        {
          _deadlineTimer = 0;
          expire();
        }
      });
      if (_deadlineTimer == 0)
      {
        _deadlineAt.reset();
        refused("pong deadline", _config.pongTimeout);
        return;
      }
    }
    scheduleTick();
  }

  void expire()
  {
    ++_stats.expirations;
    SessionId session = _session;
    VAULTRELAY_LOG_ERROR("No pong received within " << _config.pongTimeout.count()
                                                    << " ms, terminating session " << session);
    ExpiryHandler handler = std::move(_onExpired);
    stop();
    if (handler)
    {
      handler(session);
    }
  }

  core::Executor &_executor;
  KeepAliveConfig _config;
  std::shared_ptr<char> _alive;

  SessionId _session{0};
  Probe _probe;
  ExpiryHandler _onExpired;
  core::Executor::TimerId _tickTimer{0};
  core::Executor::TimerId _deadlineTimer{0};
  std::optional<core::Executor::TimePoint> _deadlineAt;
  KeepAliveStats _stats;
};

} // namespace net
} // namespace vaultrelay

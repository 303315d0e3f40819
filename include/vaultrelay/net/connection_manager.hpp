// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of VaultRelay, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <exception>
#include <functional>
#include <memory>
#include <string>
#include <utility>

#include <vaultrelay/core/executor.hpp>
#include <vaultrelay/core/logger.hpp>
#include <vaultrelay/net/keep_alive_monitor.hpp>
#include <vaultrelay/net/reconnect_scheduler.hpp>
#include <vaultrelay/net/transport.hpp>

namespace vaultrelay
{
namespace net
{

enum class ConnectionState
{
  Idle,
  Connecting,
  Open,
  WaitingReconnect,
  /// Reconnection cap reached; the manager stays inert until destroyed.
  Failed,
  Stopped
};

inline const char *toString(ConnectionState state)
{
  switch (state)
  {
  case ConnectionState::Idle:
    return "idle";
  case ConnectionState::Connecting:
    return "connecting";
  case ConnectionState::Open:
    return "open";
  case ConnectionState::WaitingReconnect:
    return "waiting-reconnect";
  case ConnectionState::Failed:
    return "failed";
  case ConnectionState::Stopped:
    return "stopped";
  }
  return "unknown";
}

struct ConnectionConfig
{
  /// Name used in log lines, e.g. "bnb".
  std::string name{"connection"};
  std::string endpoint;
  KeepAliveConfig keepAlive;
  ReconnectPolicy reconnect;
  /// Diagnostic: gracefully sever every session after a fixed uptime to
  /// exercise the reconnection path. Never enable in production.
  bool simulateDisconnect{false};
  std::chrono::milliseconds simulateDisconnectAfter{30000};
};

struct ConnectionCallbacks
{
  std::function<void()> onOpen;
  std::function<void(const CloseInfo &)> onClose;
  std::function<void()> onPong;
  std::function<void(const std::string &)> onError;
  std::function<void(const Notification &)> onMessage;
  /// Invoked once when the reconnection cap is reached or the next attempt
  /// cannot be scheduled.
  std::function<void(const std::string &)> onFatal;
};

struct ConnectionStats
{
  std::atomic<std::uint64_t> sessionsCreated{0};
  std::atomic<std::uint64_t> sessionsOpened{0};
  std::atomic<std::uint64_t> sessionsLost{0};
  /// Pings the transport accepted.
  std::atomic<std::uint64_t> probesSent{0};
  std::atomic<std::uint64_t> pongsReceived{0};
  std::atomic<std::uint64_t> keepAliveTerminations{0};
  std::atomic<std::uint64_t> simulatedDisconnects{0};
  std::atomic<std::uint64_t> staleCallbacksDropped{0};
  std::atomic<std::uint64_t> messagesDelivered{0};
};

class ConnectionManager;

/// \brief Stable view of a managed connection that survives reconnects.
///
/// State queries are safe from any thread. send() must be called on the
/// executor thread.
class ConnectionHandle
{
public:
  bool isOpen() const { return state() == ConnectionState::Open; }
  ConnectionState state() const { return _state.load(); }
  SessionId sessionId() const { return _session.load(); }
  const std::string &endpoint() const { return _endpoint; }

  /// \brief Send on the current session; false when no session is open or
  /// the manager is gone.
  bool send(const std::string &payload);

private:
  friend class ConnectionManager;

  explicit ConnectionHandle(ConnectionManager *manager, std::string endpoint)
      : _manager(manager), _endpoint(std::move(endpoint))
  {
  }

  ConnectionManager *_manager;
  std::string _endpoint;
  std::atomic<ConnectionState> _state{ConnectionState::Idle};
  std::atomic<SessionId> _session{0};
};

/// \brief Owns one transport session at a time, keeps it alive with a
/// KeepAliveMonitor and replaces it through a ReconnectScheduler when it is
/// lost.
///
/// Transport callbacks are re-posted onto the executor tagged with their
/// session id. A session is lost exactly once, by whichever of close, error
/// or keep-alive expiry comes first; any later callback for it, and every
/// callback for a superseded session, is dropped. start(), stop() and all
/// callbacks run on the executor thread.
class ConnectionManager
{
public:
  /// \throws std::invalid_argument for an invalid keep-alive or reconnect
  /// configuration
  ConnectionManager(core::Executor &executor, TransportFactory &factory, ConnectionConfig config)
      : _executor(executor), _factory(factory), _config(std::move(config)),
        _keepAlive(executor, _config.keepAlive), _reconnect(executor, _config.reconnect),
        _alive(std::make_shared<char>(0))
  {
    if (_config.simulateDisconnect && _config.simulateDisconnectAfter.count() <= 0)
    {
      throw std::invalid_argument("simulated disconnect delay must be positive");
    }
  }

  ~ConnectionManager()
  {
    shutdown(false);
    if (_handle)
    {
      _handle->_manager = nullptr;
    }
  }

  ConnectionManager(const ConnectionManager &) = delete;
  ConnectionManager &operator=(const ConnectionManager &) = delete;

  /// \brief Start connecting to the configured endpoint. The returned handle
  /// is usable immediately; wait for onOpen before sending.
  /// \throws std::logic_error if already started
  std::shared_ptr<ConnectionHandle> start(ConnectionCallbacks callbacks)
  {
    if (_handle)
    {
      throw std::logic_error("connection manager already started");
    }
    if (_config.endpoint.empty())
    {
      throw std::invalid_argument("connection endpoint is empty");
    }
    _callbacks = std::move(callbacks);
    _handle.reset(new ConnectionHandle(this, _config.endpoint));
    if (_config.simulateDisconnect)
    {
      VAULTRELAY_LOG_WARN("[" << _config.name << "] simulated disconnects enabled, every session "
                              << "is severed after " << _config.simulateDisconnectAfter.count()
                              << " ms");
    }
    connect();
    return _handle;
  }

  /// \brief Override the endpoint and start.
  std::shared_ptr<ConnectionHandle> start(const std::string &endpoint,
                                          ConnectionCallbacks callbacks)
  {
    _config.endpoint = endpoint;
    return start(std::move(callbacks));
  }

  /// \brief Close the current session gracefully and never reconnect.
  void stop() { shutdown(true); }

  ConnectionState state() const { return _state; }
  SessionId sessionId() const { return _session ? _session->id : 0; }
  unsigned reconnectAttempts() const { return _reconnect.attempts(); }
  const ConnectionConfig &config() const { return _config; }
  const ConnectionStats &stats() const { return _stats; }
  const KeepAliveMonitor &keepAlive() const { return _keepAlive; }
  const ReconnectScheduler &reconnectScheduler() const { return _reconnect; }
  std::shared_ptr<ConnectionHandle> handle() const { return _handle; }

private:
  friend class ConnectionHandle;

  struct Session
  {
    SessionId id{0};
    std::unique_ptr<Transport> transport;
    bool open{false};
    bool lost{false};
    core::Executor::TimerId severTimer{0};
  };

  void setState(ConnectionState state)
  {
    if (_state == state)
    {
      return;
    }
    VAULTRELAY_LOG_DEBUG("[" << _config.name << "] " << toString(_state) << " -> "
                             << toString(state));
    _state = state;
    if (_handle)
    {
      _handle->_state = state;
    }
  }

  /// \brief The live session with this id, or nullptr if the callback is
  /// stale.
  Session *current(SessionId id, const char *what)
  {
    if (_session && _session->id == id && !_session->lost)
    {
      return _session.get();
    }
    _stats.staleCallbacksDropped.fetch_add(1, std::memory_order_relaxed);
    VAULTRELAY_LOG_DEBUG("[" << _config.name << "] dropping " << what << " for stale session "
                             << id);
    return nullptr;
  }

  template <typename Fn, typename... Args> void invoke(const char *name, Fn &fn, Args &&...args)
  {
    if (!fn)
    {
      return;
    }
    try
    {
      fn(std::forward<Args>(args)...);
    }
    catch (const std::exception &e)
    {
      VAULTRELAY_LOG_ERROR("[" << _config.name << "] " << name << " callback threw: " << e.what());
    }
  }

  TransportEvents eventsFor(SessionId id)
  {
    std::weak_ptr<char> alive = _alive;
    auto dispatch = [this, alive](std::function<void()> fn) {
      _executor.post([alive, fn = std::move(fn)] {
        if (alive.lock())
        {
          fn();
        }
      });
    };

    TransportEvents events;
    events.onOpen = [this, dispatch, id] { dispatch([this, id] { handleOpen(id); }); };
    events.onClose = [this, dispatch, id](const CloseInfo &info) {
      dispatch([this, id, info] { handleClose(id, info); });
    };
    events.onPong = [this, dispatch, id] { dispatch([this, id] { handlePong(id); }); };
    events.onError = [this, dispatch, id](const std::string &message) {
      dispatch([this, id, message] { handleError(id, message); });
    };
    events.onMessage = [this, dispatch, id](const Notification &n) {
      dispatch([this, id, n] { handleMessage(id, n); });
    };
    return events;
  }

  void connect()
  {
    if (_state == ConnectionState::Stopped || _state == ConnectionState::Failed)
    {
      return;
    }
    auto session = std::make_unique<Session>();
    session->id = ++_nextSessionId;
    SessionId id = session->id;
    _session = std::move(session);
    _stats.sessionsCreated.fetch_add(1, std::memory_order_relaxed);
    if (_handle)
    {
      _handle->_session = id;
    }
    setState(ConnectionState::Connecting);
    VAULTRELAY_LOG_INFO("[" << _config.name << "] connecting to " << _config.endpoint
                            << " (session " << id << ")");

    try
    {
      _session->transport = _factory.create(_config.endpoint, eventsFor(id));
      if (!_session->transport)
      {
        throw std::runtime_error("transport factory returned no transport");
      }
      _session->transport->open();
    }
    catch (const std::exception &e)
    {
      VAULTRELAY_LOG_ERROR("[" << _config.name << "] cannot connect to " << _config.endpoint
                               << ": " << e.what());
      invoke("onError", _callbacks.onError, std::string(e.what()));
      if (_session && _session->id == id && !_session->lost)
      {
        loseSession(CloseInfo{close_code::Abnormal, e.what()}, false, false);
      }
    }
  }

  void handleOpen(SessionId id)
  {
    Session *session = current(id, "open");
    if (!session || session->open)
    {
      return;
    }
    session->open = true;
    _reconnect.reset();
    _stats.sessionsOpened.fetch_add(1, std::memory_order_relaxed);
    setState(ConnectionState::Open);
    VAULTRELAY_LOG_INFO("[" << _config.name << "] connection open (session " << id << ")");

    _keepAlive.start(
      id,
      [this, id] {
        Session *s = current(id, "ping");
        if (!s || !s->transport || !s->transport->ping())
        {
          return false;
        }
        _stats.probesSent.fetch_add(1, std::memory_order_relaxed);
        return true;
      },
      [this](SessionId expired) { handleKeepAliveExpired(expired); });

    if (_config.simulateDisconnect)
    {
      std::weak_ptr<char> alive = _alive;
      session->severTimer =
        _executor.scheduleAfter(_config.simulateDisconnectAfter, [this, alive, id] {
          if (!alive.lock())
          {
            return;
          }
          if (Session *s = current(id, "simulated disconnect"))
          {
            s->severTimer = 0;
            _stats.simulatedDisconnects.fetch_add(1, std::memory_order_relaxed);
            VAULTRELAY_LOG_WARN("[" << _config.name << "] simulating broken connection on session "
                                    << id);
            s->transport->close(close_code::Normal, "simulated disconnect");
          }
        });
      if (session->severTimer == 0)
      {
        VAULTRELAY_LOG_WARN("[" << _config.name << "] simulated disconnect after "
                                << _config.simulateDisconnectAfter.count()
                                << " ms could not be scheduled for session " << id);
      }
    }

    invoke("onOpen", _callbacks.onOpen);
  }

  void handleClose(SessionId id, const CloseInfo &info)
  {
    if (!current(id, "close"))
    {
      return;
    }
    VAULTRELAY_LOG_ERROR("[" << _config.name << "] connection closed. Code: " << info.code
                             << ", Reason: " << info.reason);
    loseSession(info, true, false);
  }

  void handleError(SessionId id, const std::string &message)
  {
    if (!current(id, "error"))
    {
      return;
    }
    VAULTRELAY_LOG_ERROR("[" << _config.name << "] transport error: " << message);
    invoke("onError", _callbacks.onError, message);
    if (current(id, "error"))
    {
      loseSession(CloseInfo{close_code::Abnormal, message}, false, true);
    }
  }

  void handlePong(SessionId id)
  {
    if (!current(id, "pong"))
    {
      return;
    }
    _stats.pongsReceived.fetch_add(1, std::memory_order_relaxed);
    _keepAlive.onPong(id);
    invoke("onPong", _callbacks.onPong);
  }

  void handleMessage(SessionId id, const Notification &notification)
  {
    if (!current(id, "message"))
    {
      return;
    }
    _stats.messagesDelivered.fetch_add(1, std::memory_order_relaxed);
    invoke("onMessage", _callbacks.onMessage, notification);
  }

  void handleKeepAliveExpired(SessionId id)
  {
    if (!current(id, "keep-alive expiry"))
    {
      return;
    }
    _stats.keepAliveTerminations.fetch_add(1, std::memory_order_relaxed);
    loseSession(CloseInfo{close_code::Abnormal, "keep-alive timeout"}, true, true);
  }

  /// \brief Tear down the current session and schedule its replacement.
  /// \param notifyClose invoke onClose (close path and keep-alive expiry)
  /// \param terminate hard-close the transport first (error path and
  /// keep-alive expiry)
  void loseSession(const CloseInfo &info, bool notifyClose, bool terminate)
  {
    Session &session = *_session;
    session.lost = true;
    _keepAlive.stop();
    if (session.severTimer != 0)
    {
      _executor.cancel(session.severTimer);
      session.severTimer = 0;
    }
    if (terminate && session.transport)
    {
      session.transport->terminate();
    }
    session.transport.reset();
    _stats.sessionsLost.fetch_add(1, std::memory_order_relaxed);
    setState(ConnectionState::WaitingReconnect);

    if (notifyClose)
    {
      invoke("onClose", _callbacks.onClose, info);
    }
    if (_state != ConnectionState::WaitingReconnect)
    {
      // a callback stopped the manager
      return;
    }

    std::weak_ptr<char> alive = _alive;
    auto delay = _reconnect.schedule([this, alive] {
      if (alive.lock())
      {
        connect();
      }
    });
    if (!delay)
    {
      setState(ConnectionState::Failed);
      invoke("onFatal", _callbacks.onFatal,
             _reconnect.attempts() >= _reconnect.policy().maxAttempts
               ? "maximum reconnection attempts reached for " + _config.endpoint
               : "reconnection could not be scheduled for " + _config.endpoint);
    }
  }

  void shutdown(bool log)
  {
    if (_state == ConnectionState::Stopped)
    {
      return;
    }
    _reconnect.cancel();
    _keepAlive.stop();
    if (_session)
    {
      if (_session->severTimer != 0)
      {
        _executor.cancel(_session->severTimer);
        _session->severTimer = 0;
      }
      if (!_session->lost && _session->transport)
      {
        _session->transport->close(close_code::Normal, "shutdown");
      }
      _session->lost = true;
      _session->transport.reset();
    }
    setState(ConnectionState::Stopped);
    if (log)
    {
      VAULTRELAY_LOG_INFO("[" << _config.name << "] connection manager stopped");
    }
  }

  bool sendOnSession(const std::string &payload)
  {
    if (_state != ConnectionState::Open || !_session || !_session->transport)
    {
      return false;
    }
    return _session->transport->send(payload);
  }

  core::Executor &_executor;
  TransportFactory &_factory;
  ConnectionConfig _config;
  KeepAliveMonitor _keepAlive;
  ReconnectScheduler _reconnect;
  std::shared_ptr<char> _alive;

  ConnectionCallbacks _callbacks;
  std::shared_ptr<ConnectionHandle> _handle;
  std::unique_ptr<Session> _session;
  SessionId _nextSessionId{0};
  ConnectionState _state{ConnectionState::Idle};
  ConnectionStats _stats;
};

inline bool ConnectionHandle::send(const std::string &payload)
{
  return _manager != nullptr && _manager->sendOnSession(payload);
}

} // namespace net
} // namespace vaultrelay

// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of VaultRelay, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include <vaultrelay/core/executor.hpp>
#include <vaultrelay/core/logger.hpp>
#include <vaultrelay/net/connection_manager.hpp>
#include <vaultrelay/net/transport.hpp>
#include <vaultrelay/sync/orchestrator.hpp>
#include <vaultrelay/sync/sync_target.hpp>

namespace vaultrelay
{
namespace service
{

/// \brief Process exit statuses of the relay.
enum class ExitCode : int
{
  Ok = 0,
  StartupFailed = 1,
  ConnectionLost = 2
};

/// \brief Wires a ConnectionManager to a SyncOrchestrator and runs the
/// startup sequence: fetch the snapshot, force the initial sync, then open
/// the live connection.
///
/// start() and stop() must run on the executor thread. terminate() and
/// waitForTermination() may be called from any thread.
class RelayService
{
public:
  RelayService(core::Executor &executor, net::TransportFactory &factory,
               sync::SnapshotSource &source, const std::vector<sync::SyncTarget *> &targets,
               sync::PurchaseHandler *purchases, net::ConnectionConfig connection,
               sync::SyncRetryPolicy retry = {})
      : _connection(executor, factory, std::move(connection)),
        _orchestrator(executor, source, targets, purchases, retry)
  {
  }

  RelayService(const RelayService &) = delete;
  RelayService &operator=(const RelayService &) = delete;

  /// \brief Bootstrap the orchestrator and start the connection.
  /// \throws sync::StartupError if the snapshot cannot be fetched; the
  /// service is then terminated with ExitCode::StartupFailed
  void start()
  {
    VAULTRELAY_LOG_INFO("Starting relay for " << _connection.config().endpoint << " with "
                                              << _orchestrator.targetCount() << " target(s)");
    try
    {
      _orchestrator.bootstrap();
    }
    catch (const sync::StartupError &)
    {
      terminate(ExitCode::StartupFailed);
      throw;
    }

    net::ConnectionCallbacks callbacks;
    callbacks.onOpen = [this] {
      VAULTRELAY_LOG_INFO("Listening for events on " << _connection.config().endpoint);
    };
    callbacks.onMessage = [this](const net::Notification &n) { _orchestrator.onNotification(n); };
    callbacks.onFatal = [this](const std::string &reason) {
      VAULTRELAY_LOG_FATAL("Relay stopped: " << reason);
      terminate(ExitCode::ConnectionLost);
    };
    _handle = _connection.start(std::move(callbacks));
  }

  /// \brief Stop the connection; in-flight downstream calls are abandoned.
  void stop()
  {
    _connection.stop();
    terminate(ExitCode::Ok);
  }

  /// \brief Signal termination with the given code and unblock
  /// waitForTermination(). Only the first code is kept.
  void terminate(ExitCode code)
  {
    {
      std::lock_guard<std::mutex> lock(_terminationMutex);
      if (_terminated)
      {
        return;
      }
      _terminated = true;
      _exitCode = code;
    }
    _terminationCv.notify_all();
  }

  void waitForTermination()
  {
    std::unique_lock<std::mutex> lock(_terminationMutex);
    _terminationCv.wait(lock, [this]() { return _terminated; });
  }

  /// \return true if terminated within the timeout
  bool waitForTermination(std::chrono::milliseconds timeout)
  {
    std::unique_lock<std::mutex> lock(_terminationMutex);
    return _terminationCv.wait_for(lock, timeout, [this]() { return _terminated; });
  }

  bool terminated() const
  {
    std::lock_guard<std::mutex> lock(_terminationMutex);
    return _terminated;
  }

  ExitCode exitCode() const
  {
    std::lock_guard<std::mutex> lock(_terminationMutex);
    return _exitCode;
  }

  const net::ConnectionManager &connection() const { return _connection; }
  const sync::SyncOrchestrator &orchestrator() const { return _orchestrator; }
  std::shared_ptr<net::ConnectionHandle> handle() const { return _handle; }

private:
  net::ConnectionManager _connection;
  sync::SyncOrchestrator _orchestrator;
  std::shared_ptr<net::ConnectionHandle> _handle;

  mutable std::mutex _terminationMutex;
  std::condition_variable _terminationCv;
  bool _terminated{false};
  ExitCode _exitCode{ExitCode::Ok};
};

} // namespace service
} // namespace vaultrelay

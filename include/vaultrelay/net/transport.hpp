// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of VaultRelay, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <string>

namespace vaultrelay
{
namespace net
{

/// \brief Identifies one connection session. Ids increase monotonically per
/// connection manager and 0 means "no session".
using SessionId = std::uint64_t;

/// \brief WebSocket-style close status. 1000 is a normal close, 1006 an
/// abnormal one (no close frame, e.g. after terminate()).
struct CloseInfo
{
  int code{1006};
  std::string reason;
};

namespace close_code
{
  constexpr int Normal = 1000;
  constexpr int Abnormal = 1006;
} // namespace close_code

/// \brief A decoded application-level notification: the emitting source
/// (e.g. a contract name), the event name and its named fields as text.
struct Notification
{
  std::string source;
  std::string name;
  std::map<std::string, std::string> fields;
};

/// \brief Callbacks a transport invokes. They may run on any thread.
struct TransportEvents
{
  std::function<void()> onOpen;
  std::function<void(const CloseInfo &)> onClose;
  std::function<void()> onPong;
  std::function<void(const std::string &)> onError;
  std::function<void(const Notification &)> onMessage;
};

/// \brief One duplex streaming connection. Owned by the connection manager
/// for the lifetime of a single session.
class Transport
{
public:
  virtual ~Transport() = default;

  /// \brief Begin connecting; completion is reported through onOpen or
  /// onError/onClose.
  virtual void open() = 0;

  /// \brief Send a liveness probe. Returns false if the probe could not be
  /// written.
  virtual bool ping() = 0;

  virtual bool send(const std::string &payload) = 0;

  /// \brief Graceful close; onClose follows.
  virtual void close(int code, const std::string &reason) = 0;

  /// \brief Hard close without a closing handshake. No further callbacks
  /// are required after this returns.
  virtual void terminate() = 0;
};

/// \brief Creates transports for an endpoint. Throwing from create() is
/// treated as a failed connection attempt.
class TransportFactory
{
public:
  virtual ~TransportFactory() = default;

  virtual std::unique_ptr<Transport> create(const std::string &endpoint,
                                            TransportEvents events) = 0;
};

} // namespace net
} // namespace vaultrelay

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
#include <memory>
#include <stdexcept>
#include <string>
#include <unordered_set>
#include <vector>

#include <vaultrelay/core/config_loader.hpp>
#include <vaultrelay/core/executor.hpp>
#include <vaultrelay/core/logger.hpp>
#include <vaultrelay/net/transport.hpp>

namespace vaultrelay
{
namespace sim
{

/// \brief One scripted event, played `atMs` after the session opens.
struct ReplayFrame
{
  enum class Kind
  {
    Message,
    Close,
    Error,
    /// Stop answering pings for the rest of the session.
    Silence
  };

  std::int64_t atMs{0};
  Kind kind{Kind::Message};
  net::Notification notification;
  int code{net::close_code::Abnormal};
  std::string reason;
};

struct ReplayScript
{
  bool respondToPing{true};
  std::chrono::milliseconds pongDelay{5};
  std::chrono::milliseconds openDelay{10};
  /// The first N connection attempts fail with a transport error.
  unsigned failConnects{0};
  std::vector<ReplayFrame> frames;

  /// \brief Parse a script document:
  /// \code
  /// [replay]
  /// respond_to_ping = true
  /// pong_delay_ms = 5
  /// open_delay_ms = 10
  /// fail_connects = 0
  ///
  /// [[frame]]
  /// at_ms = 100
  /// kind = "message"            # message | close | error | silence
  /// source = "presale"
  /// name = "SaleDateUpdated"
  /// fields = ["startSaleDate=100", "endSaleDate=250"]
  /// \endcode
  /// \throws std::runtime_error for malformed scripts
  static ReplayScript fromConfig(const core::ConfigLoader &config)
  {
    ReplayScript script;
    script.respondToPing = config.getBool("replay.respond_to_ping").value_or(true);
    script.pongDelay = config.getMillis("replay.pong_delay_ms").value_or(script.pongDelay);
    script.openDelay = config.getMillis("replay.open_delay_ms").value_or(script.openDelay);
    auto fail = config.getInt("replay.fail_connects").value_or(0);
    if (fail < 0)
    {
      throw std::runtime_error("replay.fail_connects must not be negative");
    }
    script.failConnects = static_cast<unsigned>(fail);

    auto frames = config.table().get("frame");
    if (!frames)
    {
      return script;
    }
    const auto *items = frames.as_array();
    if (!items)
    {
      throw std::runtime_error("'frame' must be an array of tables ([[frame]])");
    }
    for (std::size_t i = 0; i < items->size(); ++i)
    {
      const auto *t = (*items)[i].as_table();
      if (!t)
      {
        throw std::runtime_error("frame " + std::to_string(i) + " is not a table");
      }
      script.frames.push_back(parseFrame(*t, i));
    }
    std::stable_sort(script.frames.begin(), script.frames.end(),
                     [](const ReplayFrame &a, const ReplayFrame &b) { return a.atMs < b.atMs; });
    return script;
  }

  static ReplayScript load(const std::string &path)
  {
    return fromConfig(core::ConfigLoader(path));
  }

private:
  static ReplayFrame parseFrame(const parsers::toml::table &t, std::size_t index)
  {
    auto where = "frame " + std::to_string(index);
    ReplayFrame frame;
    frame.atMs = t.get("at_ms").as<std::int64_t>().value_or(0);
    std::string kind = t.get("kind").as<std::string>().value_or("message");
    if (kind == "message")
      frame.kind = ReplayFrame::Kind::Message;
    else if (kind == "close")
      frame.kind = ReplayFrame::Kind::Close;
    else if (kind == "error")
      frame.kind = ReplayFrame::Kind::Error;
    else if (kind == "silence")
      frame.kind = ReplayFrame::Kind::Silence;
    else
      throw std::runtime_error(where + ": unknown kind '" + kind + "'");

    frame.code = static_cast<int>(
      t.get("code").as<std::int64_t>().value_or(net::close_code::Abnormal));
    frame.reason = t.get("reason").as<std::string>().value_or("");
    frame.notification.source = t.get("source").as<std::string>().value_or("");
    frame.notification.name = t.get("name").as<std::string>().value_or("");
    if (frame.kind == ReplayFrame::Kind::Message && frame.notification.name.empty())
    {
      throw std::runtime_error(where + ": message frames need a name");
    }
    if (const auto *fields = t.get("fields").as_array())
    {
      for (const auto &item : *fields)
      {
        auto pair = item.as<std::string>();
        auto eq = pair ? pair->find('=') : std::string::npos;
        if (eq == std::string::npos)
        {
          throw std::runtime_error(where + ": fields must be \"key=value\" strings");
        }
        frame.notification.fields[pair->substr(0, eq)] = pair->substr(eq + 1);
      }
    }
    return frame;
  }
};

/// \brief Progress shared by every session a factory creates, so a
/// reconnect resumes the script where the lost session stopped.
struct ReplayCursor
{
  std::size_t nextFrame{0};
  unsigned connects{0};
};

/// \brief Transport that plays a ReplayScript on the executor instead of
/// talking to a network peer.
class ReplayTransport : public net::Transport
{
public:
  ReplayTransport(core::Executor &executor, std::shared_ptr<const ReplayScript> script,
                  std::shared_ptr<ReplayCursor> cursor, net::TransportEvents events)
      : _executor(executor), _script(std::move(script)), _cursor(std::move(cursor)),
        _events(std::move(events)), _alive(std::make_shared<char>(0))
  {
  }

  ~ReplayTransport() override { cancelAll(); }

  void open() override
  {
    bool fail = _cursor->connects++ < _script->failConnects;
    after(_script->openDelay, [this, fail] {
      if (fail)
      {
        if (_events.onError)
          _events.onError("replay: connection refused");
        return;
      }
      _open = true;
      _openedAt = _executor.now();
      if (_events.onOpen)
        _events.onOpen();
      playNext();
    });
  }

  bool ping() override
  {
    if (!_open)
    {
      return false;
    }
    if (_silent || !_script->respondToPing)
    {
      return true;
    }
    after(_script->pongDelay, [this] {
      if (_open && _events.onPong)
        _events.onPong();
    });
    return true;
  }

  bool send(const std::string &payload) override
  {
    VAULTRELAY_LOG_TRACE("replay: discarding " << payload.size() << " byte(s)");
    return _open;
  }

  void close(int code, const std::string &reason) override
  {
    if (!_open)
    {
      return;
    }
    _open = false;
    cancelAll();
    after(std::chrono::milliseconds(0), [this, code, reason] {
      if (_events.onClose)
        _events.onClose(net::CloseInfo{code, reason});
    });
  }

  void terminate() override
  {
    _open = false;
    cancelAll();
  }

private:
  template <typename Fn> void after(std::chrono::milliseconds delay, Fn fn)
  {
    std::weak_ptr<char> alive = _alive;
    auto id = std::make_shared<core::Executor::TimerId>(0);
    *id = _executor.scheduleAfter(delay, [this, alive, id, fn] {
      if (!alive.lock())
      {
        return;
      }
      _timers.erase(*id);
      fn();
    });
    if (*id == 0)
    {
      // the script cannot continue; fail the session like a broken peer
      VAULTRELAY_LOG_ERROR("replay: could not schedule a step " << delay.count() << " ms ahead");
      _open = false;
      cancelAll();
      _executor.post([this, alive] {
        if (alive.lock() && _events.onError)
          _events.onError("replay: step could not be scheduled");
      });
      return;
    }
    _timers.insert(*id);
  }

  void cancelAll()
  {
    for (auto id : _timers)
    {
      _executor.cancel(id);
    }
    _timers.clear();
  }

  void playNext()
  {
    if (!_open || _cursor->nextFrame >= _script->frames.size())
    {
      return;
    }
    const ReplayFrame &frame = _script->frames[_cursor->nextFrame];
    auto elapsed =
      std::chrono::duration_cast<std::chrono::milliseconds>(_executor.now() - _openedAt);
    auto delay = std::max(std::chrono::milliseconds(frame.atMs) - elapsed,
                          std::chrono::milliseconds(0));
    after(delay, [this] {
      if (!_open)
      {
        return;
      }
      const ReplayFrame &f = _script->frames[_cursor->nextFrame++];
      play(f);
      playNext();
    });
  }

  void play(const ReplayFrame &frame)
  {
    switch (frame.kind)
    {
    case ReplayFrame::Kind::Message:
      if (_events.onMessage)
        _events.onMessage(frame.notification);
      break;
    case ReplayFrame::Kind::Silence:
      VAULTRELAY_LOG_DEBUG("replay: peer stops answering pings");
      _silent = true;
      break;
    case ReplayFrame::Kind::Close:
      _open = false;
      if (_events.onClose)
        _events.onClose(net::CloseInfo{frame.code, frame.reason});
      break;
    case ReplayFrame::Kind::Error:
      _open = false;
      if (_events.onError)
        _events.onError(frame.reason.empty() ? "replay: scripted error" : frame.reason);
      break;
    }
  }

  core::Executor &_executor;
  std::shared_ptr<const ReplayScript> _script;
  std::shared_ptr<ReplayCursor> _cursor;
  net::TransportEvents _events;
  std::shared_ptr<char> _alive;
  std::unordered_set<core::Executor::TimerId> _timers;
  bool _open{false};
  bool _silent{false};
  core::Executor::TimePoint _openedAt{};
};

class ReplayTransportFactory : public net::TransportFactory
{
public:
  ReplayTransportFactory(core::Executor &executor, ReplayScript script)
      : _executor(executor), _script(std::make_shared<const ReplayScript>(std::move(script))),
        _cursor(std::make_shared<ReplayCursor>())
  {
  }

  std::unique_ptr<net::Transport> create(const std::string &endpoint,
                                         net::TransportEvents events) override
  {
    VAULTRELAY_LOG_DEBUG("replay: new session for " << endpoint << " at frame "
                                                    << _cursor->nextFrame << " of "
                                                    << _script->frames.size());
    return std::make_unique<ReplayTransport>(_executor, _script, _cursor, std::move(events));
  }

  const ReplayCursor &cursor() const { return *_cursor; }
  bool finished() const { return _cursor->nextFrame >= _script->frames.size(); }

private:
  core::Executor &_executor;
  std::shared_ptr<const ReplayScript> _script;
  std::shared_ptr<ReplayCursor> _cursor;
};

} // namespace sim
} // namespace vaultrelay

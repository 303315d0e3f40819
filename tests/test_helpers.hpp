// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// Shared test helpers for the VaultRelay test suite: a virtual-time
// executor, scriptable transports and downstream targets, and log capture.

#pragma once

#include <vaultrelay/vaultrelay.hpp>

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <deque>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <unistd.h>

namespace vaultrelay::test
{

using namespace std::chrono_literals;

/// \brief Executor driven by hand. Time only moves in advance(); timers
/// with equal deadlines fire in scheduling order and posted tasks are
/// drained after every timer.
class ManualExecutor : public core::Executor
{
public:
  void post(Task task) override { _tasks.push_back(std::move(task)); }

  TimerId scheduleAfter(std::chrono::milliseconds delay, Task task) override
  {
    if (maxDelay && delay > *maxDelay)
    {
      ++refusedTimers;
      return 0;
    }
    TimerId id = ++_nextId;
    _timers.emplace(id, Timer{_now + std::max(delay, std::chrono::milliseconds(0)),
                              std::move(task)});
    return id;
  }

  bool cancel(TimerId id) override { return _timers.erase(id) != 0; }

  TimePoint now() const override { return _now; }

  /// \brief Run posted tasks, including ones they post, until none are left.
  std::size_t runPending()
  {
    std::size_t ran = 0;
    while (!_tasks.empty())
    {
      Task task = std::move(_tasks.front());
      _tasks.pop_front();
      task();
      ++ran;
    }
    return ran;
  }

  /// \brief Move virtual time forward, firing every timer that falls due.
  void advance(std::chrono::milliseconds by)
  {
    TimePoint target = _now + by;
    runPending();
    for (;;)
    {
      auto next = _timers.end();
      for (auto it = _timers.begin(); it != _timers.end(); ++it)
      {
        if (it->second.due <= target && (next == _timers.end() || it->second.due < next->second.due))
        {
          next = it;
        }
      }
      if (next == _timers.end())
      {
        break;
      }
      _now = next->second.due;
      Task task = std::move(next->second.task);
      _timers.erase(next);
      task();
      runPending();
    }
    _now = target;
  }

  std::size_t pendingTimers() const { return _timers.size(); }
  std::size_t pendingTasks() const { return _tasks.size(); }

  /// \brief Delay until the earliest timer, if any.
  std::optional<std::chrono::milliseconds> nextTimerIn() const
  {
    std::optional<TimePoint> earliest;
    for (const auto &entry : _timers)
    {
      if (!earliest || entry.second.due < *earliest)
      {
        earliest = entry.second.due;
      }
    }
    if (!earliest)
    {
      return std::nullopt;
    }
    return std::chrono::duration_cast<std::chrono::milliseconds>(*earliest - _now);
  }

  std::chrono::milliseconds elapsed() const
  {
    return std::chrono::duration_cast<std::chrono::milliseconds>(_now - TimePoint{});
  }

  /// Longer delays are refused with timer id 0, as EventLoop does past its
  /// maximum timeout.
  std::optional<std::chrono::milliseconds> maxDelay;
  std::size_t refusedTimers{0};

private:
  struct Timer
  {
    TimePoint due;
    Task task;
  };

  // ordered by id, so the first of several equal deadlines is the oldest
  std::map<TimerId, Timer> _timers;
  std::deque<Task> _tasks;
  TimePoint _now{};
  TimerId _nextId{0};
};

/// \brief What a FakeTransport saw and the events it can raise. Outlives
/// the transport so tests can still inspect a replaced session.
struct FakeSession
{
  std::string endpoint;
  net::TransportEvents events;
  bool opened{false};
  bool terminated{false};
  bool destroyed{false};
  bool pingResult{true};
  int pings{0};
  std::optional<net::CloseInfo> closedWith;
  std::vector<std::string> sent;

  void emitOpen() { events.onOpen(); }
  void emitClose(int code = net::close_code::Abnormal, const std::string &reason = "")
  {
    events.onClose(net::CloseInfo{code, reason});
  }
  void emitPong() { events.onPong(); }
  void emitError(const std::string &message) { events.onError(message); }
  void emitMessage(const net::Notification &n) { events.onMessage(n); }
};

class FakeTransport : public net::Transport
{
public:
  explicit FakeTransport(std::shared_ptr<FakeSession> session) : _session(std::move(session)) {}
  ~FakeTransport() override { _session->destroyed = true; }

  void open() override { _session->opened = true; }
  bool ping() override
  {
    ++_session->pings;
    return _session->pingResult;
  }
  bool send(const std::string &payload) override
  {
    _session->sent.push_back(payload);
    return true;
  }
  void close(int code, const std::string &reason) override
  {
    _session->closedWith = net::CloseInfo{code, reason};
  }
  void terminate() override { _session->terminated = true; }

private:
  std::shared_ptr<FakeSession> _session;
};

class FakeTransportFactory : public net::TransportFactory
{
public:
  std::unique_ptr<net::Transport> create(const std::string &endpoint,
                                         net::TransportEvents events) override
  {
    if (failCreates > 0)
    {
      --failCreates;
      throw std::runtime_error("connection refused");
    }
    auto session = std::make_shared<FakeSession>();
    session->endpoint = endpoint;
    session->events = std::move(events);
    sessions.push_back(session);
    return std::make_unique<FakeTransport>(session);
  }

  FakeSession &last() { return *sessions.back(); }

  /// Number of upcoming create() calls that throw.
  unsigned failCreates{0};
  std::vector<std::shared_ptr<FakeSession>> sessions;
};

/// \brief Downstream target that records calls and completes them only
/// when the test says so, unless autoConfirm is set.
class RecordingSyncTarget : public sync::SyncTarget, public sync::PurchaseHandler
{
public:
  struct Call
  {
    std::string op;
    sync::SaleWindow window;
    sync::Quantity balance;
    sync::Purchase purchase;
    sync::SyncCompletion done;
  };

  explicit RecordingSyncTarget(std::string name = "target") : _name(std::move(name)) {}

  std::string name() const override { return _name; }

  void updateSaleWindow(const sync::SaleWindow &window, sync::SyncCompletion done) override
  {
    Call call;
    call.op = "updateSaleDates";
    call.window = window;
    record(std::move(call), std::move(done));
  }

  void updateBalance(const sync::Quantity &balance, sync::SyncCompletion done) override
  {
    Call call;
    call.op = "updateTokenBalance";
    call.balance = balance;
    record(std::move(call), std::move(done));
  }

  void handlePurchase(const sync::Purchase &purchase, sync::SyncCompletion done) override
  {
    Call call;
    call.op = "handleTokenPurchase";
    call.purchase = purchase;
    record(std::move(call), std::move(done));
  }

  std::size_t count(const std::string &op) const
  {
    return static_cast<std::size_t>(std::count_if(
      calls.begin(), calls.end(), [&op](const Call &c) { return c.op == op; }));
  }

  /// \brief Index of the n-th (0-based) call of the given kind.
  std::size_t indexOf(const std::string &op, std::size_t n = 0) const
  {
    for (std::size_t i = 0; i < calls.size(); ++i)
    {
      if (calls[i].op == op && n-- == 0)
      {
        return i;
      }
    }
    throw std::out_of_range("no call " + op);
  }

  void confirm(std::size_t index, const std::string &receipt = "0xabc")
  {
    calls.at(index).done(sync::SyncOutcome::confirmed(receipt));
  }

  void fail(std::size_t index, const std::string &error = "execution reverted")
  {
    calls.at(index).done(sync::SyncOutcome::failed(error));
  }

  std::vector<Call> calls;
  bool autoConfirm{false};
  bool throwOnCall{false};

private:
  void record(Call call, sync::SyncCompletion done)
  {
    if (throwOnCall)
    {
      throw std::runtime_error("target unavailable");
    }
    call.done = done;
    calls.push_back(std::move(call));
    if (autoConfirm)
    {
      done(sync::SyncOutcome::confirmed("0x" + std::to_string(calls.size())));
    }
  }

  std::string _name;
};

class FakeSnapshotSource : public sync::SnapshotSource
{
public:
  FakeSnapshotSource(sync::SaleWindow w, sync::Quantity b) : window(w), balance(std::move(b)) {}

  sync::SaleWindow fetchSaleWindow() override
  {
    ++fetches;
    if (failWindow)
    {
      throw std::runtime_error("sale dates unavailable");
    }
    return window;
  }

  sync::Quantity fetchBalance() override
  {
    ++fetches;
    if (failBalance)
    {
      throw std::runtime_error("balance unavailable");
    }
    return balance;
  }

  sync::SaleWindow window;
  sync::Quantity balance;
  bool failWindow{false};
  bool failBalance{false};
  int fetches{0};
};

/// \brief Captures log records through the logger's external handler for
/// the lifetime of the object.
class LogCapture
{
public:
  struct Entry
  {
    core::Logger::Level level;
    std::string message;
  };

  explicit LogCapture(core::Logger::Level level = core::Logger::Level::Debug)
      : _previous(core::Logger::level())
  {
    core::Logger::setLevel(level);
    core::Logger::setExternalHandler(
      [this](core::Logger::Level lvl, const std::string &, const std::string &message) {
        std::lock_guard<std::mutex> lock(_mutex);
        _entries.push_back({lvl, message});
      });
  }

  ~LogCapture()
  {
    core::Logger::clearExternalHandler();
    core::Logger::setLevel(_previous);
  }

  LogCapture(const LogCapture &) = delete;
  LogCapture &operator=(const LogCapture &) = delete;

  std::size_t count(const std::string &needle) const
  {
    std::lock_guard<std::mutex> lock(_mutex);
    return static_cast<std::size_t>(
      std::count_if(_entries.begin(), _entries.end(), [&needle](const Entry &e) {
        return e.message.find(needle) != std::string::npos;
      }));
  }

  bool contains(const std::string &needle) const { return count(needle) > 0; }

  bool contains(core::Logger::Level level, const std::string &needle) const
  {
    std::lock_guard<std::mutex> lock(_mutex);
    return std::any_of(_entries.begin(), _entries.end(), [&](const Entry &e) {
      return e.level == level && e.message.find(needle) != std::string::npos;
    });
  }

  std::vector<Entry> entries() const
  {
    std::lock_guard<std::mutex> lock(_mutex);
    return _entries;
  }

private:
  core::Logger::Level _previous;
  mutable std::mutex _mutex;
  std::vector<Entry> _entries;
};

inline net::Notification notification(const std::string &name,
                                      std::map<std::string, std::string> fields,
                                      const std::string &source = "presale")
{
  net::Notification n;
  n.source = source;
  n.name = name;
  n.fields = std::move(fields);
  return n;
}

inline net::Notification saleDates(std::uint64_t start, std::uint64_t end)
{
  return notification(sync::event_name::SaleDateUpdated,
                      {{"startSaleDate", std::to_string(start)},
                       {"endSaleDate", std::to_string(end)}});
}

inline net::Notification tokenBalance(const std::string &balance)
{
  return notification(sync::event_name::TokenBalanceUpdated, {{"newBalance", balance}});
}

inline net::Notification tokenPurchase(const std::string &buyer, const std::string &amount,
                                       const std::string &value = "1000",
                                       const std::string &chainId = "56")
{
  return notification(sync::event_name::TokenPurchase,
                      {{"buyer", buyer}, {"amount", amount}, {"value", value}, {"chainId", chainId}},
                      "vault");
}

/// \brief Unique path under the system temp directory, removed on scope exit.
class TempFile
{
public:
  explicit TempFile(const std::string &stem)
      : _path(std::filesystem::temp_directory_path() /
              (stem + "." + std::to_string(::getpid()) + "." + std::to_string(++counter())))
  {
  }
  ~TempFile()
  {
    std::error_code ec;
    std::filesystem::remove(_path, ec);
  }

  std::string path() const { return _path.string(); }

private:
  static int &counter()
  {
    static int n = 0;
    return n;
  }

  std::filesystem::path _path;
};

} // namespace vaultrelay::test

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
#include <deque>
#include <exception>
#include <functional>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <unordered_map>
#include <utility>
#include <vector>

#include <errno.h>
#include <string.h>
#include <sys/epoll.h>
#include <sys/eventfd.h>
#include <sys/timerfd.h>
#include <unistd.h>

#include <vaultrelay/core/executor.hpp>
#include <vaultrelay/core/logger.hpp>

namespace vaultrelay
{
namespace core
{

enum class LoopError
{
  None,
  SystemError,
  InvalidTimeout,
  TaskException
};

/// \brief Raised when the loop cannot acquire its kernel resources.
class LoopException : public std::runtime_error
{
public:
  LoopException(LoopError code, const std::string &msg, int errnoVal = 0)
      : std::runtime_error(errnoVal != 0 ? msg + " (errno " + std::to_string(errnoVal) + ": " +
                                             ::strerror(errnoVal) + ")"
                                         : msg),
        _code(code), _errno(errnoVal)
  {
  }

  LoopError code() const { return _code; }
  int getErrno() const { return _errno; }

private:
  LoopError _code;
  int _errno;
};

struct LoopStats
{
  std::atomic<std::uint64_t> tasksPosted{0};
  std::atomic<std::uint64_t> tasksRun{0};
  std::atomic<std::uint64_t> timersScheduled{0};
  std::atomic<std::uint64_t> timersCanceled{0};
  std::atomic<std::uint64_t> timersFired{0};
  std::atomic<std::uint64_t> exceptionsSwallowed{0};
  std::atomic<std::uint64_t> systemErrors{0};
};

/// \brief Single-threaded executor driven by epoll, a timerfd for the
/// earliest deadline and an eventfd for wakeups.
///
/// Posted tasks and expired timers run on the loop thread. Timers live in a
/// min-heap keyed by deadline; cancellation removes the record and the heap
/// entry is skipped lazily. Exceptions escaping a task are logged and
/// counted, never propagated.
class EventLoop : public Executor
{
public:
  using ErrorHandler =
    std::function<void(LoopError error, const std::string &message, int errnoVal)>;

  /// \throws LoopException if epoll, timerfd or eventfd creation fails
  explicit EventLoop(std::chrono::milliseconds maxTimeout = std::chrono::hours(24))
      : _maxTimeout(maxTimeout)
  {
    _epollFd = ::epoll_create1(EPOLL_CLOEXEC);
    if (_epollFd < 0)
    {
      throw LoopException(LoopError::SystemError, "epoll_create1 failed", errno);
    }
    _timerFd = ::timerfd_create(CLOCK_MONOTONIC, TFD_NONBLOCK | TFD_CLOEXEC);
    if (_timerFd < 0)
    {
      int err = errno;
      closeFds();
      throw LoopException(LoopError::SystemError, "timerfd_create failed", err);
    }
    _eventFd = ::eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (_eventFd < 0)
    {
      int err = errno;
      closeFds();
      throw LoopException(LoopError::SystemError, "eventfd failed", err);
    }
    try
    {
      watch(_timerFd);
      watch(_eventFd);
    }
    catch (const LoopException &)
    {
      closeFds();
      throw;
    }
  }

  ~EventLoop() override
  {
    stop();
    closeFds();
  }

  EventLoop(const EventLoop &) = delete;
  EventLoop &operator=(const EventLoop &) = delete;

  /// \brief Spawn the loop thread. Idempotent.
  void start()
  {
    bool expected = false;
    if (!_running.compare_exchange_strong(expected, true))
    {
      return;
    }
    _thread = std::thread([this] { runLoop(); });
    VAULTRELAY_LOG_DEBUG("event loop started");
  }

  /// \brief Stop the loop and join its thread. Tasks still queued are
  /// dropped. Must not be called from the loop thread.
  void stop()
  {
    bool expected = true;
    if (!_running.compare_exchange_strong(expected, false))
    {
      return;
    }
    wake();
    if (_thread.joinable())
    {
      _thread.join();
    }
    std::size_t dropped = 0;
    {
      std::lock_guard<std::mutex> lock(_mutex);
      dropped = _tasks.size() + _timers.size();
      _tasks.clear();
      _timers.clear();
      _heap.clear();
    }
    VAULTRELAY_LOG_DEBUG("event loop stopped, dropped " << dropped << " pending task(s)");
  }

  bool running() const { return _running.load(std::memory_order_acquire); }

  bool isInLoopThread() const { return std::this_thread::get_id() == _loopThreadId.load(); }

  void post(Task task) override
  {
    {
      std::lock_guard<std::mutex> lock(_mutex);
      _tasks.push_back(std::move(task));
    }
    _stats.tasksPosted.fetch_add(1, std::memory_order_relaxed);
    wake();
  }

  TimerId scheduleAfter(std::chrono::milliseconds delay, Task task) override
  {
    if (delay > _maxTimeout)
    {
      handleError(LoopError::InvalidTimeout,
                  "timer delay " + std::to_string(delay.count()) + " ms exceeds maximum", 0);
      return 0;
    }
    if (delay.count() < 0)
    {
      delay = std::chrono::milliseconds::zero();
    }
    TimePoint due = Clock::now() + delay;
    TimerId id;
    {
      std::lock_guard<std::mutex> lock(_mutex);
      id = ++_nextId;
      _timers.emplace(id, std::move(task));
      _heap.push_back(HeapItem{due, id});
      siftUp(_heap.size() - 1);
    }
    _stats.timersScheduled.fetch_add(1, std::memory_order_relaxed);
    wake();
    return id;
  }

  bool cancel(TimerId id) override
  {
    std::lock_guard<std::mutex> lock(_mutex);
    if (_timers.erase(id) == 0)
    {
      return false;
    }
    _stats.timersCanceled.fetch_add(1, std::memory_order_relaxed);
    return true;
  }

  TimePoint now() const override { return Clock::now(); }

  /// \brief Number of timers scheduled and not yet fired or cancelled.
  std::size_t pendingTimers() const
  {
    std::lock_guard<std::mutex> lock(_mutex);
    return _timers.size();
  }

  const LoopStats &stats() const { return _stats; }

  void setErrorHandler(ErrorHandler handler)
  {
    std::lock_guard<std::mutex> lock(_mutex);
    _errorHandler = std::move(handler);
  }

private:
  struct HeapItem
  {
    TimePoint due;
    TimerId id;
  };

  static bool earlier(const HeapItem &a, const HeapItem &b)
  {
    return a.due < b.due || (a.due == b.due && a.id < b.id);
  }

  void siftUp(std::size_t idx)
  {
    while (idx > 0)
    {
      std::size_t parent = (idx - 1) / 2;
      if (!earlier(_heap[idx], _heap[parent]))
      {
        break;
      }
      std::swap(_heap[idx], _heap[parent]);
      idx = parent;
    }
  }

  void siftDown(std::size_t idx)
  {
    for (;;)
    {
      std::size_t left = idx * 2 + 1;
      std::size_t right = left + 1;
      std::size_t smallest = idx;
      if (left < _heap.size() && earlier(_heap[left], _heap[smallest]))
      {
        smallest = left;
      }
      if (right < _heap.size() && earlier(_heap[right], _heap[smallest]))
      {
        smallest = right;
      }
      if (smallest == idx)
      {
        return;
      }
      std::swap(_heap[idx], _heap[smallest]);
      idx = smallest;
    }
  }

  void popHeap()
  {
    std::swap(_heap.front(), _heap.back());
    _heap.pop_back();
    if (!_heap.empty())
    {
      siftDown(0);
    }
  }

  /// \brief Drop cancelled entries from the top of the heap and return the
  /// earliest live deadline. Caller holds the lock.
  std::optional<TimePoint> nextDueLocked()
  {
    while (!_heap.empty() && _timers.count(_heap.front().id) == 0)
    {
      popHeap();
    }
    if (_heap.empty())
    {
      return std::nullopt;
    }
    return _heap.front().due;
  }

  void armTimerfd(std::optional<TimePoint> due)
  {
    itimerspec its{};
    if (due)
    {
      auto delta = *due - Clock::now();
      auto ns = std::chrono::duration_cast<std::chrono::nanoseconds>(delta).count();
      if (ns <= 0)
      {
        ns = 1;
      }
      its.it_value.tv_sec = static_cast<time_t>(ns / 1000000000LL);
      its.it_value.tv_nsec = static_cast<long>(ns % 1000000000LL);
    }
    if (::timerfd_settime(_timerFd, 0, &its, nullptr) != 0)
    {
      handleError(LoopError::SystemError, "timerfd_settime failed", errno);
    }
  }

  void wake()
  {
    std::uint64_t one = 1;
    if (::write(_eventFd, &one, sizeof(one)) < 0 && errno != EAGAIN)
    {
      handleError(LoopError::SystemError, "eventfd write failed", errno);
    }
  }

  void drainFd(int fd)
  {
    std::uint64_t value = 0;
    while (::read(fd, &value, sizeof(value)) == static_cast<ssize_t>(sizeof(value)))
    {
    }
  }

  void watch(int fd)
  {
    epoll_event ev{};
    ev.events = EPOLLIN;
    ev.data.fd = fd;
    if (::epoll_ctl(_epollFd, EPOLL_CTL_ADD, fd, &ev) != 0)
    {
      throw LoopException(LoopError::SystemError, "epoll_ctl(ADD) failed", errno);
    }
  }

  void closeFds()
  {
    for (int *fd : {&_eventFd, &_timerFd, &_epollFd})
    {
      if (*fd >= 0)
      {
        ::close(*fd);
        *fd = -1;
      }
    }
  }

  void handleError(LoopError error, const std::string &message, int errnoVal)
  {
    if (error == LoopError::SystemError)
    {
      _stats.systemErrors.fetch_add(1, std::memory_order_relaxed);
    }
    VAULTRELAY_LOG_ERROR("event loop: " << message
                                        << (errnoVal ? std::string(" (") + ::strerror(errnoVal) + ")"
                                                     : std::string()));
    ErrorHandler handler;
    {
      std::lock_guard<std::mutex> lock(_mutex);
      handler = _errorHandler;
    }
    if (handler)
    {
      try
      {
        handler(error, message, errnoVal);
      }
      catch (const std::exception &e)
      {
        VAULTRELAY_LOG_ERROR("event loop error handler threw: " << e.what());
      }
    }
  }

  void safeRun(Task &task)
  {
    if (!task)
    {
      return;
    }
    try
    {
      task();
    }
    catch (const std::exception &e)
    {
      _stats.exceptionsSwallowed.fetch_add(1, std::memory_order_relaxed);
      handleError(LoopError::TaskException, std::string("task threw: ") + e.what(), 0);
    }
    catch (...)
    {
      _stats.exceptionsSwallowed.fetch_add(1, std::memory_order_relaxed);
      handleError(LoopError::TaskException, "task threw a non-standard exception", 0);
    }
  }

  void runTasks()
  {
    std::deque<Task> batch;
    {
      std::lock_guard<std::mutex> lock(_mutex);
      batch.swap(_tasks);
    }
    for (auto &task : batch)
    {
      if (!_running.load(std::memory_order_acquire))
      {
        return;
      }
      safeRun(task);
      _stats.tasksRun.fetch_add(1, std::memory_order_relaxed);
    }
  }

  /// \brief Fire every timer whose deadline has passed. Each timer is
  /// extracted under the lock right before it runs, so a timer cancelled by
  /// an earlier one in the same batch stays cancelled.
  void runDueTimers()
  {
    TimePoint now = Clock::now();
    for (;;)
    {
      Task task;
      {
        std::lock_guard<std::mutex> lock(_mutex);
        auto due = nextDueLocked();
        if (!due || *due > now)
        {
          return;
        }
        TimerId id = _heap.front().id;
        popHeap();
        auto it = _timers.find(id);
        task = std::move(it->second);
        _timers.erase(it);
      }
      _stats.timersFired.fetch_add(1, std::memory_order_relaxed);
      safeRun(task);
      if (!_running.load(std::memory_order_acquire))
      {
        return;
      }
    }
  }

  void runLoop()
  {
    _loopThreadId.store(std::this_thread::get_id());
    epoll_event events[8];
    while (_running.load(std::memory_order_acquire))
    {
      std::optional<TimePoint> due;
      {
        std::lock_guard<std::mutex> lock(_mutex);
        due = nextDueLocked();
      }
      armTimerfd(due);
      int rc = ::epoll_wait(_epollFd, events, 8, -1);
      if (rc < 0)
      {
        if (errno != EINTR)
        {
          handleError(LoopError::SystemError, "epoll_wait failed", errno);
        }
        continue;
      }
      for (int i = 0; i < rc; ++i)
      {
        drainFd(events[i].data.fd);
      }
      runTasks();
      runDueTimers();
    }
    _loopThreadId.store(std::thread::id());
  }

  std::chrono::milliseconds _maxTimeout;
  mutable std::mutex _mutex;
  std::deque<Task> _tasks;
  std::unordered_map<TimerId, Task> _timers;
  std::vector<HeapItem> _heap;
  TimerId _nextId{0};
  ErrorHandler _errorHandler;
  LoopStats _stats;

  std::atomic<bool> _running{false};
  std::atomic<std::thread::id> _loopThreadId{};
  std::thread _thread;
  int _epollFd{-1};
  int _timerFd{-1};
  int _eventFd{-1};
};

} // namespace core
} // namespace vaultrelay

// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of VaultRelay, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <chrono>
#include <functional>
#include <limits>
#include <memory>
#include <optional>
#include <stdexcept>

#include <vaultrelay/core/executor.hpp>
#include <vaultrelay/core/logger.hpp>

namespace vaultrelay
{
namespace net
{

/// \brief Exponential backoff bounded by an attempt count.
struct ReconnectPolicy
{
  std::chrono::milliseconds baseDelay{1000};
  unsigned maxAttempts{5};

  /// \brief baseDelay * 2^attempts, saturating at the largest representable
  /// delay.
  std::chrono::milliseconds delayFor(unsigned attempts) const
  {
    using Rep = std::chrono::milliseconds::rep;
    constexpr Rep ceiling = std::numeric_limits<Rep>::max();
    Rep delay = baseDelay.count();
    for (unsigned i = 0; i < attempts && delay > 0; ++i)
    {
      if (delay > ceiling / 2)
      {
        return std::chrono::milliseconds(ceiling);
      }
      delay *= 2;
    }
    return std::chrono::milliseconds(delay);
  }
};

/// \brief Schedules reconnection attempts after a lost session.
///
/// attempts() counts attempts scheduled since the last reset(); once it
/// reaches maxAttempts the scheduler is exhausted and refuses to schedule
/// until reset(). At most one attempt is outstanding at a time.
class ReconnectScheduler
{
public:
  using Task = core::Executor::Task;

  /// \throws std::invalid_argument for a negative base delay or zero
  /// maxAttempts
  ReconnectScheduler(core::Executor &executor, ReconnectPolicy policy)
      : _executor(executor), _policy(policy), _alive(std::make_shared<char>(0))
  {
    if (_policy.baseDelay.count() < 0)
    {
      throw std::invalid_argument("reconnect base delay must not be negative");
    }
    if (_policy.maxAttempts == 0)
    {
      throw std::invalid_argument("reconnect max attempts must be at least 1");
    }
  }

  ~ReconnectScheduler() { cancel(); }

  ReconnectScheduler(const ReconnectScheduler &) = delete;
  ReconnectScheduler &operator=(const ReconnectScheduler &) = delete;

  /// \brief Schedule the next attempt.
  /// \return the delay used, or std::nullopt when the cap is reached or the
  /// executor refuses the timer; either way the scheduler is exhausted
  std::optional<std::chrono::milliseconds> schedule(Task reconnect)
  {
    if (_attempts >= _policy.maxAttempts)
    {
      _exhausted = true;
      VAULTRELAY_LOG_FATAL("Maximum reconnection attempts reached (" << _policy.maxAttempts
                                                                     << "). Aborting.");
      return std::nullopt;
    }
    if (_timer != 0)
    {
      VAULTRELAY_LOG_WARN("Replacing an outstanding reconnection attempt");
      cancel();
    }

    auto delay = _policy.delayFor(_attempts);
    std::weak_ptr<char> alive = _alive;
    _timer = _executor.scheduleAfter(delay, [this, alive, task = std::move(reconnect)] {
      if (!alive.lock())
      {
        return;
      }
      _timer = 0;
      task();
    });
    if (_timer == 0)
    {
      _exhausted = true;
      VAULTRELAY_LOG_FATAL("Could not schedule reconnection attempt "
                           << (_attempts + 1) << " in " << delay.count() << " ms. Aborting.");
      return std::nullopt;
    }
    ++_attempts;
    VAULTRELAY_LOG_INFO("Scheduled reconnection attempt " << _attempts << " in " << delay.count()
                                                          << " ms");
    return delay;
  }

  /// \brief Forget previous failures after a successful open.
  void reset()
  {
    _attempts = 0;
    _exhausted = false;
  }

  void cancel()
  {
    if (_timer != 0)
    {
      _executor.cancel(_timer);
      _timer = 0;
    }
  }

  unsigned attempts() const { return _attempts; }
  bool exhausted() const { return _exhausted; }
  bool pending() const { return _timer != 0; }
  const ReconnectPolicy &policy() const { return _policy; }

private:
  core::Executor &_executor;
  ReconnectPolicy _policy;
  std::shared_ptr<char> _alive;
  unsigned _attempts{0};
  bool _exhausted{false};
  core::Executor::TimerId _timer{0};
};

} // namespace net
} // namespace vaultrelay

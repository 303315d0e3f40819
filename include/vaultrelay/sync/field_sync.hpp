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
#include <limits>
#include <memory>
#include <optional>
#include <string>
#include <utility>

#include <vaultrelay/core/executor.hpp>
#include <vaultrelay/core/logger.hpp>
#include <vaultrelay/sync/sync_target.hpp>

namespace vaultrelay
{
namespace sync
{

enum class SyncState
{
  /// The last call was confirmed (or nothing was sent yet).
  Synced,
  /// A call is in flight.
  Pending,
  /// The last call failed; a retry may be scheduled.
  Failed
};

inline const char *toString(SyncState state)
{
  switch (state)
  {
  case SyncState::Synced:
    return "synced";
  case SyncState::Pending:
    return "pending";
  case SyncState::Failed:
    return "failed";
  }
  return "unknown";
}

/// \brief Retry schedule for failed downstream calls: retry k (0-based)
/// waits baseDelay * 2^k. maxRetries == 0 disables retries.
struct SyncRetryPolicy
{
  unsigned maxRetries{3};
  std::chrono::milliseconds baseDelay{2000};

  std::chrono::milliseconds delayFor(unsigned retry) const
  {
    using Rep = std::chrono::milliseconds::rep;
    Rep delay = baseDelay.count();
    for (unsigned i = 0; i < retry; ++i)
    {
      if (delay > std::numeric_limits<Rep>::max() / 2)
      {
        return std::chrono::milliseconds(std::numeric_limits<Rep>::max());
      }
      delay *= 2;
    }
    return std::chrono::milliseconds(delay);
  }
};

struct FieldSyncStats
{
  std::uint64_t callsIssued{0};
  std::uint64_t confirmations{0};
  std::uint64_t failures{0};
  std::uint64_t retries{0};
  std::uint64_t duplicatesSkipped{0};
  std::uint64_t valuesQueued{0};
};

/// \brief Wrap a completion so that it runs on the executor at most once
/// and not at all once the owner behind `alive` is gone.
inline SyncCompletion postedCompletion(core::Executor &executor, std::weak_ptr<char> alive,
                                       std::function<void(SyncOutcome)> handler)
{
  auto fired = std::make_shared<std::atomic<bool>>(false);
  return [&executor, alive, fired, handler = std::move(handler)](SyncOutcome outcome) {
    if (fired->exchange(true))
    {
      VAULTRELAY_LOG_WARN("ignoring repeated completion of a downstream call");
      return;
    }
    executor.post([alive, handler, outcome = std::move(outcome)] {
      if (alive.lock())
      {
        handler(outcome);
      }
    });
  };
}

/// \brief Synchronisation state of one field on one downstream target.
///
/// The confirmed value changes only when the target confirms a call. At
/// most one call is in flight; a different value arriving meanwhile is
/// queued (latest wins) and sent once the call settles. A value equal to
/// the confirmed one is skipped only while Synced: after a failure every
/// value is sent again, since the target's state is unknown. Runs on the
/// executor thread.
template <typename T> class FieldSync
{
public:
  using Call = std::function<void(const T &, SyncCompletion)>;

  FieldSync(core::Executor &executor, std::string target, std::string field, Call call,
            SyncRetryPolicy retry)
      : _executor(executor), _target(std::move(target)), _field(std::move(field)),
        _call(std::move(call)), _retry(retry), _alive(std::make_shared<char>(0))
  {
  }

  ~FieldSync() { cancelRetry(); }

  FieldSync(const FieldSync &) = delete;
  FieldSync &operator=(const FieldSync &) = delete;

  /// \brief Offer a newly observed value.
  /// \param force send even if it equals the confirmed value
  /// \return true if a call was issued or the value was queued
  bool submit(const T &value, bool force = false)
  {
    if (_state == SyncState::Pending)
    {
      if (!force && _inFlight && value == *_inFlight)
      {
        _queued.reset();
        ++_stats.duplicatesSkipped;
        VAULTRELAY_LOG_DEBUG(_field << " " << value << " already in flight to " << _target);
        return false;
      }
      _queued = value;
      _queuedForced = _queuedForced || force;
      ++_stats.valuesQueued;
      VAULTRELAY_LOG_DEBUG(_field << " " << value << " queued for " << _target);
      return true;
    }

    if (_state == SyncState::Synced && !force && _confirmed && value == *_confirmed)
    {
      ++_stats.duplicatesSkipped;
      VAULTRELAY_LOG_DEBUG(_field << " " << value << " already confirmed by " << _target);
      return false;
    }

    cancelRetry();
    _retries = 0;
    issue(value);
    return true;
  }

  SyncState state() const { return _state; }
  const std::string &target() const { return _target; }
  const std::string &field() const { return _field; }
  const std::optional<T> &confirmed() const { return _confirmed; }
  const std::optional<T> &inFlight() const { return _inFlight; }
  const std::optional<T> &queued() const { return _queued; }
  const std::optional<T> &lastFailed() const { return _lastFailed; }
  const std::string &lastReceipt() const { return _lastReceipt; }
  const std::string &lastError() const { return _lastError; }
  bool retryScheduled() const { return _retryTimer != 0; }
  unsigned retries() const { return _retries; }
  const FieldSyncStats &stats() const { return _stats; }

private:
  void issue(const T &value)
  {
    _state = SyncState::Pending;
    _inFlight = value;
    ++_stats.callsIssued;
    VAULTRELAY_LOG_INFO("Updating " << _field << " in " << _target << " to " << value);

    auto done = postedCompletion(_executor, _alive,
                                 [this](const SyncOutcome &outcome) { settle(outcome); });
    try
    {
      _call(value, done);
    }
    catch (const std::exception &e)
    {
      done(SyncOutcome::failed(e.what()));
    }
  }

  void settle(const SyncOutcome &outcome)
  {
    if (_state != SyncState::Pending || !_inFlight)
    {
      return;
    }
    T sent = *_inFlight;
    _inFlight.reset();

    if (outcome.ok)
    {
      ++_stats.confirmations;
      _state = SyncState::Synced;
      _confirmed = sent;
      _lastFailed.reset();
      _lastReceipt = outcome.receipt;
      _retries = 0;
      VAULTRELAY_LOG_INFO(_field << " updated successfully in " << _target
                                 << " with hash: " << outcome.receipt);
    }
    else
    {
      ++_stats.failures;
      _state = SyncState::Failed;
      _lastFailed = sent;
      _lastError = outcome.error;
      VAULTRELAY_LOG_ERROR("Failed to update " << _field << " in " << _target << ": "
                                               << outcome.error);
    }

    if (_queued)
    {
      T next = std::move(*_queued);
      bool forced = _queuedForced;
      _queued.reset();
      _queuedForced = false;
      _retries = 0;
      submit(next, forced);
      return;
    }

    if (!outcome.ok)
    {
      scheduleRetry(sent);
    }
  }

  void scheduleRetry(const T &value)
  {
    if (_retries >= _retry.maxRetries)
    {
      if (_retry.maxRetries > 0)
      {
        VAULTRELAY_LOG_ERROR("Giving up on " << _field << " for " << _target << " after "
                                             << _retries << " retries");
      }
      return;
    }
    auto delay = _retry.delayFor(_retries);
    std::weak_ptr<char> alive = _alive;
    _retryTimer = _executor.scheduleAfter(delay, [this, alive, value] {
      if (!alive.lock())
      {
        return;
      }
      _retryTimer = 0;
      ++_stats.retries;
      issue(value);
    });
    if (_retryTimer == 0)
    {
      VAULTRELAY_LOG_ERROR("Could not schedule retry of " << _field << " for " << _target
                                                          << " in " << delay.count()
                                                          << " ms; leaving it failed");
      return;
    }
    ++_retries;
    VAULTRELAY_LOG_WARN("Retrying " << _field << " for " << _target << " in " << delay.count()
                                    << " ms (retry " << _retries << " of " << _retry.maxRetries
                                    << ")");
  }

  void cancelRetry()
  {
    if (_retryTimer != 0)
    {
      _executor.cancel(_retryTimer);
      _retryTimer = 0;
    }
  }

  core::Executor &_executor;
  std::string _target;
  std::string _field;
  Call _call;
  SyncRetryPolicy _retry;
  std::shared_ptr<char> _alive;

  SyncState _state{SyncState::Synced};
  std::optional<T> _confirmed;
  std::optional<T> _inFlight;
  std::optional<T> _queued;
  bool _queuedForced{false};
  std::optional<T> _lastFailed;
  std::string _lastReceipt;
  std::string _lastError;
  unsigned _retries{0};
  core::Executor::TimerId _retryTimer{0};
  FieldSyncStats _stats;
};

} // namespace sync
} // namespace vaultrelay

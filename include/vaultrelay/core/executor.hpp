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

namespace vaultrelay
{
namespace core
{

/// \brief The single logical thread every connection and sync state change
/// runs on.
///
/// Implementations run posted tasks and timer tasks one at a time, in order.
/// A timer cancelled from a task running on the executor never fires
/// afterwards.
class Executor
{
public:
  using Clock = std::chrono::steady_clock;
  using TimePoint = Clock::time_point;
  using Task = std::function<void()>;
  /// \brief Identifies a scheduled timer; 0 is never a valid id.
  using TimerId = std::uint64_t;

  virtual ~Executor() = default;

  /// \brief Queue a task to run on the executor.
  virtual void post(Task task) = 0;

  /// \brief Run a task once after the given delay.
  /// \return timer id, or 0 if the executor refused the timer
  virtual TimerId scheduleAfter(std::chrono::milliseconds delay, Task task) = 0;

  /// \brief Cancel a timer; returns true if it had not fired yet.
  virtual bool cancel(TimerId id) = 0;

  virtual TimePoint now() const = 0;
};

} // namespace core
} // namespace vaultrelay

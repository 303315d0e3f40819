// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of VaultRelay, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#define CATCH_CONFIG_MAIN
#include "test_helpers.hpp"
#include <catch2/catch.hpp>

#include <limits>
#include <memory>

using namespace vaultrelay;
using namespace std::chrono_literals;
using sync::Quantity;
using sync::SyncState;
using test::ManualExecutor;
using test::RecordingSyncTarget;

namespace
{
std::unique_ptr<sync::FieldSync<Quantity>> balanceSync(ManualExecutor &exec,
                                                       RecordingSyncTarget &target,
                                                       sync::SyncRetryPolicy retry = {})
{
  return std::make_unique<sync::FieldSync<Quantity>>(
    exec, target.name(), "token balance",
    [&target](const Quantity &q, sync::SyncCompletion done) {
      target.updateBalance(q, std::move(done));
    },
    retry);
}
} // namespace

TEST_CASE("FieldSync sends each distinct value once", "[fieldsync][dedup]")
{
  test::LogCapture capture;
  ManualExecutor exec;
  RecordingSyncTarget target("bnb-vault");
  auto field = balanceSync(exec, target);

  REQUIRE(field->state() == SyncState::Synced);
  REQUIRE(field->submit(Quantity(100)));
  REQUIRE(field->state() == SyncState::Pending);
  REQUIRE(field->inFlight() == Quantity(100));

  REQUIRE_FALSE(field->submit(Quantity(100)));
  REQUIRE(target.calls.size() == 1);

  target.confirm(0, "0xfeed");
  exec.runPending();
  REQUIRE(field->state() == SyncState::Synced);
  REQUIRE(field->confirmed() == Quantity(100));
  REQUIRE(field->lastReceipt() == "0xfeed");
  REQUIRE(capture.contains("token balance updated successfully in bnb-vault with hash: 0xfeed"));

  REQUIRE_FALSE(field->submit(Quantity(100)));
  REQUIRE(target.calls.size() == 1);
  REQUIRE(field->stats().duplicatesSkipped == 2);

  SECTION("force sends even an already confirmed value")
  {
    REQUIRE(field->submit(Quantity(100), true));
    REQUIRE(target.calls.size() == 2);
  }

  SECTION("A new value is sent")
  {
    REQUIRE(field->submit(Quantity(150)));
    REQUIRE(target.calls.size() == 2);
    REQUIRE(target.calls[1].balance == Quantity(150));
  }
}

TEST_CASE("FieldSync queues the latest value while a call is in flight", "[fieldsync][queue]")
{
  ManualExecutor exec;
  RecordingSyncTarget target;
  auto field = balanceSync(exec, target);

  field->submit(Quantity(1));
  REQUIRE(field->submit(Quantity(2)));
  REQUIRE(field->submit(Quantity(3)));
  REQUIRE(field->queued() == Quantity(3));
  REQUIRE(target.calls.size() == 1);

  SECTION("The queued value is sent once the call settles")
  {
    target.confirm(0);
    exec.runPending();
    REQUIRE(target.calls.size() == 2);
    REQUIRE(target.calls[1].balance == Quantity(3));
    REQUIRE(field->confirmed() == Quantity(1));
    REQUIRE(field->state() == SyncState::Pending);
  }

  SECTION("Returning to the in-flight value drops the queue")
  {
    REQUIRE_FALSE(field->submit(Quantity(1)));
    REQUIRE_FALSE(field->queued().has_value());
    target.confirm(0);
    exec.runPending();
    REQUIRE(target.calls.size() == 1);
    REQUIRE(field->state() == SyncState::Synced);
  }

  SECTION("A failure still sends the queued value, without a retry")
  {
    target.fail(0);
    exec.runPending();
    REQUIRE(target.calls.size() == 2);
    REQUIRE(target.calls[1].balance == Quantity(3));
    REQUIRE_FALSE(field->retryScheduled());
    REQUIRE(exec.pendingTimers() == 0);
  }
}

TEST_CASE("FieldSync retries a failed call with exponential backoff", "[fieldsync][retry]")
{
  test::LogCapture capture;
  ManualExecutor exec;
  RecordingSyncTarget target("bnb-vault");
  auto field = balanceSync(exec, target, sync::SyncRetryPolicy{3, 2000ms});

  field->submit(Quantity(42));
  target.fail(0, "nonce too low");
  exec.runPending();
  REQUIRE(field->state() == SyncState::Failed);
  REQUIRE(field->lastFailed() == Quantity(42));
  REQUIRE(field->lastError() == "nonce too low");
  REQUIRE_FALSE(field->confirmed().has_value());
  REQUIRE(capture.contains(core::Logger::Level::Error,
                           "Failed to update token balance in bnb-vault: nonce too low"));
  REQUIRE(field->retryScheduled());
  REQUIRE(exec.nextTimerIn() == 2000ms);

  SECTION("Retries back off and give up after the limit")
  {
    std::vector<std::chrono::milliseconds> delays{2000ms};
    for (std::size_t attempt = 1; attempt <= 3; ++attempt)
    {
      exec.advance(*exec.nextTimerIn());
      REQUIRE(target.calls.size() == attempt + 1);
      REQUIRE(target.calls.back().balance == Quantity(42));
      target.fail(attempt);
      exec.runPending();
      if (auto next = exec.nextTimerIn())
      {
        delays.push_back(*next);
      }
    }
    REQUIRE(delays == (std::vector<std::chrono::milliseconds>{2000ms, 4000ms, 8000ms}));
    REQUIRE_FALSE(field->retryScheduled());
    REQUIRE(field->stats().retries == 3);
    REQUIRE(capture.contains("Giving up on token balance for bnb-vault after 3 retries"));

    SECTION("The next event resends even the failed value")
    {
      REQUIRE(field->submit(Quantity(42)));
      REQUIRE(target.calls.size() == 5);
    }
  }

  SECTION("A successful retry settles the field")
  {
    exec.advance(2000ms);
    target.confirm(1, "0x42");
    exec.runPending();
    REQUIRE(field->state() == SyncState::Synced);
    REQUIRE(field->confirmed() == Quantity(42));
    REQUIRE_FALSE(field->lastFailed().has_value());
    REQUIRE(field->retries() == 0);
  }

  SECTION("A newer value replaces the pending retry")
  {
    REQUIRE(field->submit(Quantity(43)));
    REQUIRE_FALSE(field->retryScheduled());
    REQUIRE(exec.pendingTimers() == 0);
    REQUIRE(target.calls.back().balance == Quantity(43));
    exec.advance(10000ms);
    REQUIRE(target.calls.size() == 2);
  }
}

TEST_CASE("FieldSync after a failure resends a value equal to the confirmed one",
          "[fieldsync][failed]")
{
  ManualExecutor exec;
  RecordingSyncTarget target;
  auto field = balanceSync(exec, target, sync::SyncRetryPolicy{0, 2000ms});

  field->submit(Quantity(5));
  target.confirm(0);
  exec.runPending();
  field->submit(Quantity(6));
  target.fail(1);
  exec.runPending();
  REQUIRE(field->state() == SyncState::Failed);
  REQUIRE(field->confirmed() == Quantity(5));
  REQUIRE(exec.pendingTimers() == 0);

  REQUIRE(field->submit(Quantity(5)));
  REQUIRE(target.calls.size() == 3);
  REQUIRE(target.calls[2].balance == Quantity(5));
}

TEST_CASE("FieldSync treats a throwing call as a failure", "[fieldsync][errors]")
{
  ManualExecutor exec;
  RecordingSyncTarget target;
  target.throwOnCall = true;
  auto field = balanceSync(exec, target, sync::SyncRetryPolicy{0, 1000ms});

  REQUIRE(field->submit(Quantity(9)));
  exec.runPending();
  REQUIRE(field->state() == SyncState::Failed);
  REQUIRE(field->lastError() == "target unavailable");
}

TEST_CASE("FieldSync completions fire at most once", "[fieldsync][completion]")
{
  test::LogCapture capture;
  ManualExecutor exec;
  RecordingSyncTarget target;
  auto field = balanceSync(exec, target);

  field->submit(Quantity(1));
  target.confirm(0);
  target.fail(0);
  exec.runPending();
  REQUIRE(field->state() == SyncState::Synced);
  REQUIRE(field->stats().failures == 0);
  REQUIRE(capture.contains("ignoring repeated completion"));

  SECTION("A completion after the field is gone is dropped")
  {
    field->submit(Quantity(2));
    field.reset();
    target.confirm(1);
    REQUIRE_NOTHROW(exec.runPending());
  }
}

TEST_CASE("SyncRetryPolicy delay doubles and saturates", "[fieldsync][policy]")
{
  sync::SyncRetryPolicy policy;
  REQUIRE(policy.maxRetries == 3);
  REQUIRE(policy.delayFor(0) == 2000ms);
  REQUIRE(policy.delayFor(2) == 8000ms);
  REQUIRE(policy.delayFor(70).count() ==
          std::numeric_limits<std::chrono::milliseconds::rep>::max());
}

TEST_CASE("FieldSync stays Failed when a retry cannot be scheduled", "[fieldsync][retry]")
{
  test::LogCapture capture;
  ManualExecutor exec;
  exec.maxDelay = 3000ms;
  RecordingSyncTarget target("bnb-vault");
  auto field = balanceSync(exec, target);

  field->submit(Quantity(100));
  target.fail(0);
  exec.runPending();
  REQUIRE(exec.pendingTimers() == 1);
  exec.advance(2000ms);
  REQUIRE(target.calls.size() == 2);

  target.fail(1);
  exec.runPending();
  REQUIRE(exec.refusedTimers == 1);
  REQUIRE(field->state() == SyncState::Failed);
  REQUIRE(exec.pendingTimers() == 0);
  REQUIRE(capture.contains(core::Logger::Level::Error,
                           "Could not schedule retry of token balance for bnb-vault in 4000 ms"));

  SECTION("The next value is still sent")
  {
    REQUIRE(field->submit(Quantity(100)));
    REQUIRE(target.calls.size() == 3);
  }
}

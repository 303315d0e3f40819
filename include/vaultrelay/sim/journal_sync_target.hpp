// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of VaultRelay, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <chrono>
#include <cstdint>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>

#include <vaultrelay/core/executor.hpp>
#include <vaultrelay/core/json.hpp>
#include <vaultrelay/core/logger.hpp>
#include <vaultrelay/crypto/digest.hpp>
#include <vaultrelay/sync/sync_target.hpp>

namespace vaultrelay
{
namespace sim
{

struct JournalConfig
{
  std::string name{"vault"};
  /// File each call is appended to; empty keeps the journal in memory only.
  std::string path;
  /// Delay between the call and its confirmation.
  std::chrono::milliseconds confirmDelay{0};
  /// Reject the first N calls, to exercise the retry path.
  unsigned rejectFirst{0};
};

/// \brief Downstream target that records every call in an append-only
/// journal and confirms it with a transaction-hash-like receipt.
///
/// The journal holds one JSON object per line:
/// \code
/// {"time":"2025-01-01T00:00:00Z","target":"vault","op":"updateSaleDates",
///  "args":{"start":100,"end":200},"receipt":"0x..."}
/// \endcode
class JournalSyncTarget : public sync::SyncTarget, public sync::PurchaseHandler
{
public:
  JournalSyncTarget(core::Executor &executor, JournalConfig config)
      : _executor(executor), _config(std::move(config)), _alive(std::make_shared<char>(0))
  {
  }

  std::string name() const override { return _config.name; }

  void updateSaleWindow(const sync::SaleWindow &window, sync::SyncCompletion done) override
  {
    record("updateSaleDates", core::Json{{"start", window.start}, {"end", window.end}},
           std::move(done));
  }

  void updateBalance(const sync::Quantity &balance, sync::SyncCompletion done) override
  {
    record("updateTokenBalance", core::Json{{"balance", balance.toString()}}, std::move(done));
  }

  void handlePurchase(const sync::Purchase &purchase, sync::SyncCompletion done) override
  {
    record("handleTokenPurchase",
           core::Json{{"buyer", purchase.buyer},
                      {"amount", purchase.amount.toString()},
                      {"value", purchase.value.toString()},
                      {"chainId", purchase.chainId}},
           std::move(done));
  }

  std::uint64_t calls() const { return _calls; }
  const std::string &lastEntry() const { return _lastEntry; }

private:
  void record(const std::string &op, core::Json args, sync::SyncCompletion done)
  {
    ++_calls;
    auto stamp = std::time(nullptr);
    std::tm tm{};
    gmtime_r(&stamp, &tm);
    std::ostringstream time;
    time << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");

    core::Json entry;
    entry["time"] = time.str();
    entry["target"] = _config.name;
    entry["op"] = op;
    entry["args"] = std::move(args);

    sync::SyncOutcome outcome;
    if (_calls <= _config.rejectFirst)
    {
      outcome = sync::SyncOutcome::failed("rejected by " + _config.name + " (call " +
                                          std::to_string(_calls) + ")");
    }
    else
    {
      try
      {
        std::string receipt = crypto::Digest::receiptFor(entry.dump());
        entry["receipt"] = receipt;
        _lastEntry = entry.dump();
        append(_lastEntry);
        outcome = sync::SyncOutcome::confirmed(receipt);
      }
      catch (const std::exception &e)
      {
        outcome = sync::SyncOutcome::failed(e.what());
      }
    }

    std::weak_ptr<char> alive = _alive;
    auto timer = _executor.scheduleAfter(_config.confirmDelay, [alive, done, outcome] {
      if (alive.lock())
      {
        done(outcome);
      }
    });
    if (timer == 0)
    {
      VAULTRELAY_LOG_ERROR(_config.name << ": could not schedule confirmation of " << op);
      done(sync::SyncOutcome::failed("confirmation could not be scheduled"));
    }
  }

  void append(const std::string &entry)
  {
    if (_config.path.empty())
    {
      return;
    }
    if (!_journal)
    {
      _journal = std::make_unique<std::ofstream>(_config.path, std::ios::app);
    }
    if (!_journal->is_open() || !((*_journal) << entry << '\n') || !_journal->flush())
    {
      _journal.reset();
      throw std::runtime_error("cannot write journal " + _config.path);
    }
  }

  core::Executor &_executor;
  JournalConfig _config;
  std::shared_ptr<char> _alive;
  std::unique_ptr<std::ofstream> _journal;
  std::uint64_t _calls{0};
  std::string _lastEntry;
};

/// \brief SnapshotSource returning fixed values from configuration.
class StaticSnapshotSource : public sync::SnapshotSource
{
public:
  StaticSnapshotSource(sync::SaleWindow window, sync::Quantity balance)
      : _window(window), _balance(std::move(balance))
  {
  }

  sync::SaleWindow fetchSaleWindow() override { return _window; }
  sync::Quantity fetchBalance() override { return _balance; }

private:
  sync::SaleWindow _window;
  sync::Quantity _balance;
};

} // namespace sim
} // namespace vaultrelay

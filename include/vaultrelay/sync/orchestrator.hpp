// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of VaultRelay, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <cstdint>
#include <exception>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

#include <vaultrelay/core/executor.hpp>
#include <vaultrelay/core/logger.hpp>
#include <vaultrelay/net/transport.hpp>
#include <vaultrelay/sync/events.hpp>
#include <vaultrelay/sync/field_sync.hpp>
#include <vaultrelay/sync/sync_target.hpp>

namespace vaultrelay
{
namespace sync
{

/// \brief The authoritative snapshot could not be fetched at startup.
class StartupError : public std::runtime_error
{
public:
  using std::runtime_error::runtime_error;
};

struct OrchestratorStats
{
  std::uint64_t notifications{0};
  std::uint64_t rejectedNotifications{0};
  std::uint64_t saleWindowEvents{0};
  std::uint64_t balanceEvents{0};
  std::uint64_t purchasesRelayed{0};
  std::uint64_t purchasesRejected{0};
  std::uint64_t purchasesConfirmed{0};
  std::uint64_t purchasesFailed{0};
};

/// \brief Relays domain events into downstream calls.
///
/// Each target gets its own FieldSync for the sale window and the balance,
/// so a slow or failing target never holds back another. Purchases are
/// validated and forwarded once per occurrence. bootstrap() fetches the
/// authoritative snapshot and forces an initial sync to every target. All
/// methods run on the executor thread; targets and handlers must outlive
/// the orchestrator.
class SyncOrchestrator
{
public:
  SyncOrchestrator(core::Executor &executor, SnapshotSource &source,
                   const std::vector<SyncTarget *> &targets, PurchaseHandler *purchases,
                   SyncRetryPolicy retry = {})
      : _executor(executor), _source(source), _purchases(purchases),
        _alive(std::make_shared<char>(0))
  {
    if (targets.empty())
    {
      throw std::invalid_argument("at least one sync target is required");
    }
    for (SyncTarget *target : targets)
    {
      if (target == nullptr)
      {
        throw std::invalid_argument("sync target is null");
      }
      std::string name = target->name();
      for (const auto &existing : _lanes)
      {
        if (existing->target->name() == name)
        {
          throw std::invalid_argument("duplicate sync target '" + name + "'");
        }
      }
      auto lane = std::make_unique<Lane>();
      lane->target = target;
      lane->saleWindow = std::make_unique<FieldSync<SaleWindow>>(
        executor, name, "sale dates",
        [target](const SaleWindow &w, SyncCompletion done) {
          target->updateSaleWindow(w, std::move(done));
        },
        retry);
      lane->balance = std::make_unique<FieldSync<Quantity>>(
        executor, name, "token balance",
        [target](const Quantity &q, SyncCompletion done) {
          target->updateBalance(q, std::move(done));
        },
        retry);
      _lanes.push_back(std::move(lane));
    }
  }

  SyncOrchestrator(const SyncOrchestrator &) = delete;
  SyncOrchestrator &operator=(const SyncOrchestrator &) = delete;

  /// \brief Fetch the snapshot once and sync it to every target regardless
  /// of cached state.
  /// \throws StartupError if either value cannot be fetched
  void bootstrap()
  {
    SaleWindow window;
    Quantity balance;
    try
    {
      window = _source.fetchSaleWindow();
      VAULTRELAY_LOG_INFO("Initial sale dates fetched: " << window);
    }
    catch (const std::exception &e)
    {
      VAULTRELAY_LOG_ERROR("Failed to fetch sale dates: " << e.what());
      throw StartupError(std::string("cannot fetch sale dates: ") + e.what());
    }
    try
    {
      balance = _source.fetchBalance();
      VAULTRELAY_LOG_INFO("Initial token balance fetched: " << balance);
    }
    catch (const std::exception &e)
    {
      VAULTRELAY_LOG_ERROR("Failed to fetch token balance: " << e.what());
      throw StartupError(std::string("cannot fetch token balance: ") + e.what());
    }

    _observedWindow = window;
    _observedBalance = balance;
    for (auto &lane : _lanes)
    {
      lane->saleWindow->submit(window, true);
      lane->balance->submit(balance, true);
    }
    _bootstrapped = true;
  }

  bool bootstrapped() const { return _bootstrapped; }

  /// \brief Decode and apply a notification. Malformed ones are logged and
  /// dropped.
  void onNotification(const net::Notification &notification)
  {
    ++_stats.notifications;
    DomainEvent event;
    try
    {
      event = decode(notification);
    }
    catch (const EventDecodeError &e)
    {
      ++_stats.rejectedNotifications;
      VAULTRELAY_LOG_ERROR("Rejected notification from " << notification.source << ": "
                                                         << e.what());
      return;
    }
    onEvent(event);
  }

  void onEvent(const DomainEvent &event)
  {
    if (!_bootstrapped)
    {
      VAULTRELAY_LOG_WARN("Event received before the initial sync");
    }
    if (auto *window = std::get_if<SaleWindowChanged>(&event))
    {
      ++_stats.saleWindowEvents;
      VAULTRELAY_LOG_INFO("SaleDateUpdated event: " << window->window);
      _observedWindow = window->window;
      for (auto &lane : _lanes)
      {
        lane->saleWindow->submit(window->window);
      }
    }
    else if (auto *balance = std::get_if<BalanceChanged>(&event))
    {
      ++_stats.balanceEvents;
      VAULTRELAY_LOG_INFO("TokenBalanceUpdated event: " << balance->balance);
      _observedBalance = balance->balance;
      for (auto &lane : _lanes)
      {
        lane->balance->submit(balance->balance);
      }
    }
    else if (auto *purchase = std::get_if<PurchaseObserved>(&event))
    {
      relayPurchase(*purchase);
    }
  }

  std::size_t targetCount() const { return _lanes.size(); }

  /// \throws std::out_of_range for an unknown target name
  const FieldSync<SaleWindow> &saleWindowSync(const std::string &target) const
  {
    return *lane(target).saleWindow;
  }

  /// \throws std::out_of_range for an unknown target name
  const FieldSync<Quantity> &balanceSync(const std::string &target) const
  {
    return *lane(target).balance;
  }

  const std::optional<SaleWindow> &observedSaleWindow() const { return _observedWindow; }
  const std::optional<Quantity> &observedBalance() const { return _observedBalance; }
  const OrchestratorStats &stats() const { return _stats; }

private:
  struct Lane
  {
    SyncTarget *target{nullptr};
    std::unique_ptr<FieldSync<SaleWindow>> saleWindow;
    std::unique_ptr<FieldSync<Quantity>> balance;
  };

  const Lane &lane(const std::string &target) const
  {
    for (const auto &l : _lanes)
    {
      if (l->saleWindow->target() == target)
      {
        return *l;
      }
    }
    throw std::out_of_range("unknown sync target: " + target);
  }

  void relayPurchase(const PurchaseObserved &event)
  {
    const Purchase &p = event.purchase;
    VAULTRELAY_LOG_INFO("Processing purchase from " << event.source << " for buyer " << p.buyer
                                                    << " with amount " << p.amount
                                                    << " and value " << p.value << " on chain "
                                                    << p.chainId);
    if (!p.amount.isPositive())
    {
      ++_stats.purchasesRejected;
      VAULTRELAY_LOG_ERROR("Rejected purchase for buyer " << p.buyer << ": amount " << p.amount
                                                          << " must be greater than 0");
      return;
    }
    if (_purchases == nullptr)
    {
      ++_stats.purchasesRejected;
      VAULTRELAY_LOG_WARN("No purchase handler configured, dropping purchase for " << p.buyer);
      return;
    }

    ++_stats.purchasesRelayed;
    std::string handler = _purchases->name();
    auto done = postedCompletion(_executor, _alive, [this, p, handler](const SyncOutcome &o) {
      if (o.ok)
      {
        ++_stats.purchasesConfirmed;
        VAULTRELAY_LOG_INFO("handlePurchase executed successfully on " << handler
                                                                       << " with hash: " << o.receipt);
        VAULTRELAY_LOG_INFO("Tokens sold to " << p.buyer << " for amount: " << p.amount);
      }
      else
      {
        ++_stats.purchasesFailed;
        VAULTRELAY_LOG_ERROR("Failed to handle token purchase for " << p.buyer << " on "
                                                                    << handler << ": " << o.error);
      }
    });
    try
    {
      _purchases->handlePurchase(p, done);
    }
    catch (const std::exception &e)
    {
      done(SyncOutcome::failed(e.what()));
    }
  }

  core::Executor &_executor;
  SnapshotSource &_source;
  PurchaseHandler *_purchases;
  std::shared_ptr<char> _alive;
  std::vector<std::unique_ptr<Lane>> _lanes;
  std::optional<SaleWindow> _observedWindow;
  std::optional<Quantity> _observedBalance;
  bool _bootstrapped{false};
  OrchestratorStats _stats;
};

} // namespace sync
} // namespace vaultrelay

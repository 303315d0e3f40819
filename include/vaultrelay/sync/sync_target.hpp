// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of VaultRelay, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <functional>
#include <string>
#include <utility>

#include <vaultrelay/sync/events.hpp>

namespace vaultrelay
{
namespace sync
{

/// \brief Result of one downstream call.
struct SyncOutcome
{
  bool ok{false};
  /// Opaque confirmation id (e.g. a transaction hash) when ok.
  std::string receipt;
  /// Failure description when not ok.
  std::string error;

  static SyncOutcome confirmed(std::string receipt) { return {true, std::move(receipt), {}}; }
  static SyncOutcome failed(std::string error) { return {false, {}, std::move(error)}; }
};

/// \brief Invoked exactly once per call, from any thread.
using SyncCompletion = std::function<void(SyncOutcome)>;

/// \brief A downstream system mirroring the sale window and token balance.
///
/// Calls return immediately and report through the completion. Throwing
/// from a call is treated as a failed outcome.
class SyncTarget
{
public:
  virtual ~SyncTarget() = default;

  virtual std::string name() const = 0;
  virtual void updateSaleWindow(const SaleWindow &window, SyncCompletion done) = 0;
  virtual void updateBalance(const Quantity &balance, SyncCompletion done) = 0;
};

/// \brief Receives relayed purchases.
class PurchaseHandler
{
public:
  virtual ~PurchaseHandler() = default;

  virtual std::string name() const = 0;
  virtual void handlePurchase(const Purchase &purchase, SyncCompletion done) = 0;
};

/// \brief The authoritative source read once at startup.
class SnapshotSource
{
public:
  virtual ~SnapshotSource() = default;

  /// \throws std::exception when the value cannot be fetched
  virtual SaleWindow fetchSaleWindow() = 0;
  /// \throws std::exception when the value cannot be fetched
  virtual Quantity fetchBalance() = 0;
};

} // namespace sync
} // namespace vaultrelay

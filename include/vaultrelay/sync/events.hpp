// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of VaultRelay, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <cctype>
#include <cstdint>
#include <ostream>
#include <stdexcept>
#include <string>
#include <variant>

#include <vaultrelay/net/transport.hpp>
#include <vaultrelay/sync/quantity.hpp>

namespace vaultrelay
{
namespace sync
{

namespace event_name
{
  constexpr const char *SaleDateUpdated = "SaleDateUpdated";
  constexpr const char *TokenBalanceUpdated = "TokenBalanceUpdated";
  constexpr const char *TokenPurchase = "TokenPurchase";
} // namespace event_name

/// \brief Sale start and end as unix timestamps.
struct SaleWindow
{
  std::uint64_t start{0};
  std::uint64_t end{0};
};

inline bool operator==(const SaleWindow &a, const SaleWindow &b)
{
  return a.start == b.start && a.end == b.end;
}

inline bool operator!=(const SaleWindow &a, const SaleWindow &b) { return !(a == b); }

inline std::ostream &operator<<(std::ostream &os, const SaleWindow &w)
{
  return os << '[' << w.start << ", " << w.end << ']';
}

struct Purchase
{
  std::string buyer;
  Quantity amount;
  Quantity value;
  std::string chainId;
};

struct SaleWindowChanged
{
  SaleWindow window;
};

struct BalanceChanged
{
  Quantity balance;
};

struct PurchaseObserved
{
  /// Emitting contract, e.g. the vault on a given chain.
  std::string source;
  Purchase purchase;
};

using DomainEvent = std::variant<SaleWindowChanged, BalanceChanged, PurchaseObserved>;

/// \brief A notification that is unknown or lacks a well-formed field.
class EventDecodeError : public std::runtime_error
{
public:
  using std::runtime_error::runtime_error;
};

namespace detail
{
  inline const std::string &requireField(const net::Notification &n, const std::string &field)
  {
    auto it = n.fields.find(field);
    if (it == n.fields.end() || it->second.empty())
    {
      throw EventDecodeError(n.name + ": missing field '" + field + "'");
    }
    return it->second;
  }

  inline std::uint64_t timestampField(const net::Notification &n, const std::string &field)
  {
    const std::string &text = requireField(n, field);
    for (char c : text)
    {
      if (!std::isdigit(static_cast<unsigned char>(c)))
      {
        throw EventDecodeError(n.name + ": field '" + field + "' is not a timestamp: " + text);
      }
    }
    try
    {
      return std::stoull(text);
    }
    catch (const std::out_of_range &)
    {
      throw EventDecodeError(n.name + ": field '" + field + "' is out of range: " + text);
    }
  }

  inline Quantity quantityField(const net::Notification &n, const std::string &field)
  {
    const std::string &text = requireField(n, field);
    try
    {
      return Quantity::parse(text);
    }
    catch (const std::invalid_argument &)
    {
      throw EventDecodeError(n.name + ": field '" + field + "' is not a number: " + text);
    }
  }
} // namespace detail

/// \brief Map a transport notification onto a domain event.
/// \throws EventDecodeError for unknown names and malformed fields
inline DomainEvent decode(const net::Notification &n)
{
  if (n.name == event_name::SaleDateUpdated)
  {
    return SaleWindowChanged{SaleWindow{detail::timestampField(n, "startSaleDate"),
                                        detail::timestampField(n, "endSaleDate")}};
  }
  if (n.name == event_name::TokenBalanceUpdated)
  {
    return BalanceChanged{detail::quantityField(n, "newBalance")};
  }
  if (n.name == event_name::TokenPurchase)
  {
    Purchase p;
    p.buyer = detail::requireField(n, "buyer");
    p.amount = detail::quantityField(n, "amount");
    p.value = detail::quantityField(n, "value");
    p.chainId = detail::requireField(n, "chainId");
    return PurchaseObserved{n.source, std::move(p)};
  }
  throw EventDecodeError("unknown notification '" + n.name + "'");
}

} // namespace sync
} // namespace vaultrelay

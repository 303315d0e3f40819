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

namespace vaultrelay
{
namespace sync
{

/// \brief Arbitrary-size signed integer held in canonical decimal form.
///
/// On-chain amounts and balances are 256-bit values that do not fit any
/// native type. VaultRelay only needs to compare and forward them, so they
/// are kept as normalised decimal text: no leading zeros, no "-0".
class Quantity
{
public:
  Quantity() : _digits("0") {}

  explicit Quantity(std::int64_t value)
      : _negative(value < 0),
        _digits(value < 0 ? std::to_string(value).substr(1) : std::to_string(value))
  {
  }

  /// \brief Parse an optionally signed run of decimal digits.
  /// \throws std::invalid_argument for anything else
  static Quantity parse(const std::string &text)
  {
    std::size_t pos = 0;
    bool negative = false;
    if (pos < text.size() && (text[pos] == '+' || text[pos] == '-'))
    {
      negative = text[pos] == '-';
      ++pos;
    }
    if (pos == text.size())
    {
      throw std::invalid_argument("not a quantity: '" + text + "'");
    }
    for (std::size_t i = pos; i < text.size(); ++i)
    {
      if (!std::isdigit(static_cast<unsigned char>(text[i])))
      {
        throw std::invalid_argument("not a quantity: '" + text + "'");
      }
    }
    std::size_t first = text.find_first_not_of('0', pos);
    Quantity q;
    if (first != std::string::npos)
    {
      q._digits = text.substr(first);
      q._negative = negative;
    }
    return q;
  }

  bool isZero() const { return _digits == "0"; }
  bool isNegative() const { return _negative; }
  bool isPositive() const { return !_negative && !isZero(); }

  std::string toString() const { return _negative ? "-" + _digits : _digits; }

  friend bool operator==(const Quantity &a, const Quantity &b)
  {
    return a._negative == b._negative && a._digits == b._digits;
  }

  friend bool operator!=(const Quantity &a, const Quantity &b) { return !(a == b); }

  friend bool operator<(const Quantity &a, const Quantity &b)
  {
    if (a._negative != b._negative)
    {
      return a._negative;
    }
    bool magnitudeLess = a._digits.size() != b._digits.size()
                           ? a._digits.size() < b._digits.size()
                           : a._digits < b._digits;
    bool magnitudeEqual = a._digits == b._digits;
    if (magnitudeEqual)
    {
      return false;
    }
    return a._negative ? !magnitudeLess : magnitudeLess;
  }

  friend std::ostream &operator<<(std::ostream &os, const Quantity &q)
  {
    return os << q.toString();
  }

private:
  bool _negative{false};
  std::string _digits;
};

} // namespace sync
} // namespace vaultrelay

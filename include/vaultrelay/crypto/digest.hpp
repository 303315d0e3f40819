// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of VaultRelay, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <array>
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>

#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/rand.h>

namespace vaultrelay
{
namespace crypto
{

/// \brief OpenSSL-backed helpers for receipt ids: SHA-256 digests and
/// random nonces.
class Digest
{
public:
  using Sha256 = std::array<std::uint8_t, 32>;

  /// \throws std::runtime_error if the digest cannot be computed
  static Sha256 sha256(const std::string &data)
  {
    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(),
                                                                &EVP_MD_CTX_free);
    if (!ctx)
    {
      throw std::runtime_error("Digest: EVP_MD_CTX_new failed: " + lastError());
    }
    Sha256 out{};
    unsigned int len = 0;
    if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1 ||
        EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1 ||
        EVP_DigestFinal_ex(ctx.get(), out.data(), &len) != 1 || len != out.size())
    {
      throw std::runtime_error("Digest: SHA-256 failed: " + lastError());
    }
    return out;
  }

  /// \brief `count` random bytes from RAND_bytes.
  /// \throws std::runtime_error if the generator fails
  static std::string randomBytes(std::size_t count)
  {
    std::string bytes(count, '\0');
    if (count > 0 &&
        RAND_bytes(reinterpret_cast<unsigned char *>(&bytes[0]), static_cast<int>(count)) != 1)
    {
      throw std::runtime_error("Digest: RAND_bytes failed: " + lastError());
    }
    return bytes;
  }

  template <typename Bytes> static std::string toHex(const Bytes &bytes)
  {
    static const char digits[] = "0123456789abcdef";
    std::string hex;
    hex.reserve(bytes.size() * 2);
    for (auto b : bytes)
    {
      auto v = static_cast<std::uint8_t>(b);
      hex += digits[v >> 4];
      hex += digits[v & 0x0f];
    }
    return hex;
  }

  /// \brief "0x" + hex(SHA-256(payload || 16 random bytes)). Unique per
  /// call, shaped like a transaction hash.
  static std::string receiptFor(const std::string &payload)
  {
    return "0x" + toHex(sha256(payload + randomBytes(16)));
  }

private:
  static std::string lastError()
  {
    unsigned long code = ERR_peek_last_error(); // NOLINT(google-runtime-int)
    if (code == 0UL)
    {
      return "no OpenSSL error available";
    }
    char buf[256] = {0};
    ERR_error_string_n(code, buf, sizeof(buf));
    return std::string(buf);
  }
};

} // namespace crypto
} // namespace vaultrelay

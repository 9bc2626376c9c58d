// Copyright (c) 2025 Omnilink Authors
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Omnilink, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <array>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/rand.h>
#include <openssl/sha.h>

namespace omnilink
{
namespace crypto
{

/// \brief OpenSSL-backed random bytes and digests used for call ids, request
/// signatures and the WebSocket handshake.
class SecureRng
{
public:
  /// \brief Fill a buffer with cryptographically secure random bytes.
  /// \throws std::runtime_error if RAND_bytes fails
  static void fill(std::uint8_t *dst, std::size_t len)
  {
    if (len == 0)
    {
      return;
    }
    if (RAND_bytes(dst, static_cast<int>(len)) != 1)
    {
      throw std::runtime_error("SecureRng: RAND_bytes failed: " + lastError());
    }
  }

  template <typename Container> static void fill(Container &c)
  {
    static_assert(sizeof(typename Container::value_type) == 1, "byte container required");
    fill(reinterpret_cast<std::uint8_t *>(c.data()), c.size());
  }

  /// \brief Returns \p bytes random bytes as 2*bytes lower-case hex chars.
  static std::string randomHex(std::size_t bytes)
  {
    std::vector<std::uint8_t> buf(bytes);
    fill(buf);
    return toHex(buf.data(), buf.size());
  }

  /// \brief HMAC-SHA256 of \p data keyed with \p key.
  /// \throws std::invalid_argument if key is empty
  /// \throws std::runtime_error if HMAC computation fails
  static std::array<std::uint8_t, 32> hmacSha256(const std::string &key, const std::string &data)
  {
    if (key.empty())
    {
      throw std::invalid_argument("SecureRng/hmacSha256: key cannot be empty");
    }

    std::array<std::uint8_t, 32> out{};
    unsigned int len = 0;
    unsigned char *result =
      HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()),
           reinterpret_cast<const unsigned char *>(data.data()), data.size(), out.data(), &len);
    if (result == nullptr || len != 32U)
    {
      throw std::runtime_error("SecureRng/hmacSha256: HMAC failed: " + lastError());
    }
    return out;
  }

  /// \brief Hex-encoded HMAC-SHA256.
  static std::string hmacSha256Hex(const std::string &key, const std::string &data)
  {
    auto mac = hmacSha256(key, data);
    return toHex(mac.data(), mac.size());
  }

  /// \brief SHA-1 digest (WebSocket accept key only).
  static std::array<std::uint8_t, 20> sha1(const std::string &data)
  {
    std::array<std::uint8_t, 20> out{};
    EVP_MD_CTX *ctx = EVP_MD_CTX_new();
    if (!ctx)
    {
      throw std::runtime_error("SecureRng/sha1: EVP_MD_CTX_new failed");
    }
    int ok = EVP_DigestInit_ex(ctx, EVP_sha1(), nullptr);
    ok &= EVP_DigestUpdate(ctx, data.data(), data.size());
    unsigned int len = 0;
    ok &= EVP_DigestFinal_ex(ctx, out.data(), &len);
    EVP_MD_CTX_free(ctx);
    if (!ok || len != 20U)
    {
      throw std::runtime_error("SecureRng/sha1: EVP_Digest (SHA-1) failed");
    }
    return out;
  }

  /// \brief Standard (padded) base64.
  static std::string base64(const std::uint8_t *data, std::size_t len)
  {
    if (len == 0)
    {
      return {};
    }
    std::string out(4 * ((len + 2) / 3), '\0');
    int written = EVP_EncodeBlock(reinterpret_cast<unsigned char *>(&out[0]), data,
                                  static_cast<int>(len));
    if (written < 0)
    {
      throw std::runtime_error("SecureRng/base64: EVP_EncodeBlock failed");
    }
    out.resize(static_cast<std::size_t>(written));
    return out;
  }

  static std::string toHex(const std::uint8_t *data, std::size_t len)
  {
    static constexpr char kDigits[] = "0123456789abcdef";
    std::string s;
    s.reserve(len * 2);
    for (std::size_t i = 0; i < len; ++i)
    {
      s.push_back(kDigits[data[i] >> 4]);
      s.push_back(kDigits[data[i] & 0x0F]);
    }
    return s;
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
} // namespace omnilink

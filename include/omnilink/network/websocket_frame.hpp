// Copyright (c) 2025 Omnilink Authors
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Omnilink, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>

#include "omnilink/crypto/secure_rng.hpp"

namespace omnilink
{
namespace network
{

// RFC 6455 frame layout:
//   byte 0: FIN(1) RSV(3) OPCODE(4)
//   byte 1: MASK(1) LEN(7); LEN 126 -> 16-bit length, 127 -> 64-bit length
//   optional 4-byte masking key, then payload.
// Client frames are always masked; server frames never are.

enum class WsOpcode : std::uint8_t
{
  Continuation = 0x0,
  Text = 0x1,
  Binary = 0x2,
  Close = 0x8,
  Ping = 0x9,
  Pong = 0xA
};

inline bool isControl(WsOpcode op) { return (static_cast<std::uint8_t>(op) & 0x8) != 0; }

struct WsFrame
{
  bool fin{true};
  WsOpcode opcode{WsOpcode::Text};
  std::string payload;
};

/// \brief Frame encoder.
class WebSocketFrameCodec
{
public:
  using MaskKey = std::array<std::uint8_t, 4>;

  /// \brief Encode a masked client frame with a random masking key.
  static std::string encodeClient(WsOpcode op, const std::string &payload, bool fin = true)
  {
    MaskKey key{};
    crypto::SecureRng::fill(key);
    return encode(op, payload, fin, &key);
  }

  /// \brief Encode a frame; \p mask is null for an unmasked (server) frame.
  static std::string encode(WsOpcode op, const std::string &payload, bool fin, const MaskKey *mask)
  {
    std::string out;
    const std::uint64_t len = payload.size();
    out.reserve(payload.size() + 14);
    out.push_back(static_cast<char>((fin ? 0x80 : 0x00) | static_cast<std::uint8_t>(op)));

    const std::uint8_t maskBit = mask ? 0x80 : 0x00;
    if (len < 126)
    {
      out.push_back(static_cast<char>(maskBit | static_cast<std::uint8_t>(len)));
    }
    else if (len <= 0xFFFF)
    {
      out.push_back(static_cast<char>(maskBit | 126));
      out.push_back(static_cast<char>((len >> 8) & 0xFF));
      out.push_back(static_cast<char>(len & 0xFF));
    }
    else
    {
      out.push_back(static_cast<char>(maskBit | 127));
      for (int shift = 56; shift >= 0; shift -= 8)
      {
        out.push_back(static_cast<char>((len >> shift) & 0xFF));
      }
    }

    if (!mask)
    {
      out += payload;
      return out;
    }

    for (auto b : *mask)
    {
      out.push_back(static_cast<char>(b));
    }
    for (std::size_t i = 0; i < payload.size(); ++i)
    {
      out.push_back(static_cast<char>(static_cast<std::uint8_t>(payload[i]) ^ (*mask)[i % 4]));
    }
    return out;
  }

  /// \brief Close frame payload: 2-byte status code plus optional reason.
  static std::string closePayload(std::uint16_t status, const std::string &reason = "")
  {
    std::string p;
    p.push_back(static_cast<char>((status >> 8) & 0xFF));
    p.push_back(static_cast<char>(status & 0xFF));
    p += reason;
    return p;
  }
};

/// \brief Incremental frame decoder. Feed raw bytes as they arrive and pull
/// complete frames with next().
class WebSocketFrameDecoder
{
public:
  enum class Status
  {
    NeedMore,
    Frame,
    Error
  };

  explicit WebSocketFrameDecoder(std::size_t maxPayload = 16 * 1024 * 1024) : _maxPayload(maxPayload)
  {
  }

  void feed(const char *data, std::size_t len) { _buffer.append(data, len); }
  void feed(const std::string &data) { _buffer += data; }

  /// \brief Extract the next complete frame into \p out.
  Status next(WsFrame &out)
  {
    if (!_error.empty())
    {
      return Status::Error;
    }
    const std::size_t avail = _buffer.size() - _pos;
    if (avail < 2)
    {
      compact();
      return Status::NeedMore;
    }

    const auto *h = reinterpret_cast<const std::uint8_t *>(_buffer.data() + _pos);
    if ((h[0] & 0x70) != 0)
    {
      return fail("reserved bits set without a negotiated extension");
    }
    const auto op = static_cast<WsOpcode>(h[0] & 0x0F);
    switch (op)
    {
    case WsOpcode::Continuation:
    case WsOpcode::Text:
    case WsOpcode::Binary:
    case WsOpcode::Close:
    case WsOpcode::Ping:
    case WsOpcode::Pong:
      break;
    default:
      return fail("unknown opcode " + std::to_string(h[0] & 0x0F));
    }
    const bool fin = (h[0] & 0x80) != 0;
    const bool masked = (h[1] & 0x80) != 0;
    const std::uint8_t lenField = h[1] & 0x7F;

    std::size_t headerLen = 2;
    if (lenField == 126)
    {
      headerLen += 2;
    }
    else if (lenField == 127)
    {
      headerLen += 8;
    }
    if (masked)
    {
      headerLen += 4;
    }
    if (avail < headerLen)
    {
      compact();
      return Status::NeedMore;
    }

    std::uint64_t payloadLen = lenField;
    std::size_t offset = 2;
    if (lenField == 126)
    {
      payloadLen = (static_cast<std::uint64_t>(h[2]) << 8) | h[3];
      offset = 4;
    }
    else if (lenField == 127)
    {
      payloadLen = 0;
      for (int i = 0; i < 8; ++i)
      {
        payloadLen = (payloadLen << 8) | h[2 + i];
      }
      offset = 10;
    }

    if (isControl(op) && (!fin || payloadLen > 125))
    {
      return fail("invalid control frame");
    }
    if (payloadLen > _maxPayload)
    {
      _tooLarge = true;
      return fail("frame payload of " + std::to_string(payloadLen) + " bytes exceeds limit");
    }
    if (avail - headerLen < payloadLen)
    {
      compact();
      return Status::NeedMore;
    }

    out.fin = fin;
    out.opcode = op;
    out.payload.assign(_buffer, _pos + headerLen, static_cast<std::size_t>(payloadLen));
    if (masked)
    {
      const std::uint8_t *key = h + offset;
      for (std::size_t i = 0; i < out.payload.size(); ++i)
      {
        out.payload[i] = static_cast<char>(static_cast<std::uint8_t>(out.payload[i]) ^ key[i % 4]);
      }
    }
    _pos += headerLen + static_cast<std::size_t>(payloadLen);
    return Status::Frame;
  }

  const std::string &error() const { return _error; }
  bool tooLarge() const { return _tooLarge; }
  std::size_t buffered() const { return _buffer.size() - _pos; }

private:
  Status fail(const std::string &why)
  {
    _error = why;
    return Status::Error;
  }

  void compact()
  {
    if (_pos > 0)
    {
      _buffer.erase(0, _pos);
      _pos = 0;
    }
  }

  std::size_t _maxPayload;
  std::string _buffer;
  std::size_t _pos{0};
  std::string _error;
  bool _tooLarge{false};
};

/// \brief Reassembles fragmented data frames into whole messages.
class WebSocketMessageAssembler
{
public:
  enum class Result
  {
    Incomplete,
    Complete,
    Error,
    TooLarge
  };

  explicit WebSocketMessageAssembler(std::size_t maxMessageSize = 16 * 1024 * 1024)
    : _maxMessageSize(maxMessageSize)
  {
  }

  /// \brief Add one data frame. On Complete, \p message holds the whole
  /// message and \p opcode its type (Text or Binary).
  Result add(WsFrame frame, std::string &message, WsOpcode &opcode, std::string &error)
  {
    if (frame.opcode == WsOpcode::Continuation)
    {
      if (!_inProgress)
      {
        error = "continuation frame without a message in progress";
        return Result::Error;
      }
    }
    else
    {
      if (_inProgress)
      {
        error = "new data frame while a fragmented message is in progress";
        return Result::Error;
      }
      _inProgress = true;
      _opcode = frame.opcode;
      _partial.clear();
    }

    if (_partial.size() + frame.payload.size() > _maxMessageSize)
    {
      _inProgress = false;
      _partial.clear();
      error = "message exceeds " + std::to_string(_maxMessageSize) + " bytes";
      return Result::TooLarge;
    }
    _partial += frame.payload;

    if (!frame.fin)
    {
      return Result::Incomplete;
    }
    _inProgress = false;
    message.swap(_partial);
    _partial.clear();
    opcode = _opcode;
    return Result::Complete;
  }

private:
  std::size_t _maxMessageSize;
  bool _inProgress{false};
  WsOpcode _opcode{WsOpcode::Text};
  std::string _partial;
};

} // namespace network
} // namespace omnilink

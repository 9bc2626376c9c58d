// Copyright (c) 2025 Omnilink Authors
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Omnilink, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <thread>

#include "omnilink/core/logger.hpp"
#include "omnilink/network/stream_socket.hpp"
#include "omnilink/network/transport.hpp"
#include "omnilink/network/url.hpp"
#include "omnilink/network/websocket_frame.hpp"
#include "omnilink/network/websocket_handshake.hpp"

namespace omnilink
{
namespace network
{

/// \brief RFC 6455 client transport over TCP, or TLS for wss://.
///
/// Each instance serves a single open(). A dedicated reader thread performs
/// connect, handshake and frame processing and delivers every callback;
/// onClose is its last act. send() and close() may be called from any thread.
class WebSocketTransport : public ITransport
{
public:
  struct Options
  {
    TlsConfig tls;
    std::size_t maxMessageSize{16 * 1024 * 1024};
    std::chrono::milliseconds connectTimeout{10000};
    std::chrono::milliseconds pollInterval{100};
    std::size_t maxHandshakeSize{16 * 1024};
  };

  WebSocketTransport() : WebSocketTransport(Options{}) {}

  explicit WebSocketTransport(Options options) : _session(std::make_shared<Session>(std::move(options)))
  {
  }

  ~WebSocketTransport() override
  {
    close();
    if (_thread.joinable())
    {
      if (_thread.get_id() == std::this_thread::get_id())
      {
        _thread.detach();
      }
      else
      {
        _thread.join();
      }
    }
  }

  WebSocketTransport(const WebSocketTransport &) = delete;
  WebSocketTransport &operator=(const WebSocketTransport &) = delete;

  void open(const std::string &uri, TransportCallbacks callbacks) override
  {
    if (_started.exchange(true))
    {
      OMNILINK_LOG_WARN("WebSocketTransport: open() called twice, ignoring " << uri);
      return;
    }
    _session->callbacks = std::move(callbacks);
    auto session = _session;
    _thread = std::thread([session, uri]() { run(session, uri); });
  }

  IoResult send(const std::string &text) override
  {
    if (!_session->open.load() || _session->closing.load())
    {
      return IoResult::failure(TransportError::NotOpen, "websocket is not open");
    }
    return _session->socket.writeAll(WebSocketFrameCodec::encodeClient(WsOpcode::Text, text));
  }

  void close() override
  {
    if (_session->closing.exchange(true))
    {
      return;
    }
    if (_session->open.load())
    {
      sendClose(*_session, 1000);
    }
    _session->socket.shutdown();
  }

private:
  struct Session
  {
    explicit Session(Options o) : options(std::move(o)) {}

    Options options;
    StreamSocket socket;
    TransportCallbacks callbacks;
    std::atomic<bool> open{false};
    std::atomic<bool> closing{false};
    std::atomic<bool> closeSent{false};
    std::string pendingInput;
  };

  static void run(const std::shared_ptr<Session> &s, const std::string &uri)
  {
    IoResult reason = establish(*s, uri);
    if (reason.ok)
    {
      s->open.store(true);
      OMNILINK_LOG_DEBUG("WebSocketTransport: open " << uri);
      if (s->callbacks.onOpen)
      {
        s->callbacks.onOpen();
      }
      reason = readLoop(*s);
    }

    s->open.store(false);
    if (s->closing.load() && (reason.ok || reason.code == TransportError::PeerClosed ||
                              reason.code == TransportError::Socket))
    {
      reason = IoResult::failure(TransportError::Cancelled, "closed locally");
    }
    s->socket.close();
    OMNILINK_LOG_DEBUG("WebSocketTransport: closed " << uri << ": " << reason.describe());
    if (s->callbacks.onClose)
    {
      s->callbacks.onClose(reason);
    }
  }

  static IoResult establish(Session &s, const std::string &uri)
  {
    auto url = Url::parse(uri);
    if (!url || !url->isWebSocket())
    {
      return IoResult::failure(TransportError::Config, "not a ws:// or wss:// URI: " + uri);
    }
    if (s.closing.load())
    {
      return IoResult::failure(TransportError::Cancelled, "closed before connect");
    }

    auto r = s.socket.connect(*url, s.options.tls, s.options.connectTimeout);
    if (!r.ok)
    {
      return r;
    }
    if (s.closing.load())
    {
      return IoResult::failure(TransportError::Cancelled, "closed during connect");
    }

    const std::string key = WebSocketHandshake::generateKey();
    r = s.socket.writeAll(WebSocketHandshake::buildRequest(*url, key), s.options.connectTimeout);
    if (!r.ok)
    {
      return r;
    }

    const auto deadline = std::chrono::steady_clock::now() + s.options.connectTimeout;
    std::string buf;
    std::size_t headEnd = std::string::npos;
    while ((headEnd = buf.find("\r\n\r\n")) == std::string::npos)
    {
      if (s.closing.load())
      {
        return IoResult::failure(TransportError::Cancelled, "closed during handshake");
      }
      if (std::chrono::steady_clock::now() >= deadline)
      {
        return IoResult::failure(TransportError::Timeout, "handshake timed out");
      }
      if (buf.size() > s.options.maxHandshakeSize)
      {
        return IoResult::failure(TransportError::Handshake, "handshake response too large");
      }
      r = s.socket.readSome(buf, s.options.pollInterval);
      if (!r.ok)
      {
        return r;
      }
    }

    r = WebSocketHandshake::validateResponse(buf.substr(0, headEnd), key);
    if (!r.ok)
    {
      return r;
    }
    s.pendingInput = buf.substr(headEnd + 4);
    return IoResult::success();
  }

  static IoResult readLoop(Session &s)
  {
    WebSocketFrameDecoder decoder(s.options.maxMessageSize);
    WebSocketMessageAssembler assembler(s.options.maxMessageSize);
    decoder.feed(s.pendingInput);
    s.pendingInput.clear();

    std::string chunk;
    while (true)
    {
      WsFrame frame;
      auto status = decoder.next(frame);
      if (status == WebSocketFrameDecoder::Status::Error)
      {
        const bool tooLarge = decoder.tooLarge();
        sendClose(s, tooLarge ? 1009 : 1002);
        return IoResult::failure(tooLarge ? TransportError::MessageTooLarge : TransportError::Protocol,
                                 decoder.error());
      }
      if (status == WebSocketFrameDecoder::Status::Frame)
      {
        auto r = handleFrame(s, assembler, std::move(frame));
        if (!r.ok)
        {
          return r;
        }
        continue;
      }

      if (s.closing.load())
      {
        return IoResult::success();
      }
      chunk.clear();
      auto r = s.socket.readSome(chunk, s.options.pollInterval);
      if (!r.ok)
      {
        return r;
      }
      decoder.feed(chunk);
    }
  }

  static IoResult handleFrame(Session &s, WebSocketMessageAssembler &assembler, WsFrame frame)
  {
    switch (frame.opcode)
    {
    case WsOpcode::Ping:
    {
      auto r = s.socket.writeAll(WebSocketFrameCodec::encodeClient(WsOpcode::Pong, frame.payload));
      if (!r.ok)
      {
        return r;
      }
      return IoResult::success();
    }
    case WsOpcode::Pong:
      return IoResult::success();
    case WsOpcode::Close:
    {
      std::uint16_t status = 1005;
      if (frame.payload.size() >= 2)
      {
        status = static_cast<std::uint16_t>((static_cast<std::uint8_t>(frame.payload[0]) << 8) |
                                            static_cast<std::uint8_t>(frame.payload[1]));
      }
      sendClose(s, status == 1005 ? 1000 : status);
      return IoResult::failure(TransportError::PeerClosed,
                               "close frame from peer (" + std::to_string(status) + ")");
    }
    default:
      break;
    }

    std::string message;
    WsOpcode opcode = WsOpcode::Text;
    std::string error;
    auto result = assembler.add(std::move(frame), message, opcode, error);
    if (result == WebSocketMessageAssembler::Result::Error ||
        result == WebSocketMessageAssembler::Result::TooLarge)
    {
      const bool tooLarge = result == WebSocketMessageAssembler::Result::TooLarge;
      sendClose(s, tooLarge ? 1009 : 1002);
      return IoResult::failure(tooLarge ? TransportError::MessageTooLarge : TransportError::Protocol,
                               error);
    }
    if (result == WebSocketMessageAssembler::Result::Complete)
    {
      if (opcode != WsOpcode::Text)
      {
        OMNILINK_LOG_WARN("WebSocketTransport: discarding " << message.size()
                                                            << " byte binary message");
      }
      else if (s.callbacks.onMessage)
      {
        s.callbacks.onMessage(message);
      }
    }
    return IoResult::success();
  }

  static void sendClose(Session &s, std::uint16_t status)
  {
    if (s.closeSent.exchange(true))
    {
      return;
    }
    auto r = s.socket.writeAll(
      WebSocketFrameCodec::encodeClient(WsOpcode::Close, WebSocketFrameCodec::closePayload(status)),
      std::chrono::milliseconds(500));
    if (!r.ok)
    {
      OMNILINK_LOG_DEBUG("WebSocketTransport: close frame not sent: " << r.describe());
    }
  }

  std::shared_ptr<Session> _session;
  std::atomic<bool> _started{false};
  std::thread _thread;
};

} // namespace network
} // namespace omnilink

// Copyright (c) 2025 Omnilink Authors
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Omnilink, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <arpa/inet.h>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <mutex>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <string>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

#include <openssl/err.h>
#include <openssl/ssl.h>
#include <openssl/x509v3.h>

#include "omnilink/core/logger.hpp"
#include "omnilink/network/transport.hpp"
#include "omnilink/network/url.hpp"

namespace omnilink
{
namespace network
{

/// \brief TLS settings for outbound connections.
struct TlsConfig
{
  bool verifyPeer{true};
  std::string caFile;
};

/// \brief One outbound TCP connection, optionally wrapped in TLS.
///
/// The socket stays non-blocking after connect. readSome() and writeAll() may
/// be called from different threads; both take the I/O mutex around the
/// actual read/write so that a TLS session is never used concurrently.
/// shutdown() may be called from any thread to wake a blocked reader.
class StreamSocket
{
public:
  StreamSocket() = default;
  ~StreamSocket() { close(); }

  StreamSocket(const StreamSocket &) = delete;
  StreamSocket &operator=(const StreamSocket &) = delete;

  /// \brief Resolve, connect and (for wss/https) complete the TLS handshake
  /// within \p timeout.
  IoResult connect(const Url &url, const TlsConfig &tls, std::chrono::milliseconds timeout)
  {
    ignoreSigpipe();
    const auto deadline = std::chrono::steady_clock::now() + timeout;

    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_protocol = IPPROTO_TCP;
    addrinfo *res = nullptr;
    std::string ps = std::to_string(url.port);
    int rc = ::getaddrinfo(url.host.c_str(), ps.c_str(), &hints, &res);
    if (rc != 0 || !res)
    {
      return IoResult::failure(TransportError::Resolve,
                               std::string("getaddrinfo(") + url.host + "): " + gai_strerror(rc));
    }

    IoResult last = IoResult::failure(TransportError::Connect, "no usable address for " + url.host);
    for (addrinfo *ai = res; ai; ai = ai->ai_next)
    {
      int fd = ::socket(ai->ai_family, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0);
      if (fd < 0)
      {
        last = IoResult::failure(TransportError::Socket, "socket() failed", errno);
        continue;
      }
      int one = 1;
      (void)::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));

      last = connectOne(fd, ai, deadline);
      if (last.ok)
      {
        std::lock_guard<std::mutex> lock(_ioMutex);
        _fd = fd;
        break;
      }
      ::close(fd);
    }
    ::freeaddrinfo(res);
    if (!last.ok)
    {
      return last;
    }

    if (url.secure())
    {
      auto r = startTls(url.host, tls, deadline);
      if (!r.ok)
      {
        close();
        return r;
      }
    }
    OMNILINK_LOG_DEBUG("StreamSocket: connected to " << url.host << ":" << url.port
                                                     << (url.secure() ? " (tls)" : ""));
    return IoResult::success();
  }

  /// \brief Write all of \p data, waiting for the socket to drain when
  /// necessary.
  IoResult writeAll(const std::string &data, std::chrono::milliseconds timeout = std::chrono::seconds(10))
  {
    std::lock_guard<std::mutex> lock(_ioMutex);
    if (_fd < 0)
    {
      return IoResult::failure(TransportError::NotOpen, "socket not connected");
    }
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    std::size_t off = 0;
    while (off < data.size())
    {
      int want = 0;
      if (_ssl)
      {
        ERR_clear_error();
        int n = ::SSL_write(_ssl, data.data() + off, static_cast<int>(data.size() - off));
        if (n > 0)
        {
          off += static_cast<std::size_t>(n);
          continue;
        }
        int ge = ::SSL_get_error(_ssl, n);
        if (ge == SSL_ERROR_WANT_WRITE)
        {
          want = POLLOUT;
        }
        else if (ge == SSL_ERROR_WANT_READ)
        {
          want = POLLIN;
        }
        else
        {
          return IoResult::failure(TransportError::TLSIO, "SSL_write failed: " + sslError(), errno, ge);
        }
      }
      else
      {
        ssize_t n = ::send(_fd, data.data() + off, data.size() - off, MSG_NOSIGNAL);
        if (n > 0)
        {
          off += static_cast<std::size_t>(n);
          continue;
        }
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR))
        {
          want = POLLOUT;
        }
        else
        {
          return IoResult::failure(TransportError::Socket, "send failed: " + errnoText(errno), errno);
        }
      }
      if (!waitFor(want, deadline))
      {
        return IoResult::failure(TransportError::Timeout, "write timed out");
      }
    }
    return IoResult::success();
  }

  /// \brief Wait up to \p wait for data and append what is available to
  /// \p out. A timeout is reported as success with nothing appended; an
  /// orderly peer close as TransportError::PeerClosed.
  IoResult readSome(std::string &out, std::chrono::milliseconds wait)
  {
    bool pending = false;
    {
      std::lock_guard<std::mutex> lock(_ioMutex);
      if (_fd < 0)
      {
        return IoResult::failure(TransportError::NotOpen, "socket not connected");
      }
      pending = _ssl && ::SSL_pending(_ssl) > 0;
    }
    if (!pending)
    {
      pollfd p{_fd, POLLIN, 0};
      int pr = ::poll(&p, 1, static_cast<int>(wait.count()));
      if (pr == 0 || (pr < 0 && errno == EINTR))
      {
        return IoResult::success();
      }
      if (pr < 0)
      {
        return IoResult::failure(TransportError::Socket, "poll failed: " + errnoText(errno), errno);
      }
    }

    std::lock_guard<std::mutex> lock(_ioMutex);
    char buf[16384];
    if (_ssl)
    {
      ERR_clear_error();
      int n = ::SSL_read(_ssl, buf, static_cast<int>(sizeof(buf)));
      if (n > 0)
      {
        out.append(buf, static_cast<std::size_t>(n));
        return IoResult::success();
      }
      int ge = ::SSL_get_error(_ssl, n);
      if (ge == SSL_ERROR_WANT_READ || ge == SSL_ERROR_WANT_WRITE)
      {
        return IoResult::success();
      }
      if (ge == SSL_ERROR_ZERO_RETURN)
      {
        return IoResult::failure(TransportError::PeerClosed, "TLS close_notify from peer");
      }
      if (ge == SSL_ERROR_SYSCALL && errno == 0)
      {
        return IoResult::failure(TransportError::PeerClosed, "peer closed connection");
      }
      return IoResult::failure(TransportError::TLSIO, "SSL_read failed: " + sslError(), errno, ge);
    }

    ssize_t n = ::recv(_fd, buf, sizeof(buf), 0);
    if (n > 0)
    {
      out.append(buf, static_cast<std::size_t>(n));
      return IoResult::success();
    }
    if (n == 0)
    {
      return IoResult::failure(TransportError::PeerClosed, "peer closed connection");
    }
    if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR)
    {
      return IoResult::success();
    }
    return IoResult::failure(TransportError::Socket, "recv failed: " + errnoText(errno), errno);
  }

  /// \brief Half-close both directions so a reader blocked in poll wakes up.
  void shutdown()
  {
    std::lock_guard<std::mutex> lock(_ioMutex);
    if (_fd >= 0)
    {
      ::shutdown(_fd, SHUT_RDWR);
    }
  }

  void close()
  {
    std::lock_guard<std::mutex> lock(_ioMutex);
    if (_ssl)
    {
      ::SSL_free(_ssl);
      _ssl = nullptr;
    }
    if (_ctx)
    {
      ::SSL_CTX_free(_ctx);
      _ctx = nullptr;
    }
    if (_fd >= 0)
    {
      ::close(_fd);
      _fd = -1;
    }
  }

  bool isOpen() const
  {
    std::lock_guard<std::mutex> lock(_ioMutex);
    return _fd >= 0;
  }

private:
  static void ignoreSigpipe()
  {
    static std::once_flag once;
    std::call_once(once, []() { std::signal(SIGPIPE, SIG_IGN); });
  }

  static std::string errnoText(int e) { return std::strerror(e); }

  static std::string sslError()
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

  static int remainingMs(std::chrono::steady_clock::time_point deadline)
  {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline -
                                                                      std::chrono::steady_clock::now());
    return left.count() > 0 ? static_cast<int>(left.count()) : 0;
  }

  bool waitFor(int events, std::chrono::steady_clock::time_point deadline) const
  {
    while (true)
    {
      int ms = remainingMs(deadline);
      if (ms == 0)
      {
        return false;
      }
      pollfd p{_fd, static_cast<short>(events), 0};
      int pr = ::poll(&p, 1, ms);
      if (pr > 0)
      {
        return true;
      }
      if (pr == 0 || errno != EINTR)
      {
        return false;
      }
    }
  }

  static IoResult connectOne(int fd, const addrinfo *ai, std::chrono::steady_clock::time_point deadline)
  {
    int rc = ::connect(fd, ai->ai_addr, ai->ai_addrlen);
    if (rc == 0)
    {
      return IoResult::success();
    }
    if (errno != EINPROGRESS)
    {
      return IoResult::failure(TransportError::Connect, "connect failed: " + errnoText(errno), errno);
    }

    pollfd p{fd, POLLOUT, 0};
    int pr;
    do
    {
      pr = ::poll(&p, 1, remainingMs(deadline));
    } while (pr < 0 && errno == EINTR);
    if (pr == 0)
    {
      return IoResult::failure(TransportError::Timeout, "connect timed out");
    }
    if (pr < 0)
    {
      return IoResult::failure(TransportError::Connect, "poll failed: " + errnoText(errno), errno);
    }

    int err = 0;
    socklen_t el = sizeof(err);
    if (::getsockopt(fd, SOL_SOCKET, SO_ERROR, &err, &el) != 0)
    {
      err = errno;
    }
    if (err != 0)
    {
      return IoResult::failure(TransportError::Connect, "connect failed: " + errnoText(err), err);
    }
    return IoResult::success();
  }

  IoResult startTls(const std::string &host, const TlsConfig &tls,
                    std::chrono::steady_clock::time_point deadline)
  {
    std::lock_guard<std::mutex> lock(_ioMutex);
    _ctx = ::SSL_CTX_new(TLS_client_method());
    if (!_ctx)
    {
      return IoResult::failure(TransportError::Config, "SSL_CTX_new(client) failed");
    }
    if (tls.verifyPeer)
    {
      ::SSL_CTX_set_verify(_ctx, SSL_VERIFY_PEER, nullptr);
      if (!tls.caFile.empty())
      {
        if (::SSL_CTX_load_verify_locations(_ctx, tls.caFile.c_str(), nullptr) != 1)
        {
          return IoResult::failure(TransportError::Config, "client load CA failed: " + tls.caFile);
        }
      }
      else
      {
        ::SSL_CTX_set_default_verify_paths(_ctx);
      }
    }

    _ssl = ::SSL_new(_ctx);
    if (!_ssl)
    {
      return IoResult::failure(TransportError::Config, "SSL_new failed");
    }
    ::SSL_set_fd(_ssl, _fd);
    ::SSL_set_tlsext_host_name(_ssl, host.c_str());
    if (tls.verifyPeer)
    {
      ::SSL_set1_host(_ssl, host.c_str());
    }

    while (true)
    {
      ERR_clear_error();
      int rc = ::SSL_connect(_ssl);
      if (rc == 1)
      {
        return IoResult::success();
      }
      int ge = ::SSL_get_error(_ssl, rc);
      int want = 0;
      if (ge == SSL_ERROR_WANT_READ)
      {
        want = POLLIN;
      }
      else if (ge == SSL_ERROR_WANT_WRITE)
      {
        want = POLLOUT;
      }
      else
      {
        return IoResult::failure(TransportError::TLSHandshake, "SSL_connect failed: " + sslError(),
                                 errno, ge);
      }
      if (!waitFor(want, deadline))
      {
        return IoResult::failure(TransportError::Timeout, "TLS handshake timed out");
      }
    }
  }

  mutable std::mutex _ioMutex;
  int _fd{-1};
  SSL_CTX *_ctx{nullptr};
  SSL *_ssl{nullptr};
};

} // namespace network
} // namespace omnilink

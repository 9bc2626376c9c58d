// Copyright (c) 2025 Omnilink Authors
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Omnilink, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#define CATCH_CONFIG_MAIN
#include "test_helpers.hpp"
#include <catch2/catch.hpp>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cstdio>
#include <future>
#include <thread>

using namespace std::chrono_literals;
using omnilink::client::BroadcastRoute;
using omnilink::client::Client;
using omnilink::core::Json;
using omnilink::test::MockNetwork;

namespace
{
/// \brief One-shot HTTP server on 127.0.0.1 that answers a single request
/// with a canned response and hands the raw request back.
class OneShotHttpServer
{
public:
  explicit OneShotHttpServer(std::string response) : _response(std::move(response))
  {
    _fd = ::socket(AF_INET, SOCK_STREAM, 0);
    REQUIRE(_fd >= 0);
    int one = 1;
    ::setsockopt(_fd, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = 0;
    REQUIRE(::bind(_fd, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) == 0);
    REQUIRE(::listen(_fd, 1) == 0);
    socklen_t len = sizeof(addr);
    REQUIRE(::getsockname(_fd, reinterpret_cast<sockaddr *>(&addr), &len) == 0);
    _port = ntohs(addr.sin_port);

    _request = _promise.get_future();
    _thread = std::thread([this]() { serve(); });
  }

  ~OneShotHttpServer()
  {
    ::shutdown(_fd, SHUT_RDWR);
    ::close(_fd);
    if (_thread.joinable())
    {
      _thread.join();
    }
  }

  int port() const { return _port; }

  std::string request()
  {
    if (_request.wait_for(5s) != std::future_status::ready)
    {
      return "";
    }
    return _request.get();
  }

private:
  void serve()
  {
    int conn = ::accept(_fd, nullptr, nullptr);
    if (conn < 0)
    {
      _promise.set_value("");
      return;
    }
    std::string data;
    char buf[4096];
    while (true)
    {
      auto headEnd = data.find("\r\n\r\n");
      if (headEnd != std::string::npos)
      {
        auto lengthPos = data.find("Content-Length: ");
        std::size_t length = 0;
        if (lengthPos != std::string::npos && lengthPos < headEnd)
        {
          length = std::stoul(data.substr(lengthPos + 16));
        }
        if (data.size() >= headEnd + 4 + length)
        {
          break;
        }
      }
      auto n = ::recv(conn, buf, sizeof(buf), 0);
      if (n <= 0)
      {
        break;
      }
      data.append(buf, static_cast<std::size_t>(n));
    }
    ::send(conn, _response.data(), _response.size(), MSG_NOSIGNAL);
    ::shutdown(conn, SHUT_WR);
    ::close(conn);
    _promise.set_value(data);
  }

  std::string _response;
  int _fd{-1};
  int _port{0};
  std::promise<std::string> _promise;
  std::future<std::string> _request;
  std::thread _thread;
};

std::string httpResponse(const std::string &body, const std::string &status = "200 OK")
{
  return "HTTP/1.1 " + status + "\r\nContent-Type: application/json\r\nContent-Length: " +
         std::to_string(body.size()) + "\r\nConnection: close\r\n\r\n" + body;
}
} // namespace

TEST_CASE("Broadcast goes over JSON-RPC HTTP when configured", "[client][broadcast][http]")
{
  omnilink::test::initializeTestLogging();
  OneShotHttpServer server(httpResponse(R"({"jsonrpc":"2.0","id":1,"result":"0xhash"})"));

  MockNetwork network;
  network.setOpenMode(MockNetwork::OpenMode::Manual);
  auto cfg = omnilink::test::mockClientConfig(network);
  cfg.broadcastRoute = BroadcastRoute::JsonRpcHttp;
  cfg.broadcastUrl = "http://127.0.0.1:" + std::to_string(server.port()) + "/rpc";
  Client client(cfg);

  REQUIRE(client.broadcastTransaction("0xf86b8085") == "0xhash");

  auto request = server.request();
  REQUIRE(request.rfind("POST /rpc HTTP/1.1\r\n", 0) == 0);
  REQUIRE(request.find("Content-Type: application/json\r\n") != std::string::npos);
  auto body = Json::parse(request.substr(request.find("\r\n\r\n") + 4));
  REQUIRE(body["jsonrpc"] == "2.0");
  REQUIRE(body["method"] == "eth_sendRawTransaction");
  REQUIRE(body["params"] == Json::array({"0xf86b8085"}));
  REQUIRE(body["id"] == 1);

  // the authenticated channel was never used
  REQUIRE(network.transportCount() == 0);
  REQUIRE(network.sentFrames().empty());
  REQUIRE(client.getStats().succeededCalls == 1);
}

TEST_CASE("HTTP broadcast surfaces node errors", "[client][broadcast][http]")
{
  OneShotHttpServer server(
    httpResponse(R"({"jsonrpc":"2.0","id":1,"error":{"code":-32000,"message":"nonce too low"}})"));

  MockNetwork network;
  auto cfg = omnilink::test::mockClientConfig(network);
  cfg.broadcastRoute = BroadcastRoute::JsonRpcHttp;
  cfg.broadcastUrl = "http://127.0.0.1:" + std::to_string(server.port());
  Client client(cfg);

  try
  {
    client.broadcastTransaction("0xdead");
    FAIL("expected RemoteError");
  }
  catch (const omnilink::rpc::RemoteError &e)
  {
    REQUIRE(e.code() == -32000);
    REQUIRE(e.message() == "nonce too low");
  }
  REQUIRE(client.getStats().failedCalls == 1);
}

TEST_CASE("JsonRpcHttpClient maps HTTP failures", "[http][jsonrpc]")
{
  SECTION("non-2xx without a JSON body")
  {
    OneShotHttpServer server(httpResponse("<html>bad gateway</html>", "502 Bad Gateway"));
    omnilink::network::JsonRpcHttpClient http("http://127.0.0.1:" + std::to_string(server.port()));
    REQUIRE_THROWS_AS(http.call("eth_chainId", Json::array()), omnilink::rpc::SendFailedError);
  }

  SECTION("chunked body")
  {
    const std::string body = R"({"jsonrpc":"2.0","id":1,"result":"0x89"})";
    std::string chunked = "HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\n";
    chunked += "10\r\n" + body.substr(0, 16) + "\r\n";
    char size[16];
    std::snprintf(size, sizeof(size), "%zx", body.size() - 16);
    chunked += std::string(size) + "\r\n" + body.substr(16) + "\r\n0\r\n\r\n";

    OneShotHttpServer server(chunked);
    omnilink::network::JsonRpcHttpClient http("http://127.0.0.1:" + std::to_string(server.port()));
    REQUIRE(http.call("eth_chainId", Json::array()) == "0x89");
  }

  SECTION("nothing listening")
  {
    int port = 0;
    {
      OneShotHttpServer probe(httpResponse("{}"));
      port = probe.port();
    }
    omnilink::network::JsonRpcHttpClient::Config config;
    config.timeout = 2000ms;
    omnilink::network::JsonRpcHttpClient http("http://127.0.0.1:" + std::to_string(port), config);
    REQUIRE_THROWS_AS(http.call("eth_chainId", Json::array()), omnilink::rpc::ClientError);
  }

  REQUIRE_THROWS_AS(omnilink::network::JsonRpcHttpClient("ws://127.0.0.1:1"), std::invalid_argument);
}

// Copyright (c) 2025 Omnilink Authors
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Omnilink, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#define CATCH_CONFIG_MAIN
#include "test_helpers.hpp"
#include <catch2/catch.hpp>

using namespace std::chrono_literals;
using omnilink::client::ClientStats;
using omnilink::client::Connection;
using omnilink::client::ConnectionState;
using omnilink::core::Json;
using omnilink::core::TimerService;
using omnilink::rpc::PendingCallRegistry;
using omnilink::test::MockNetwork;
using omnilink::test::waitUntil;

namespace
{
struct Fixture
{
  MockNetwork network;
  ClientStats stats;
  PendingCallRegistry registry;
  TimerService timer{"test-reconnect"};
  std::unique_ptr<Connection> connection;

  explicit Fixture(std::vector<std::string> endpoints = {"ws://A", "ws://B", "ws://C"},
                   std::uint32_t maxAttempts = 3)
  {
    omnilink::test::initializeTestLogging();
    Connection::Options options;
    options.endpoints = std::move(endpoints);
    options.transportFactory = network.factory();
    options.baseReconnectDelay = 10ms;
    options.maxReconnectDelay = 40ms;
    options.maxReconnectAttempts = maxAttempts;
    connection = std::make_unique<Connection>(options, registry, timer, &stats);
  }

  ~Fixture()
  {
    connection->shutdown();
    timer.stop();
  }
};
} // namespace

TEST_CASE("Backoff doubles from the base delay up to the cap", "[connection][backoff]")
{
  const auto base = 1000ms;
  const auto cap = 30000ms;
  REQUIRE(Connection::backoffDelay(0, base, cap) == 1000ms);
  REQUIRE(Connection::backoffDelay(1, base, cap) == 2000ms);
  REQUIRE(Connection::backoffDelay(2, base, cap) == 4000ms);
  REQUIRE(Connection::backoffDelay(4, base, cap) == 16000ms);
  REQUIRE(Connection::backoffDelay(5, base, cap) == 30000ms);
  REQUIRE(Connection::backoffDelay(40, base, cap) == 30000ms);
}

TEST_CASE("Connection requires a factory and endpoints", "[connection]")
{
  PendingCallRegistry registry;
  TimerService timer;
  Connection::Options options;
  options.endpoints = {"ws://A"};
  REQUIRE_THROWS_AS(Connection(options, registry, timer), std::invalid_argument);

  MockNetwork network;
  options.transportFactory = network.factory();
  options.endpoints.clear();
  REQUIRE_THROWS_AS(Connection(options, registry, timer), std::invalid_argument);
  timer.stop();
}

TEST_CASE("Connect opens the first endpoint and routes responses", "[connection][open]")
{
  Fixture f;
  f.connection->connect();

  REQUIRE(f.connection->waitForOpen(1s));
  REQUIRE(f.connection->state() == ConnectionState::Open);
  REQUIRE(f.connection->currentEndpoint() == "ws://A");
  REQUIRE(f.stats.connectionsOpened == 1);

  // already open: no second transport
  f.connection->connect();
  REQUIRE(f.network.transportCount() == 1);

  auto future = f.registry.registerCall("r1", PendingCallRegistry::Clock::now() + 5s);
  f.network.last()->deliver(R"({"id":"r1","result":"0x10"})");
  REQUIRE(future.get() == "0x10");

  auto remote = f.registry.registerCall("r2", PendingCallRegistry::Clock::now() + 5s);
  f.network.last()->deliver(R"({"id":"r2","error":{"code":-32601,"message":"Method not found"}})");
  try
  {
    remote.get();
    FAIL("expected RemoteError");
  }
  catch (const omnilink::rpc::RemoteError &e)
  {
    REQUIRE(e.code() == -32601);
    REQUIRE(e.message() == "Method not found");
  }
}

TEST_CASE("Malformed frames are dropped without closing", "[connection][malformed]")
{
  Fixture f;
  f.connection->connect();
  REQUIRE(f.connection->waitForOpen(1s));
  auto future = f.registry.registerCall("ok", PendingCallRegistry::Clock::now() + 5s);

  auto transport = f.network.last();
  transport->deliver("not json at all");
  transport->deliver(R"({"id":42,"result":1})");
  transport->deliver(R"({"id":"ok"})");
  transport->deliver(R"({"id":"unknown","result":1})");

  REQUIRE(f.stats.malformedFrames == 3);
  REQUIRE(f.connection->isOpen());
  REQUIRE(f.registry.contains("ok"));

  transport->deliver(R"({"id":"ok","result":true})");
  REQUIRE(future.get() == true);
}

TEST_CASE("Reconnect rotates endpoints and resets on open", "[connection][reconnect]")
{
  Fixture f;
  f.connection->connect();
  REQUIRE(f.connection->waitForOpen(1s));

  f.network.last()->drop();
  REQUIRE(waitUntil([&]() { return f.connection->isOpen() && f.network.transportCount() == 2; }));
  REQUIRE(f.connection->currentEndpoint() == "ws://B");
  REQUIRE(f.connection->attempts() == 0);
  REQUIRE(f.stats.reconnectsScheduled == 1);

  f.network.last()->drop();
  REQUIRE(waitUntil([&]() { return f.connection->isOpen() && f.network.transportCount() == 3; }));
  f.network.last()->drop();
  REQUIRE(waitUntil([&]() { return f.connection->isOpen() && f.network.transportCount() == 4; }));

  auto uris = f.network.openedUris();
  REQUIRE(uris == std::vector<std::string>{"ws://A", "ws://B", "ws://C", "ws://A"});
}

TEST_CASE("Pending calls survive a successful reconnect", "[connection][reconnect]")
{
  Fixture f;
  f.connection->connect();
  REQUIRE(f.connection->waitForOpen(1s));
  auto future = f.registry.registerCall("keep", PendingCallRegistry::Clock::now() + 5s);

  f.network.last()->drop();
  REQUIRE(waitUntil([&]() { return f.network.transportCount() == 2 && f.connection->isOpen(); }));
  REQUIRE(f.registry.contains("keep"));

  f.network.last()->deliver(R"({"id":"keep","result":7})");
  REQUIRE(future.get() == 7);
}

TEST_CASE("Exhausted reconnects fail pending calls with ConnectionLost", "[connection][failed]")
{
  Fixture f;
  f.connection->connect();
  REQUIRE(f.connection->waitForOpen(1s));
  auto future = f.registry.registerCall("doomed", PendingCallRegistry::Clock::now() + 10s);

  f.network.setOpenMode(MockNetwork::OpenMode::Refuse);
  f.network.last()->drop();

  REQUIRE(future.wait_for(3s) == std::future_status::ready);
  REQUIRE_THROWS_AS(future.get(), omnilink::rpc::ConnectionLostError);
  REQUIRE(f.connection->isFailed());
  REQUIRE(f.connection->state() == ConnectionState::Disconnected);

  // one open plus two refused reconnects: three consecutive closures
  REQUIRE(f.network.transportCount() == 3);
  std::this_thread::sleep_for(100ms);
  REQUIRE(f.network.transportCount() == 3);
  REQUIRE_FALSE(f.connection->waitForOpen(50ms));

  SECTION("an explicit connect starts over")
  {
    f.network.setOpenMode(MockNetwork::OpenMode::Succeed);
    f.connection->connect();
    REQUIRE(f.connection->waitForOpen(1s));
    REQUIRE_FALSE(f.connection->isFailed());
    REQUIRE(f.connection->attempts() == 0);
  }
}

TEST_CASE("Refused connects are retried with backoff", "[connection][reconnect]")
{
  Fixture f({"ws://A", "ws://B"}, 8);
  f.network.setOpenMode(MockNetwork::OpenMode::Refuse);
  f.connection->connect();

  REQUIRE(waitUntil([&]() { return f.network.transportCount() >= 3; }));
  f.network.setOpenMode(MockNetwork::OpenMode::Succeed);
  REQUIRE(waitUntil([&]() { return f.connection->isOpen(); }));
  REQUIRE_FALSE(f.connection->isFailed());

  auto uris = f.network.openedUris();
  for (std::size_t i = 0; i < uris.size(); ++i)
  {
    REQUIRE(uris[i] == (i % 2 == 0 ? "ws://A" : "ws://B"));
  }
}

TEST_CASE("Disconnect rejects pending calls and does not reconnect", "[connection][disconnect]")
{
  Fixture f;
  f.connection->connect();
  REQUIRE(f.connection->waitForOpen(1s));
  auto future = f.registry.registerCall("p", PendingCallRegistry::Clock::now() + 10s);
  auto transport = f.network.last();

  f.connection->disconnect();
  REQUIRE_THROWS_AS(future.get(), omnilink::rpc::DisconnectedError);
  REQUIRE(f.connection->state() == ConnectionState::Disconnected);
  REQUIRE_FALSE(transport->isOpen());

  std::this_thread::sleep_for(100ms);
  REQUIRE(f.network.transportCount() == 1);
  REQUIRE(f.stats.reconnectsScheduled == 0);

  auto send = f.connection->send("{}");
  REQUIRE_FALSE(send.ok);
  REQUIRE(send.code == omnilink::network::TransportError::NotOpen);

  // late frames on the old transport are ignored
  transport->deliver(R"({"id":"p","result":1})");

  f.connection->connect();
  REQUIRE(f.connection->waitForOpen(1s));
  REQUIRE(f.network.transportCount() == 2);
}

TEST_CASE("Disconnect cancels a scheduled reconnect", "[connection][disconnect]")
{
  MockNetwork network;
  PendingCallRegistry registry;
  TimerService timer;
  Connection::Options options;
  options.endpoints = {"ws://A"};
  options.transportFactory = network.factory();
  options.baseReconnectDelay = 200ms;
  options.maxReconnectDelay = 1000ms;
  Connection connection(options, registry, timer);

  connection.connect();
  REQUIRE(connection.waitForOpen(1s));
  network.last()->drop();
  REQUIRE(timer.pendingCount() == 1);

  connection.disconnect();
  REQUIRE(timer.pendingCount() == 0);
  std::this_thread::sleep_for(600ms);
  REQUIRE(network.transportCount() == 1);

  connection.shutdown();
  timer.stop();
}

TEST_CASE("A manual open completes only the current attempt", "[connection][generation]")
{
  Fixture f;
  f.network.setOpenMode(MockNetwork::OpenMode::Manual);
  f.connection->connect();
  REQUIRE(f.connection->state() == ConnectionState::Connecting);
  auto stale = f.network.last();

  f.connection->disconnect();
  stale->accept();
  REQUIRE(f.connection->state() == ConnectionState::Disconnected);

  f.connection->connect();
  auto current = f.network.last();
  REQUIRE(current != stale);
  current->accept();
  REQUIRE(f.connection->isOpen());
}

// Copyright (c) 2025 Omnilink Authors
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Omnilink, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#define CATCH_CONFIG_MAIN
#include "test_helpers.hpp"
#include <catch2/catch.hpp>

#include <atomic>
#include <future>
#include <thread>
#include <vector>

using namespace std::chrono_literals;
using omnilink::core::Json;
using omnilink::rpc::PendingCallRegistry;

namespace
{
PendingCallRegistry::Options manualExpiry()
{
  PendingCallRegistry::Options options;
  options.enableSweeper = false;
  return options;
}

struct Outcome
{
  std::atomic<int> successes{0};
  std::atomic<int> failures{0};
  Json lastResult;
  std::exception_ptr lastError;
};

void track(PendingCallRegistry &registry, const std::string &id, PendingCallRegistry::TimePoint deadline,
           Outcome &outcome)
{
  registry.registerCall(
    id, deadline,
    [&outcome](Json result)
    {
      outcome.lastResult = std::move(result);
      outcome.successes++;
    },
    [&outcome](std::exception_ptr error)
    {
      outcome.lastError = error;
      outcome.failures++;
    });
}
} // namespace

TEST_CASE("Registry completes each call exactly once", "[registry][exactly-once]")
{
  omnilink::test::initializeTestLogging();
  PendingCallRegistry registry(manualExpiry());
  const auto later = PendingCallRegistry::Clock::now() + 10s;
  Outcome outcome;
  track(registry, "a", later, outcome);
  REQUIRE(registry.size() == 1);
  REQUIRE(registry.contains("a"));

  SECTION("resolve then anything else is a no-op")
  {
    REQUIRE(registry.resolve("a", "0x10"));
    REQUIRE_FALSE(registry.resolve("a", "0x11"));
    REQUIRE_FALSE(registry.reject("a", std::make_exception_ptr(omnilink::rpc::TimeoutError())));
    REQUIRE(registry.rejectAll(std::make_exception_ptr(omnilink::rpc::DisconnectedError())) == 0);
    REQUIRE(registry.expire(later + 1s) == 0);
    REQUIRE(outcome.successes == 1);
    REQUIRE(outcome.failures == 0);
    REQUIRE(outcome.lastResult == "0x10");
  }

  SECTION("reject then resolve is a no-op")
  {
    REQUIRE(registry.reject("a", std::make_exception_ptr(omnilink::rpc::SendFailedError("broken pipe"))));
    REQUIRE_FALSE(registry.resolve("a", 1));
    REQUIRE(outcome.successes == 0);
    REQUIRE(outcome.failures == 1);
    REQUIRE_THROWS_AS(std::rethrow_exception(outcome.lastError), omnilink::rpc::SendFailedError);
  }

  SECTION("unknown ids are ignored")
  {
    REQUIRE_FALSE(registry.resolve("nope", 1));
    REQUIRE_FALSE(registry.reject("nope", std::make_exception_ptr(omnilink::rpc::TimeoutError())));
    REQUIRE(registry.size() == 1);
  }

  REQUIRE(registry.size() <= 1);
}

TEST_CASE("Registry rejects duplicate ids", "[registry][duplicate]")
{
  PendingCallRegistry registry(manualExpiry());
  const auto later = PendingCallRegistry::Clock::now() + 10s;
  Outcome first;
  Outcome second;
  track(registry, "dup", later, first);

  REQUIRE_THROWS_AS(track(registry, "dup", later, second), omnilink::rpc::DuplicateIdError);
  try
  {
    track(registry, "dup", later, second);
  }
  catch (const omnilink::rpc::ClientError &e)
  {
    REQUIRE(e.kind() == omnilink::rpc::ErrorCode::DuplicateId);
  }
  REQUIRE(registry.size() == 1);

  registry.resolve("dup", true);
  REQUIRE(first.successes == 1);
  REQUIRE(second.successes == 0);
  REQUIRE(second.failures == 0);
}

TEST_CASE("Registry expiry fails overdue calls with Timeout", "[registry][expiry]")
{
  PendingCallRegistry registry(manualExpiry());
  const auto now = PendingCallRegistry::Clock::now();
  Outcome soon;
  Outcome late;
  track(registry, "soon", now + 100ms, soon);
  track(registry, "late", now + 10s, late);

  REQUIRE(registry.expire(now + 50ms) == 0);
  REQUIRE(registry.expire(now + 100ms) == 1);
  REQUIRE(soon.failures == 1);
  REQUIRE_THROWS_AS(std::rethrow_exception(soon.lastError), omnilink::rpc::TimeoutError);
  REQUIRE(registry.size() == 1);

  SECTION("a late response is discarded")
  {
    REQUIRE_FALSE(registry.resolve("soon", "0x1"));
    REQUIRE(soon.successes == 0);
    REQUIRE(soon.failures == 1);
  }
}

TEST_CASE("Registry sweeper expires calls on its own", "[registry][sweeper]")
{
  PendingCallRegistry::Options options;
  options.sweepInterval = 20ms;
  PendingCallRegistry registry(options);

  auto future = registry.registerCall("t", PendingCallRegistry::Clock::now() + 50ms);
  REQUIRE(future.wait_for(2s) == std::future_status::ready);
  REQUIRE_THROWS_AS(future.get(), omnilink::rpc::TimeoutError);
  REQUIRE(registry.size() == 0);
}

TEST_CASE("Registry rejectAll fails every pending call", "[registry][rejectAll]")
{
  PendingCallRegistry registry(manualExpiry());
  const auto later = PendingCallRegistry::Clock::now() + 10s;
  std::vector<std::future<Json>> futures;
  for (int i = 0; i < 5; ++i)
  {
    futures.push_back(registry.registerCall("c" + std::to_string(i), later));
  }

  REQUIRE(registry.rejectAll(std::make_exception_ptr(omnilink::rpc::ConnectionLostError())) == 5);
  REQUIRE(registry.size() == 0);
  for (auto &f : futures)
  {
    REQUIRE_THROWS_AS(f.get(), omnilink::rpc::ConnectionLostError);
  }
}

TEST_CASE("Registry tolerates throwing handlers", "[registry][exceptions]")
{
  PendingCallRegistry registry(manualExpiry());
  registry.registerCall(
    "x", PendingCallRegistry::Clock::now() + 10s, [](Json) { throw std::runtime_error("user bug"); },
    [](std::exception_ptr) {});
  REQUIRE_NOTHROW(registry.resolve("x", 1));
  REQUIRE(registry.size() == 0);
}

TEST_CASE("Registry holds 10000 outstanding calls", "[registry][concurrency]")
{
  PendingCallRegistry registry(manualExpiry());
  const auto later = PendingCallRegistry::Clock::now() + 60s;
  constexpr int kThreads = 8;
  constexpr int kPerThread = 1250;

  std::atomic<int> successes{0};
  std::atomic<int> duplicates{0};
  std::vector<std::vector<std::string>> ids(kThreads);
  std::vector<std::thread> threads;
  for (int t = 0; t < kThreads; ++t)
  {
    threads.emplace_back(
      [&, t]()
      {
        for (int i = 0; i < kPerThread; ++i)
        {
          auto id = omnilink::ids::CallId::next();
          try
          {
            registry.registerCall(id, later, [&](Json) { successes++; }, [](std::exception_ptr) {});
            ids[t].push_back(id);
          }
          catch (const omnilink::rpc::DuplicateIdError &)
          {
            duplicates++;
          }
        }
      });
  }
  for (auto &t : threads)
  {
    t.join();
  }

  REQUIRE(duplicates == 0);
  REQUIRE(registry.size() == kThreads * kPerThread);
  REQUIRE(successes == 0);

  threads.clear();
  for (int t = 0; t < kThreads; ++t)
  {
    threads.emplace_back(
      [&, t]()
      {
        for (auto it = ids[t].rbegin(); it != ids[t].rend(); ++it)
        {
          registry.resolve(*it, 1);
        }
      });
  }
  for (auto &t : threads)
  {
    t.join();
  }

  REQUIRE(successes == kThreads * kPerThread);
  REQUIRE(registry.size() == 0);
}

TEST_CASE("Registry destruction fails outstanding calls", "[registry][lifecycle]")
{
  std::future<Json> future;
  {
    PendingCallRegistry registry;
    future = registry.registerCall("orphan", PendingCallRegistry::Clock::now() + 60s);
  }
  REQUIRE_THROWS_AS(future.get(), omnilink::rpc::DisconnectedError);
}

// Copyright (c) 2025 Omnilink Authors
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Omnilink, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#define CATCH_CONFIG_MAIN
#include "test_helpers.hpp"
#include <catch2/catch.hpp>

using omnilink::rpc::parseResponse;

TEST_CASE("Response frames with a result", "[envelope][parse]")
{
  auto r = parseResponse(R"({"id":"abc","result":"0x10"})");
  REQUIRE(r.has_value());
  REQUIRE(r->id == "abc");
  REQUIRE_FALSE(r->isError());
  REQUIRE(*r->result == "0x10");
  REQUIRE_FALSE(r->cached);

  auto nullResult = parseResponse(R"({"id":"abc","result":null,"error":null})");
  REQUIRE(nullResult.has_value());
  REQUIRE(nullResult->result->is_null());

  auto hinted = parseResponse(R"({"id":"abc","result":{"n":1},"cached":true,"servedBy":"validator2"})");
  REQUIRE(hinted.has_value());
  REQUIRE(hinted->cached);
  REQUIRE(hinted->servedBy == "validator2");
}

TEST_CASE("Response frames with an error", "[envelope][parse]")
{
  auto r = parseResponse(R"({"id":"abc","error":{"code":-32000,"message":"execution reverted","data":"0x08c3"}})");
  REQUIRE(r.has_value());
  REQUIRE(r->isError());
  REQUIRE(r->error->code == -32000);
  REQUIRE(r->error->message == "execution reverted");
  REQUIRE(r->error->data == "0x08c3");
}

TEST_CASE("Malformed frames are rejected without throwing", "[envelope][malformed]")
{
  REQUIRE_FALSE(parseResponse("").has_value());
  REQUIRE_FALSE(parseResponse("not json").has_value());
  REQUIRE_FALSE(parseResponse("[1,2,3]").has_value());
  REQUIRE_FALSE(parseResponse(R"({"result":1})").has_value());
  REQUIRE_FALSE(parseResponse(R"({"id":7,"result":1})").has_value());
  REQUIRE_FALSE(parseResponse(R"({"id":"a"})").has_value());
  REQUIRE_FALSE(parseResponse(R"({"id":"a","result":1,"error":{"code":1,"message":"x"}})").has_value());
  REQUIRE_FALSE(parseResponse(R"({"id":"a","error":"boom"})").has_value());
  REQUIRE_FALSE(parseResponse(R"({"id":"a","error":{"code":"1","message":"x"}})").has_value());
  REQUIRE_FALSE(parseResponse(R"({"id":"a","error":{"code":1}})").has_value());
}

TEST_CASE("Error codes keep their 64-bit value", "[envelope][parse]")
{
  auto wide = parseResponse(R"({"id":"a","error":{"code":5000000000,"message":"x"}})");
  REQUIRE(wide.has_value());
  REQUIRE(wide->error->code == 5000000000LL);

  auto negative = parseResponse(R"({"id":"a","error":{"code":-9007199254740993,"message":"x"}})");
  REQUIRE(negative.has_value());
  REQUIRE(negative->error->code == -9007199254740993LL);

  REQUIRE_FALSE(
    parseResponse(R"({"id":"a","error":{"code":18446744073709551615,"message":"x"}})").has_value());
}

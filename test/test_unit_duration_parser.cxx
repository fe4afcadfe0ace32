/* -*- Mode: C++; tab-width: 4; c-basic-offset: 4; indent-tabs-mode: nil -*- */
/*
 *   Copyright 2024. Couchbase, Inc.
 *
 *   Licensed under the Apache License, Version 2.0 (the "License");
 *   you may not use this file except in compliance with the License.
 *   You may obtain a copy of the License at
 *
 *       http://www.apache.org/licenses/LICENSE-2.0
 *
 *   Unless required by applicable law or agreed to in writing, software
 *   distributed under the License is distributed on an "AS IS" BASIS,
 *   WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 *   See the License for the specific language governing permissions and
 *   limitations under the License.
 */

#include "test_helper.hxx"

#include <catch2/matchers/catch_matchers_exception.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include "core/utils/duration_parser.hxx"

using namespace std::chrono_literals;

TEST_CASE("unit: parse duration", "[unit]")
{
  using relay::core::utils::parse_duration;

  SECTION("single unit")
  {
    REQUIRE(parse_duration("0") == 0ns);
    REQUIRE(parse_duration("5s") == 5s);
    REQUIRE(parse_duration("30s") == 30s);
    REQUIRE(parse_duration("1478s") == 1478s);
    REQUIRE(parse_duration("300ms") == 300ms);
    REQUIRE(parse_duration("15ns") == 15ns);
    REQUIRE(parse_duration("7us") == 7us);
    REQUIRE(parse_duration("7\xc2\xb5s") == 7us);
    REQUIRE(parse_duration("7\xce\xbcs") == 7us);
    REQUIRE(parse_duration("2m") == 2min);
    REQUIRE(parse_duration("1h") == 1h);
  }

  SECTION("sign")
  {
    REQUIRE(parse_duration("-5s") == -5s);
    REQUIRE(parse_duration("+5s") == 5s);
    REQUIRE(parse_duration("-0") == 0ns);
    REQUIRE(parse_duration("+0") == 0ns);
  }

  SECTION("fraction")
  {
    REQUIRE(parse_duration("5.0s") == 5s);
    REQUIRE(parse_duration("5.6s") == 5600ms);
    REQUIRE(parse_duration("5.s") == 5s);
    REQUIRE(parse_duration(".5s") == 500ms);
    REQUIRE(parse_duration("1.0s") == 1s);
    REQUIRE(parse_duration("1.004s") == 1004ms);
    REQUIRE(parse_duration("100.00100s") == 100001ms);
    REQUIRE(parse_duration("-1.5h") == -90min);
  }

  SECTION("compound")
  {
    REQUIRE(parse_duration("1h2m3s4ms5us6ns") == 1h + 2min + 3s + 4ms + 5us + 6ns);
    REQUIRE(parse_duration("39h9m14.425s") == 39h + 9min + 14425ms);
    REQUIRE(parse_duration("2h45m") == 165min);
    REQUIRE(parse_duration("4s2ms") == 4002ms);
  }
}

TEST_CASE("unit: parse duration rejects malformed input", "[unit]")
{
  using Catch::Matchers::Message;
  using relay::core::utils::duration_parse_error;
  using relay::core::utils::parse_duration;

  REQUIRE_THROWS_MATCHES(parse_duration(""), duration_parse_error, Message(R"(invalid duration "")"));
  REQUIRE_THROWS_MATCHES(parse_duration("3"), duration_parse_error, Message(R"(missing unit in duration "3")"));
  REQUIRE_THROWS_MATCHES(parse_duration("-"), duration_parse_error, Message(R"(invalid duration "-")"));
  REQUIRE_THROWS_MATCHES(parse_duration("s"), duration_parse_error, Message(R"(invalid duration "s")"));
  REQUIRE_THROWS_MATCHES(parse_duration("."), duration_parse_error, Message(R"(invalid duration ".")"));
  REQUIRE_THROWS_MATCHES(parse_duration("-.s"), duration_parse_error, Message(R"(invalid duration "-.s")"));
  REQUIRE_THROWS_MATCHES(
    parse_duration("3000000h"), duration_parse_error, Message(R"(invalid duration "3000000h")"));
  REQUIRE_THROWS_MATCHES(
    parse_duration("9223372036854775808ns"), duration_parse_error, Message(R"(invalid duration "9223372036854775808ns")"));
  REQUIRE_THROWS_MATCHES(
    parse_duration("10days"), duration_parse_error, Message(R"(unknown unit "days" in duration "10days")"));
}

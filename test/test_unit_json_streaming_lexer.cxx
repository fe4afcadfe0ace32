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

#include "core/utils/json_streaming_lexer.hxx"

#include <relay/error_codes.hxx>

#include <string>
#include <vector>

namespace
{
struct lexer_result {
  bool completed{ false };
  std::error_code ec{};
  std::size_t number_of_rows{};
  std::string meta{};
  std::vector<std::string> rows{};
  std::vector<std::string> headers{};
};

void
attach(relay::core::utils::json::streaming_lexer& lexer, lexer_result& result)
{
  lexer.on_row([&result](std::string&& row) {
    result.rows.emplace_back(std::move(row));
  });
  lexer.on_metadata_header([&result](std::string&& header) {
    result.headers.emplace_back(std::move(header));
  });
  lexer.on_complete([&result](std::error_code ec, std::size_t number_of_rows, std::string&& meta) {
    result.completed = true;
    result.ec = ec;
    result.number_of_rows = number_of_rows;
    result.meta = std::move(meta);
  });
}
} // namespace

TEST_CASE("unit: json_streaming_lexer parse query result in single chunk", "[unit]")
{
  test::utils::init_logger();

  const std::string chunk = R"(
{
"requestID": "2640a5b5-2e67-44e7-86ec-31cc388b7427",
"signature": {"greeting":"string"},
"results": [
{"greeting":"C++"},
{"greeting":"ruby"},
null,1,false
],
"status": "success"
}
)";
  relay::core::utils::json::streaming_lexer lexer("/results/^", 4);
  lexer_result result{};
  attach(lexer, result);
  lexer.feed(chunk);

  REQUIRE(result.completed);
  REQUIRE_SUCCESS(result.ec);
  REQUIRE(result.number_of_rows == 5);
  REQUIRE(result.rows.size() == 5);
  REQUIRE(result.rows[0] == R"({"greeting":"C++"})");
  REQUIRE(result.rows[1] == R"({"greeting":"ruby"})");
  REQUIRE(result.rows[2] == "null");
  REQUIRE(result.rows[3] == "1");
  REQUIRE(result.rows[4] == "false");
  REQUIRE(result.meta == R"(
{
"requestID": "2640a5b5-2e67-44e7-86ec-31cc388b7427",
"signature": {"greeting":"string"},
"results": [
],
"status": "success"
}
)");
  REQUIRE(result.headers.size() == 1);
}

TEST_CASE("unit: json_streaming_lexer emits rows as soon as they are complete", "[unit]")
{
  test::utils::init_logger();

  relay::core::utils::json::streaming_lexer lexer("/results/^", 4);
  lexer_result result{};
  attach(lexer, result);

  lexer.feed(R"({"requestID": "9739203f", "results": [{"name":"first",)");
  REQUIRE(result.headers.size() == 1);
  REQUIRE(result.headers[0] == R"({"requestID": "9739203f", "results": [)");
  REQUIRE(result.rows.empty());

  lexer.feed(R"("tags":[1,2]},{"name":)");
  REQUIRE(result.rows.size() == 1);
  REQUIRE(result.rows[0] == R"({"name":"first","tags":[1,2]})");

  lexer.feed(R"("second"}], "status": )");
  REQUIRE(result.rows.size() == 2);
  REQUIRE(result.rows[1] == R"({"name":"second"})");
  REQUIRE_FALSE(result.completed);

  lexer.feed(R"("success", "metrics": {"resultCount": 2}})");
  REQUIRE(result.completed);
  REQUIRE_SUCCESS(result.ec);
  REQUIRE(result.number_of_rows == 2);
  REQUIRE(result.meta == R"({"requestID": "9739203f", "results": [], "status": "success", "metrics": {"resultCount": 2}})");
  REQUIRE(lexer.completed());
}

TEST_CASE("unit: json_streaming_lexer parse chunked metadata trailer", "[unit]")
{
  test::utils::init_logger();

  const std::vector<std::string> chunks{
    R"({"requestID": "2640a5b5-2e67-44e7-86ec-31cc388b7427","results": [42],)",
    R"("clientContextID":)",
    R"("730ecac3-e8d0-4d6e-4ed9-e2d4abd1d7b9",)",
    R"("status": "success"})",
  };
  relay::core::utils::json::streaming_lexer lexer("/results/^", 4);
  lexer_result result{};
  attach(lexer, result);
  for (const auto& chunk : chunks) {
    lexer.feed(chunk);
  }
  REQUIRE_SUCCESS(result.ec);
  REQUIRE(result.number_of_rows == 1);
  REQUIRE(result.rows.size() == 1);
  REQUIRE(result.rows[0] == "42");
  REQUIRE(
    result.meta ==
    R"({"requestID": "2640a5b5-2e67-44e7-86ec-31cc388b7427","results": [],"clientContextID":"730ecac3-e8d0-4d6e-4ed9-e2d4abd1d7b9","status": "success"})");
}

TEST_CASE("unit: json_streaming_lexer parse payload with missing results", "[unit]")
{
  test::utils::init_logger();

  const std::string chunk = R"({"requestID": "d07c0cde","signature": {"*": "*"},"status": "success","metrics": {"resultCount": 0}})";
  relay::core::utils::json::streaming_lexer lexer("/results/^", 4);
  lexer_result result{};
  attach(lexer, result);
  lexer.feed(chunk);

  REQUIRE(result.completed);
  REQUIRE_SUCCESS(result.ec);
  REQUIRE(result.number_of_rows == 0);
  REQUIRE(result.rows.empty());
  REQUIRE(result.headers.empty());
  REQUIRE(result.meta == chunk);
}

TEST_CASE("unit: json_streaming_lexer reports empty rows array header", "[unit]")
{
  test::utils::init_logger();

  relay::core::utils::json::streaming_lexer lexer("/results/^", 4);
  lexer_result result{};
  attach(lexer, result);
  lexer.feed(R"({"requestID": "1","results": [],"status": "success"})");

  REQUIRE(result.completed);
  REQUIRE(result.headers.size() == 1);
  REQUIRE(result.headers[0] == R"({"requestID": "1","results": [)");
  REQUIRE(result.meta == R"({"requestID": "1","results": [],"status": "success"})");
}

TEST_CASE("unit: json_streaming_lexer failures", "[unit]")
{
  test::utils::init_logger();

  relay::core::utils::json::streaming_lexer lexer("/results/^", 4);
  lexer_result result{};
  attach(lexer, result);

  SECTION("root must be an object")
  {
    lexer.feed(R"([1,2,3])");
    REQUIRE(result.completed);
    REQUIRE(result.ec == relay::errc::streaming_json_lexer::root_is_not_an_object);
  }

  SECTION("syntax error completes the lexer once")
  {
    lexer.feed(R"({"results": [1,}])");
    REQUIRE(result.completed);
    REQUIRE(result.ec);
    result.completed = false;
    lexer.feed(R"(, "status": "success"})");
    REQUIRE_FALSE(result.completed);
  }

  SECTION("truncated input")
  {
    lexer.feed(R"({"results": [{"id":1},{"id":2},{"id")");
    REQUIRE(result.rows.size() == 2);
    lexer.finish();
    REQUIRE(result.completed);
    REQUIRE(result.ec == relay::errc::streaming_json_lexer::truncated_input);
  }

  SECTION("malformed pointer")
  {
    REQUIRE_THROWS_AS(relay::core::utils::json::streaming_lexer("results", 4), std::invalid_argument);
  }
}

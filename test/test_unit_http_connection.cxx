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

#include "utils/mock_cluster.hxx"

#include "core/io/http_connection.hxx"
#include "core/io/http_streaming_parser.hxx"

#include <relay/error_codes.hxx>

#include <future>

using namespace std::chrono_literals;

TEST_CASE("unit: http streaming parser", "[unit]")
{
  relay::core::io::http_streaming_parser parser{};

  SECTION("content length")
  {
    std::string response{ "HTTP/1.1 200 OK\r\nContent-Type: application/json\r\nContent-Length: 11\r\n\r\n{\"rev\": 42}" };
    auto result = parser.feed(response.data(), response.size());
    REQUIRE_FALSE(result.failure);
    REQUIRE(result.headers_complete);
    REQUIRE(result.complete);
    REQUIRE(parser.status_code == 200);
    REQUIRE(parser.status_message == "OK");
    REQUIRE(parser.headers["content-type"] == "application/json");
    REQUIRE(parser.body_chunk == R"({"rev": 42})");
    REQUIRE(parser.keep_alive);
  }

  SECTION("chunked response fed byte by byte")
  {
    std::string response{ "HTTP/1.1 503 Service Unavailable\r\nTransfer-Encoding: chunked\r\n\r\n"
                          "5\r\nhello\r\n6\r\n world\r\n0\r\n\r\n" };
    std::string body{};
    bool headers_complete{ false };
    for (std::size_t i = 0; i < response.size(); ++i) {
      auto result = parser.feed(response.data() + i, 1);
      REQUIRE_FALSE(result.failure);
      if (result.headers_complete && !headers_complete) {
        headers_complete = true;
        REQUIRE(parser.status_code == 503);
      }
      body += parser.body_chunk;
      parser.body_chunk.clear();
      REQUIRE(result.complete == (i + 1 == response.size()));
    }
    REQUIRE(body == "hello world");
  }

  SECTION("connection close")
  {
    std::string response{ "HTTP/1.1 200 OK\r\nConnection: close\r\nContent-Length: 0\r\n\r\n" };
    auto result = parser.feed(response.data(), response.size());
    REQUIRE(result.complete);
    REQUIRE_FALSE(parser.keep_alive);
  }

  SECTION("repeated headers are joined")
  {
    std::string response{ "HTTP/1.1 200 OK\r\nX-Trace: a\r\nx-trace: b\r\nContent-Length: 0\r\n\r\n" };
    auto result = parser.feed(response.data(), response.size());
    REQUIRE(result.complete);
    REQUIRE(parser.headers["x-trace"] == "a, b");
  }

  SECTION("body delimited by end of stream")
  {
    std::string response{ "HTTP/1.1 200 OK\r\n\r\npartial" };
    auto result = parser.feed(response.data(), response.size());
    REQUIRE_FALSE(result.failure);
    REQUIRE_FALSE(result.complete);
    result = parser.finish();
    REQUIRE_FALSE(result.failure);
    REQUIRE(result.complete);
    REQUIRE(parser.body_chunk == "partial");
    REQUIRE_FALSE(parser.keep_alive);
  }

  SECTION("truncated chunked body")
  {
    std::string response{ "HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\n5\r\nhel" };
    auto result = parser.feed(response.data(), response.size());
    REQUIRE_FALSE(result.failure);
    result = parser.finish();
    REQUIRE(result.failure);
    REQUIRE_FALSE(result.complete);
  }

  SECTION("garbage")
  {
    std::string response{ "SMTP/1.0 220 ready\r\n\r\n" };
    auto result = parser.feed(response.data(), response.size());
    REQUIRE(result.failure);
    REQUIRE_FALSE(result.error.empty());
  }

  SECTION("reset between responses")
  {
    std::string first{ "HTTP/1.1 404 Not Found\r\nContent-Length: 2\r\n\r\n{}" };
    REQUIRE(parser.feed(first.data(), first.size()).complete);
    parser.reset();
    REQUIRE(parser.headers.empty());
    REQUIRE_FALSE(parser.complete);
    std::string second{ "HTTP/1.1 200 OK\r\nContent-Length: 0\r\n\r\n" };
    REQUIRE(parser.feed(second.data(), second.size()).complete);
    REQUIRE(parser.status_code == 200);
  }

  SECTION("survives moves")
  {
    relay::core::io::http_streaming_parser moved{ std::move(parser) };
    std::string response{ "HTTP/1.1 200 OK\r\nContent-Length: 2\r\n\r\nok" };
    REQUIRE(moved.feed(response.data(), response.size()).complete);
    REQUIRE(moved.body_chunk == "ok");
  }
}

namespace
{
struct exchange_result {
  std::error_code ec{};
  relay::core::io::http_response response{};
  std::string body{};
};

auto
open_connection(const std::shared_ptr<relay::core::io::http_connection>& connection) -> std::error_code
{
  auto barrier = std::make_shared<std::promise<std::error_code>>();
  auto f = barrier->get_future();
  connection->connect([barrier](std::error_code ec) {
    barrier->set_value(ec);
  });
  return f.get();
}

void
read_body(const std::shared_ptr<relay::core::io::http_connection>& connection,
          std::shared_ptr<exchange_result> result,
          std::shared_ptr<std::promise<void>> barrier)
{
  connection->read_body([connection, result, barrier](std::error_code ec, std::string chunk, bool complete) mutable {
    if (ec) {
      result->ec = ec;
      return barrier->set_value();
    }
    result->body += chunk;
    if (complete) {
      return barrier->set_value();
    }
    read_body(connection, std::move(result), std::move(barrier));
  });
}

auto
exchange(const std::shared_ptr<relay::core::io::http_connection>& connection,
         const relay::core::io::http_request& request,
         const std::string& authorization = {}) -> exchange_result
{
  auto result = std::make_shared<exchange_result>();
  auto barrier = std::make_shared<std::promise<void>>();
  auto f = barrier->get_future();
  connection->send(request,
                   authorization,
                   [connection, result, barrier](std::error_code ec, relay::core::io::http_response response) {
                     if (ec) {
                       result->ec = ec;
                       return barrier->set_value();
                     }
                     result->response = std::move(response);
                     read_body(connection, result, barrier);
                   });
  f.get();
  return *result;
}

auto
make_connection(test::utils::io_runner& runner,
                const std::shared_ptr<test::utils::mock_cluster>& cluster,
                const std::string& hostname = "node1",
                const std::string& port = "8093") -> std::shared_ptr<relay::core::io::http_connection>
{
  relay::core::io::http_connection_options options{};
  options.hostname = hostname;
  options.port = port;
  options.user_agent = "relay/test";
  options.connect_timeout = 1s;
  return std::make_shared<relay::core::io::http_connection>(
    runner.io(), cluster->stream_factory()(runner.io()), options);
}
} // namespace

TEST_CASE("unit: http connection exchanges requests", "[unit]")
{
  test::utils::init_logger();
  test::utils::io_runner runner{};
  auto cluster = std::make_shared<test::utils::mock_cluster>();
  cluster->on_http([](const test::utils::recorded_http_request& request) -> std::optional<test::utils::scripted_http_response> {
    if (request.path == "/query/service") {
      return test::utils::scripted_http_response{ 200, { { "Content-Type", "application/json" } }, { R"({"results":[)", R"({"a":1}]})" } };
    }
    if (request.path == "/close") {
      return test::utils::scripted_http_response{ 200, { { "Connection", "close" } }, { "bye" } };
    }
    if (request.path == "/truncated") {
      return test::utils::scripted_http_response{ 200, {}, { "part", "ial" }, true };
    }
    return test::utils::scripted_http_response{ 404, {}, {} };
  });

  auto connection = make_connection(runner, cluster);
  auto connected = open_connection(connection);
  REQUIRE_SUCCESS(connected);
  REQUIRE(connection->endpoint() == "node1:8093");
  REQUIRE(connection->is_usable());
  REQUIRE(cluster->connects() == 1);

  SECTION("chunked body")
  {
    relay::core::io::http_request request{};
    request.type = relay::service_type::query;
    request.method = "POST";
    request.path = "/query/service";
    request.headers["Content-Type"] = "application/json";
    request.body = R"({"statement":"SELECT 1"})";

    auto result = exchange(connection, request, "Basic QWRtaW5pc3RyYXRvcjpwYXNzd29yZA==");
    REQUIRE_SUCCESS(result.ec);
    REQUIRE(result.response.status_code == 200);
    REQUIRE(result.response.headers["content-type"] == "application/json");
    REQUIRE(result.response.endpoint == "node1:8093");
    REQUIRE(result.body == R"({"results":[{"a":1}]})");

    auto recorded = cluster->http_requests();
    REQUIRE(recorded.size() == 1);
    REQUIRE(recorded[0].endpoint == "node1:8093");
    REQUIRE(recorded[0].method == "POST");
    REQUIRE(recorded[0].headers["authorization"] == "Basic QWRtaW5pc3RyYXRvcjpwYXNzd29yZA==");
    REQUIRE(recorded[0].headers["user-agent"] == "relay/test");
    REQUIRE(recorded[0].headers["content-length"] == std::to_string(request.body.size()));
    REQUIRE(recorded[0].body == request.body);

    SECTION("connection is reused")
    {
      REQUIRE(connection->is_usable());
      request.path = "/missing";
      result = exchange(connection, request);
      REQUIRE_SUCCESS(result.ec);
      REQUIRE(result.response.status_code == 404);
      REQUIRE(result.body.empty());
      REQUIRE(cluster->connects() == 1);
      REQUIRE(cluster->http_requests().at(1).headers.count("authorization") == 0);
    }
  }

  SECTION("server asks to close the connection")
  {
    relay::core::io::http_request request{};
    request.path = "/close";
    auto result = exchange(connection, request);
    REQUIRE_SUCCESS(result.ec);
    REQUIRE(result.body == "bye");
    REQUIRE(result.response.must_close_connection());
    REQUIRE_FALSE(connection->is_usable());
  }

  SECTION("connection lost in the middle of the body")
  {
    relay::core::io::http_request request{};
    request.path = "/truncated";
    auto result = exchange(connection, request);
    REQUIRE(result.ec == relay::errc::common::transport_failure);
    REQUIRE(result.body == "partial");
    REQUIRE_FALSE(connection->is_usable());

    result = exchange(connection, request);
    REQUIRE(result.ec == relay::errc::common::transport_failure);
  }

  SECTION("closed by the server before responding")
  {
    cluster->on_http([](const test::utils::recorded_http_request& /* request */) {
      return std::optional<test::utils::scripted_http_response>{};
    });
    auto barrier = std::make_shared<std::promise<std::error_code>>();
    auto f = barrier->get_future();
    relay::core::io::http_request request{};
    request.path = "/hang";
    connection->send(request, {}, [barrier](std::error_code ec, relay::core::io::http_response /* response */) {
      barrier->set_value(ec);
    });
    REQUIRE(test::utils::wait_until([&cluster]() { return cluster->http_requests().size() == 1; }));
    cluster->drop_connections("node1:8093");
    REQUIRE(f.get() == relay::errc::common::transport_failure);
  }

  connection->close();
  REQUIRE(test::utils::wait_until([&cluster]() { return cluster->open_streams() == 0; }));
}

TEST_CASE("unit: http connection reports connect failures", "[unit]")
{
  test::utils::init_logger();
  test::utils::io_runner runner{};
  auto cluster = std::make_shared<test::utils::mock_cluster>();
  cluster->set_reachable("node2:8093", false);

  auto connection = make_connection(runner, cluster, "node2");
  REQUIRE(open_connection(connection) == relay::errc::common::transport_failure);
  REQUIRE_FALSE(connection->is_usable());

  relay::core::io::http_request request{};
  request.path = "/query/service";
  REQUIRE(exchange(connection, request).ec == relay::errc::common::transport_failure);
}

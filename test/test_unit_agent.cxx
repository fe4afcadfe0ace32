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

#include "core/agent.hxx"
#include "core/mcbp/codec.hxx"
#include "core/utils/json.hxx"

#include <relay/error_codes.hxx>

#include <relay/tracing/request_tracer.hxx>

#include <atomic>
#include <future>
#include <map>
#include <mutex>
#include <vector>

using namespace std::chrono_literals;

namespace
{
struct recorded_span {
  std::string name{};
  std::string parent{};
  std::map<std::string, std::string> tags{};
  bool ended{ false };
};

class recording_tracer : public relay::tracing::request_tracer
{
public:
  class span : public relay::tracing::request_span
  {
  public:
    span(recording_tracer* tracer, std::size_t index, std::string name, std::shared_ptr<request_span> parent)
      : request_span(std::move(name), std::move(parent))
      , tracer_{ tracer }
      , index_{ index }
    {
    }

    void add_tag(const std::string& name, std::uint64_t value) override
    {
      tracer_->tag(index_, name, std::to_string(value));
    }

    void add_tag(const std::string& name, const std::string& value) override
    {
      tracer_->tag(index_, name, value);
    }

    void end() override
    {
      tracer_->end(index_);
    }

  private:
    recording_tracer* tracer_;
    std::size_t index_;
  };

  auto start_span(std::string name, std::shared_ptr<relay::tracing::request_span> parent)
    -> std::shared_ptr<relay::tracing::request_span> override
  {
    const std::scoped_lock lock(mutex_);
    recorded_span entry{};
    entry.name = name;
    if (parent) {
      entry.parent = parent->name();
    }
    spans_.push_back(entry);
    return std::make_shared<span>(this, spans_.size() - 1, std::move(name), std::move(parent));
  }

  [[nodiscard]] auto spans(const std::string& name) const -> std::vector<recorded_span>
  {
    const std::scoped_lock lock(mutex_);
    std::vector<recorded_span> result{};
    for (const auto& entry : spans_) {
      if (entry.name == name) {
        result.push_back(entry);
      }
    }
    return result;
  }

private:
  void tag(std::size_t index, const std::string& name, std::string value)
  {
    const std::scoped_lock lock(mutex_);
    spans_.at(index).tags[name] = std::move(value);
  }

  void end(std::size_t index)
  {
    const std::scoped_lock lock(mutex_);
    spans_.at(index).ended = true;
  }

  mutable std::mutex mutex_{};
  std::vector<recorded_span> spans_{};
};

auto
two_nodes() -> std::vector<test::utils::mock_node>
{
  test::utils::mock_node node1{};
  node1.hostname = "node1";
  node1.query = 8093;
  node1.search = 8094;
  test::utils::mock_node node2{};
  node2.hostname = "node2";
  node2.query = 8093;
  return { node1, node2 };
}

auto
make_config(const std::shared_ptr<test::utils::mock_cluster>& cluster) -> relay::core::agent_config
{
  relay::core::agent_config config{};
  config.memd_addresses = { "node1:11210" };
  config.bucket_name = "default";
  config.authenticator = std::make_shared<relay::password_authenticator>("Administrator", "password");
  config.stream_factory = cluster->stream_factory();
  config.timeouts.key_value_timeout = 1s;
  config.timeouts.query_timeout = 2s;
  config.polling.poll_interval = 50ms;
  config.polling.poll_floor = 10ms;
  return config;
}

auto
wait_until_ready(relay::core::agent& agent, std::chrono::milliseconds timeout) -> relay::core::error
{
  auto barrier = std::make_shared<std::promise<relay::core::error>>();
  auto f = barrier->get_future();
  agent.wait_until_ready(timeout, [barrier](relay::core::error err) {
    barrier->set_value(std::move(err));
  });
  return f.get();
}

struct kv_outcome {
  relay::core::kv_response response{};
  relay::core::error err{};
};

auto
get(relay::core::agent& agent, const std::string& key) -> kv_outcome
{
  relay::core::kv_request request{};
  request.opcode = relay::core::protocol::client_opcode::get;
  request.key = key;
  auto barrier = std::make_shared<std::promise<kv_outcome>>();
  auto f = barrier->get_future();
  auto handle = agent.execute(request, [barrier](relay::core::kv_response response, relay::core::error err) {
    barrier->set_value({ std::move(response), std::move(err) });
  });
  if (!handle) {
    return { {}, handle.error() };
  }
  return f.get();
}

struct query_outcome {
  relay::core::error err{};
  std::string header{};
  std::vector<std::string> rows{};
  std::optional<std::string> metadata{};
  std::error_code rows_ec{};
};

void
read_rows(relay::core::query_result result,
          std::shared_ptr<query_outcome> outcome,
          std::shared_ptr<std::promise<void>> barrier)
{
  auto reader = result;
  reader.next_row([result = std::move(result), outcome, barrier](std::error_code ec, std::optional<std::string> row) mutable {
    if (row) {
      outcome->rows.emplace_back(std::move(row.value()));
      return read_rows(std::move(result), std::move(outcome), std::move(barrier));
    }
    outcome->rows_ec = ec;
    outcome->metadata = result.metadata();
    barrier->set_value();
  });
}

auto
n1ql_query(relay::core::agent& agent, const std::string& statement) -> query_outcome
{
  relay::core::n1ql_query_request request{};
  request.payload = relay::core::utils::json::generate(tao::json::value{ { "statement", statement } });
  request.read_only = true;
  request.client_context_id = "ctx-1";

  auto outcome = std::make_shared<query_outcome>();
  auto barrier = std::make_shared<std::promise<void>>();
  auto f = barrier->get_future();
  auto handle = agent.n1ql_query(request, [outcome, barrier](relay::core::query_result result, relay::core::error err) {
    if (err) {
      outcome->err = std::move(err);
      return barrier->set_value();
    }
    outcome->header = result.header();
    read_rows(std::move(result), outcome, barrier);
  });
  if (!handle) {
    outcome->err = handle.error();
    return *outcome;
  }
  f.get();
  return *outcome;
}

auto
query_service(const test::utils::recorded_http_request& request) -> std::optional<test::utils::scripted_http_response>
{
  if (request.path != "/query/service") {
    return test::utils::scripted_http_response{ 404, {}, {} };
  }
  auto statement = relay::core::utils::json::parse(request.body)["statement"].get_string();
  if (statement == "SELECT broken") {
    return test::utils::scripted_http_response{
      400,
      { { "Content-Type", "application/json" } },
      { R"({"requestID":"r2","errors":[{"code":3000,"msg":"syntax error - at broken"}],"status":"fatal"})" },
    };
  }
  return test::utils::scripted_http_response{
    200,
    { { "Content-Type", "application/json" } },
    {
      R"({"requestID":"r1","signature":{"*":"*"},"results":[{"id":)",
      R"(1},{"id":2})",
      R"(,{"id":3}],"status":"success","metrics":{"resultCount":3}})",
    },
  };
}
} // namespace

TEST_CASE("unit: agent executes binary protocol requests", "[unit]")
{
  test::utils::init_logger();
  test::utils::io_runner runner{};
  auto cluster = std::make_shared<test::utils::mock_cluster>();
  cluster->set_config(test::utils::make_cluster_config(1, two_nodes()));
  cluster->on_kv([](const std::string& /* endpoint */, const relay::core::mcbp::packet& request) -> std::optional<relay::core::mcbp::packet> {
    auto key = relay::core::mcbp::to_string(request.key_);
    if (key == "hang") {
      return {};
    }
    if (key == "missing") {
      return test::utils::make_kv_response(request, relay::core::protocol::key_value_status_code::not_found);
    }
    return test::utils::make_kv_response(request, relay::core::protocol::key_value_status_code::success, R"({"key":")" + key + R"("})");
  });

  relay::core::agent agent{ runner.io(), make_config(cluster) };
  agent.start();
  auto ready = wait_until_ready(agent, 1s);
  REQUIRE_SUCCESS(ready.ec);
  REQUIRE(agent.topology());
  REQUIRE(agent.topology()->rev.value_or(0) == 1);
  REQUIRE(agent.bucket_name() == "default");

  SECTION("document is fetched from the node owning its vbucket")
  {
    auto outcome = get(agent, "doc-1");
    REQUIRE_SUCCESS(outcome.err.ec);
    REQUIRE(relay::core::mcbp::to_string(outcome.response.packet.value_) == R"({"key":"doc-1"})");
    REQUIRE((outcome.response.dispatched_to == "node1:11210" || outcome.response.dispatched_to == "node2:11210"));
    REQUIRE(agent.outstanding_operations() == 0);
  }

  SECTION("missing document")
  {
    auto outcome = get(agent, "missing");
    REQUIRE(outcome.err.ec == relay::errc::key_value::document_not_found);
    REQUIRE(outcome.err.ctx["status"].get_unsigned() == 0x01);
  }

  SECTION("request without an opcode is rejected")
  {
    relay::core::kv_request request{};
    request.opcode = relay::core::protocol::client_opcode::invalid;
    request.key = "doc";
    auto handle = agent.execute(request, [](relay::core::kv_response /* response */, relay::core::error /* err */) {});
    REQUIRE_FALSE(handle);
    REQUIRE(handle.error().ec == relay::errc::common::configuration_error);
  }

  SECTION("request times out")
  {
    relay::core::kv_request request{};
    request.key = "hang";
    request.timeout = 100ms;
    auto barrier = std::make_shared<std::promise<relay::core::error>>();
    auto f = barrier->get_future();
    auto handle = agent.execute(request, [barrier](relay::core::kv_response /* response */, relay::core::error err) {
      barrier->set_value(std::move(err));
    });
    REQUIRE(handle);
    auto err = f.get();
    REQUIRE(err.ec == relay::errc::common::timeout);
  }

  SECTION("deadline already in the past")
  {
    relay::core::kv_request request{};
    request.key = "doc-1";
    request.deadline = std::chrono::steady_clock::now() - 1ms;
    auto barrier = std::make_shared<std::promise<relay::core::error>>();
    auto f = barrier->get_future();
    auto handle = agent.execute(request, [barrier](relay::core::kv_response /* response */, relay::core::error err) {
      barrier->set_value(std::move(err));
    });
    REQUIRE(handle);
    auto err = f.get();
    REQUIRE(err.ec == relay::errc::common::timeout);
    REQUIRE(cluster->kv_requests(relay::core::protocol::client_opcode::get) == 0);
    REQUIRE(test::utils::wait_until([&agent]() { return agent.outstanding_operations() == 0; }));
  }

  SECTION("absolute deadline takes precedence over the timeout")
  {
    relay::core::kv_request request{};
    request.key = "hang";
    request.timeout = 10s;
    request.deadline = std::chrono::steady_clock::now() + 100ms;
    auto barrier = std::make_shared<std::promise<relay::core::error>>();
    auto f = barrier->get_future();
    auto handle = agent.execute(request, [barrier](relay::core::kv_response /* response */, relay::core::error err) {
      barrier->set_value(std::move(err));
    });
    REQUIRE(handle);
    REQUIRE(f.wait_for(2s) == std::future_status::ready);
    REQUIRE(f.get().ec == relay::errc::common::timeout);
  }

  SECTION("settled operations leave nothing behind")
  {
    // connections to both storage nodes exist before measuring
    for (int i = 0; i < 16; ++i) {
      auto warmup = get(agent, fmt::format("warmup-{}", i));
      REQUIRE_SUCCESS(warmup.err.ec);
    }
    REQUIRE(test::utils::wait_until([&agent]() { return agent.outstanding_operations() == 0; }));
    const auto baseline_tasks = agent.background_tasks();
    const auto baseline_connections = agent.open_connections();

    constexpr std::size_t number_of_operations{ 60 };
    std::vector<std::shared_ptr<relay::core::pending_operation>> handles{};
    std::vector<std::future<relay::core::error>> results{};
    for (std::size_t i = 0; i < number_of_operations; ++i) {
      relay::core::kv_request request{};
      switch (i % 3) {
        case 0:
          request.key = fmt::format("doc-{}", i);
          break;
        case 1:
          request.key = "hang";
          request.timeout = 10s;
          break;
        default:
          request.key = "hang";
          request.timeout = 50ms;
          break;
      }
      auto barrier = std::make_shared<std::promise<relay::core::error>>();
      results.emplace_back(barrier->get_future());
      auto handle = agent.execute(request, [barrier](relay::core::kv_response /* response */, relay::core::error err) {
        barrier->set_value(std::move(err));
      });
      REQUIRE(handle);
      handles.emplace_back(std::move(handle.value()));
    }
    for (std::size_t i = 1; i < number_of_operations; i += 3) {
      handles[i]->cancel();
    }

    for (std::size_t i = 0; i < number_of_operations; ++i) {
      REQUIRE(results[i].wait_for(5s) == std::future_status::ready);
      auto err = results[i].get();
      switch (i % 3) {
        case 0:
          REQUIRE_SUCCESS(err.ec);
          break;
        case 1:
          REQUIRE(err.ec == relay::errc::common::request_canceled);
          break;
        default:
          REQUIRE(err.ec == relay::errc::common::timeout);
          break;
      }
    }

    REQUIRE(test::utils::wait_until([&agent]() { return agent.outstanding_operations() == 0; }));
    REQUIRE(test::utils::wait_until([&agent, baseline_tasks]() { return agent.background_tasks() <= baseline_tasks; }));
    REQUIRE(test::utils::wait_until(
      [&agent, baseline_connections]() { return agent.open_connections() <= baseline_connections; }));
  }

  SECTION("closing the agent aborts outstanding operations")
  {
    relay::core::kv_request request{};
    request.key = "hang";
    request.timeout = 10s;
    auto barrier = std::make_shared<std::promise<relay::core::error>>();
    auto f = barrier->get_future();
    std::atomic_int invocations{ 0 };
    auto handle = agent.execute(request, [barrier, &invocations](relay::core::kv_response /* response */, relay::core::error err) {
      if (++invocations == 1) {
        barrier->set_value(std::move(err));
      }
    });
    REQUIRE(handle);
    REQUIRE(agent.outstanding_operations() == 1);

    agent.close();
    REQUIRE(f.get().ec == relay::errc::common::cluster_closed);
    REQUIRE(agent.outstanding_operations() == 0);
    REQUIRE(agent.open_connections() == 0);

    auto rejected = get(agent, "doc-1");
    REQUIRE(rejected.err.ec == relay::errc::common::cluster_closed);
    REQUIRE(test::utils::wait_until([&cluster]() { return cluster->open_streams() == 0; }));
    REQUIRE(invocations == 1);
  }

  agent.close();
}

TEST_CASE("unit: agent without topology", "[unit]")
{
  test::utils::init_logger();
  test::utils::io_runner runner{};
  auto cluster = std::make_shared<test::utils::mock_cluster>();

  SECTION("submissions fail fast")
  {
    relay::core::agent agent{ runner.io(), make_config(cluster) };
    agent.start();

    auto outcome = get(agent, "doc-1");
    REQUIRE(outcome.err.ec == relay::errc::common::topology_unavailable);

    auto not_ready = wait_until_ready(agent, 100ms);
    REQUIRE(not_ready.ec == relay::errc::common::timeout);

    agent.close();
    auto closed = wait_until_ready(agent, 100ms);
    REQUIRE(closed.ec == relay::errc::common::cluster_closed);
  }

  SECTION("submissions wait for the first snapshot")
  {
    auto config = make_config(cluster);
    config.wait_for_config = true;
    config.timeouts.key_value_timeout = 5s;
    cluster->on_kv([](const std::string& /* endpoint */, const relay::core::mcbp::packet& request) {
      return std::optional<relay::core::mcbp::packet>{
        test::utils::make_kv_response(request, relay::core::protocol::key_value_status_code::success, "{}")
      };
    });
    relay::core::agent agent{ runner.io(), config };
    agent.start();

    relay::core::kv_request request{};
    request.key = "doc-1";
    auto barrier = std::make_shared<std::promise<relay::core::error>>();
    auto f = barrier->get_future();
    auto handle = agent.execute(request, [barrier](relay::core::kv_response /* response */, relay::core::error err) {
      barrier->set_value(std::move(err));
    });
    REQUIRE(handle);
    REQUIRE(f.wait_for(150ms) == std::future_status::timeout);

    cluster->set_config(test::utils::make_cluster_config(1, two_nodes()));
    REQUIRE(f.wait_for(3s) == std::future_status::ready);
    auto err = f.get();
    REQUIRE_SUCCESS(err.ec);
    agent.close();
  }
}

TEST_CASE("unit: agent streams query rows", "[unit]")
{
  test::utils::init_logger();
  test::utils::io_runner runner{};
  auto cluster = std::make_shared<test::utils::mock_cluster>();
  cluster->set_config(test::utils::make_cluster_config(1, two_nodes()));
  cluster->on_http(query_service);

  relay::core::agent agent{ runner.io(), make_config(cluster) };
  agent.start();
  auto ready = wait_until_ready(agent, 1s);
  REQUIRE_SUCCESS(ready.ec);

  SECTION("rows and metadata")
  {
    auto outcome = n1ql_query(agent, "SELECT id FROM default");
    REQUIRE_SUCCESS(outcome.err.ec);
    REQUIRE_SUCCESS(outcome.rows_ec);
    REQUIRE(outcome.rows == std::vector<std::string>{ R"({"id":1})", R"({"id":2})", R"({"id":3})" });

    auto header = relay::core::utils::json::parse(outcome.header);
    REQUIRE(header["requestID"].get_string() == "r1");

    REQUIRE(outcome.metadata);
    auto metadata = relay::core::utils::json::parse(outcome.metadata.value());
    REQUIRE(metadata["status"].get_string() == "success");
    REQUIRE(metadata["metrics"]["resultCount"].as<std::int64_t>() == 3);

    auto recorded = cluster->http_requests();
    REQUIRE(recorded.size() == 1);
    REQUIRE(recorded[0].method == "POST");
    REQUIRE(recorded[0].headers["client-context-id"] == "ctx-1");
    REQUIRE(recorded[0].headers["authorization"] == "Basic QWRtaW5pc3RyYXRvcjpwYXNzd29yZA==");
    REQUIRE(test::utils::wait_until([&agent]() { return agent.outstanding_operations() == 0; }));
  }

  SECTION("error reported by the service")
  {
    auto outcome = n1ql_query(agent, "SELECT broken");
    REQUIRE(outcome.err.ec == relay::errc::common::internal_server_failure);
    REQUIRE(outcome.err.message == "syntax error - at broken");
    REQUIRE(outcome.err.ctx["http_status"].get_unsigned() == 400);
    REQUIRE(outcome.err.ctx["client_context_id"].get_string() == "ctx-1");
    REQUIRE(outcome.err.ctx["errors"].get_array().size() == 1);
    REQUIRE(cluster->http_requests().size() == 1);
  }

  SECTION("long error document is read to the end")
  {
    cluster->on_http([](const test::utils::recorded_http_request& /* request */) -> std::optional<test::utils::scripted_http_response> {
      std::string results{};
      for (int i = 0; i < 100'000; ++i) {
        results += (i == 0) ? "1" : ",1";
      }
      return test::utils::scripted_http_response{
        500,
        { { "Content-Type", "application/json" } },
        { fmt::format(R"({{"requestID":"r4","results":[{}],"errors":[{{"code":5000,"msg":"out of memory"}}],"status":"errors"}})",
                      results) },
      };
    });
    auto outcome = n1ql_query(agent, "SELECT huge");
    REQUIRE(outcome.err.ec == relay::errc::common::internal_server_failure);
    REQUIRE(outcome.err.message == "out of memory");
    REQUIRE(outcome.err.ctx["http_status"].get_unsigned() == 500);
    REQUIRE(cluster->http_requests().size() == 1);
  }

  SECTION("transient error is retried")
  {
    auto attempts = std::make_shared<std::atomic_int>(0);
    cluster->on_http([attempts](const test::utils::recorded_http_request& request) -> std::optional<test::utils::scripted_http_response> {
      if (attempts->fetch_add(1) == 0) {
        return test::utils::scripted_http_response{
          404,
          { { "Content-Type", "application/json" } },
          { R"({"requestID":"r3","errors":[{"code":4050,"msg":"plan not found"}],"status":"errors"})" },
        };
      }
      return query_service(request);
    });
    auto outcome = n1ql_query(agent, "SELECT id FROM default");
    REQUIRE_SUCCESS(outcome.err.ec);
    REQUIRE(outcome.rows.size() == 3);
    REQUIRE(attempts->load() == 2);
  }

  SECTION("query with a deadline in the past is not sent")
  {
    relay::core::n1ql_query_request request{};
    request.payload = R"({"statement":"SELECT 1"})";
    request.deadline = std::chrono::steady_clock::now() - 10ms;
    auto barrier = std::make_shared<std::promise<relay::core::error>>();
    auto f = barrier->get_future();
    auto handle = agent.n1ql_query(request, [barrier](relay::core::query_result /* result */, relay::core::error err) {
      barrier->set_value(std::move(err));
    });
    REQUIRE(handle);
    REQUIRE(f.get().ec == relay::errc::common::timeout);
    REQUIRE(cluster->http_requests().empty());
  }

  SECTION("search requires an index")
  {
    relay::core::search_query_request request{};
    request.payload = R"({"query":{"match_all":{}}})";
    auto handle = agent.search_query(request, [](relay::core::query_result /* result */, relay::core::error /* err */) {});
    REQUIRE_FALSE(handle);
    REQUIRE(handle.error().ec == relay::errc::common::configuration_error);
  }

  SECTION("service without nodes")
  {
    relay::core::analytics_query_request request{};
    request.payload = R"({"statement":"SELECT 1"})";
    auto handle = agent.analytics_query(request, [](relay::core::query_result /* result */, relay::core::error /* err */) {});
    REQUIRE_FALSE(handle);
    REQUIRE(handle.error().ec == relay::errc::common::service_not_available);
  }

  agent.close();
}

TEST_CASE("unit: agent reports spans", "[unit]")
{
  test::utils::init_logger();
  test::utils::io_runner runner{};
  auto cluster = std::make_shared<test::utils::mock_cluster>();
  cluster->set_config(test::utils::make_cluster_config(1, two_nodes()));
  cluster->on_kv([](const std::string& /* endpoint */, const relay::core::mcbp::packet& request) {
    return std::optional<relay::core::mcbp::packet>{
      test::utils::make_kv_response(request, relay::core::protocol::key_value_status_code::not_found)
    };
  });

  auto tracer = std::make_shared<recording_tracer>();
  auto config = make_config(cluster);
  config.tracer = tracer;
  relay::core::agent agent{ runner.io(), config };
  agent.start();
  auto ready = wait_until_ready(agent, 1s);
  REQUIRE_SUCCESS(ready.ec);

  auto outcome = get(agent, "missing");
  REQUIRE(outcome.err.ec == relay::errc::key_value::document_not_found);

  REQUIRE(test::utils::wait_until([&tracer]() {
    auto spans = tracer->spans("get");
    return spans.size() == 1 && spans[0].ended;
  }));
  auto operation = tracer->spans("get").at(0);
  REQUIRE(operation.parent.empty());
  REQUIRE(operation.tags["db.system"] == "relay");
  REQUIRE(operation.tags["db.operation"] == "get");
  REQUIRE(operation.tags["db.relay.retries"] == "0");
  REQUIRE(operation.tags["db.relay.outcome"] == outcome.err.ec.message());

  bool dispatched{ false };
  for (const auto& step : tracer->spans("dispatch_to_server")) {
    if (step.parent == "get") {
      dispatched = true;
      REQUIRE(step.ended);
      REQUIRE(step.tags["db.relay.remote_socket"] == outcome.err.ctx["last_dispatched_to"].get_string());
    }
  }
  REQUIRE(dispatched);

  agent.close();
}

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

#include "core/circuit_breaker.hxx"
#include "core/dispatcher.hxx"
#include "core/topology/config_source.hxx"
#include "core/topology/configuration.hxx"
#include "core/topology_manager.hxx"

#include <relay/error_codes.hxx>

#include <asio/post.hpp>

#include <atomic>
#include <future>
#include <map>
#include <mutex>
#include <set>

using namespace std::chrono_literals;

namespace
{
/**
 * Answers fetches from a table of maps keyed by endpoint. Endpoints missing from the table fail
 * with service_not_available.
 */
class scripted_config_source : public relay::core::topology::config_source
{
public:
  scripted_config_source(asio::io_context& io, std::vector<std::string> seeds)
    : io_{ io }
    , seeds_{ std::move(seeds) }
  {
  }

  [[nodiscard]] auto name() const -> const char* override
  {
    return "scripted";
  }

  [[nodiscard]] auto endpoints(const std::shared_ptr<const relay::core::topology::configuration>& /* current */,
                               const std::string& /* network */) const -> std::vector<std::string> override
  {
    return seeds_;
  }

  auto fetch(const std::string& endpoint, fetch_handler&& handler)
    -> std::shared_ptr<relay::core::pending_operation> override
  {
    std::optional<std::string> body{};
    {
      const std::scoped_lock lock(mutex_);
      ++fetches_[endpoint];
      if (auto it = configs_.find(endpoint); it != configs_.end()) {
        body = it->second;
      }
    }
    asio::post(io_, [endpoint, body, handler = std::move(handler)]() mutable {
      if (!body) {
        return handler(relay::errc::common::service_not_available, {});
      }
      handler({}, relay::core::topology::parse_configuration(body.value(), relay::core::split_endpoint(endpoint).first));
    });
    return {};
  }

  void serve(const std::string& endpoint, std::string config)
  {
    const std::scoped_lock lock(mutex_);
    configs_[endpoint] = std::move(config);
  }

  [[nodiscard]] auto fetches(const std::string& endpoint) const -> std::size_t
  {
    const std::scoped_lock lock(mutex_);
    if (auto it = fetches_.find(endpoint); it != fetches_.end()) {
      return it->second;
    }
    return 0;
  }

  [[nodiscard]] auto total_fetches() const -> std::size_t
  {
    const std::scoped_lock lock(mutex_);
    std::size_t total{ 0 };
    for (const auto& [endpoint, count] : fetches_) {
      total += count;
    }
    return total;
  }

private:
  asio::io_context& io_;
  std::vector<std::string> seeds_;
  mutable std::mutex mutex_{};
  std::map<std::string, std::string> configs_{};
  std::map<std::string, std::size_t> fetches_{};
};

auto
three_nodes() -> std::vector<test::utils::mock_node>
{
  return {
    { "node1", 11210, 8091, 8093, {}, {}, {} },
    { "node2", 11210, 8091, 8093, {}, {}, {} },
    { "node3", 11210, 8091, {}, {}, {}, {} },
  };
}

auto
wait_ready(const std::shared_ptr<relay::core::topology_manager>& manager, std::chrono::milliseconds timeout)
  -> std::error_code
{
  auto barrier = std::make_shared<std::promise<std::error_code>>();
  auto f = barrier->get_future();
  manager->wait_for_config(timeout, [barrier](std::error_code ec) {
    barrier->set_value(ec);
  });
  return f.get();
}

auto
breakers() -> std::shared_ptr<relay::core::circuit_breaker_registry>
{
  relay::core::circuit_breaker_config config{};
  config.policy = relay::core::circuit_breaker_policy::consecutive_failures;
  config.failure_threshold = 1;
  config.sleep_window = 1h;
  return std::make_shared<relay::core::circuit_breaker_registry>(config);
}
} // namespace

TEST_CASE("unit: parse cluster map", "[unit]")
{
  test::utils::init_logger();

  auto config =
    relay::core::topology::parse_configuration(test::utils::make_cluster_config(42, three_nodes(), "travel", 16), "node1");
  REQUIRE(config.rev == 42);
  REQUIRE_FALSE(config.epoch.has_value());
  REQUIRE(config.rev_str() == "42");
  REQUIRE(config.bucket == "travel");
  REQUIRE(config.nodes.size() == 3);
  REQUIRE(config.nodes[1].hostname == "node2");
  REQUIRE(config.nodes[1].index == 1);
  REQUIRE(config.nodes[0].services_plain.key_value == 11210);
  REQUIRE(config.nodes[2].services_plain.query == std::nullopt);
  REQUIRE(config.vbmap.has_value());
  REQUIRE(config.vbmap->size() == 16);
  REQUIRE(config.num_replicas == 0);

  REQUIRE(config.endpoints_for("default", relay::service_type::query, false) ==
          std::vector<std::string>{ "node1:8093", "node2:8093" });
  REQUIRE(config.endpoints_for("default", relay::service_type::key_value, false).size() == 3);
  REQUIRE(config.endpoints_for("default", relay::service_type::analytics, false).empty());
  REQUIRE(config.nodes[2].endpoint("default", relay::service_type::query, false) == std::nullopt);
}

TEST_CASE("unit: parse cluster map with revision epoch and host placeholder", "[unit]")
{
  test::utils::init_logger();

  const std::string input = R"({
  "rev": 7,
  "revEpoch": 2,
  "nodesExt": [
    {
      "hostname": "$HOST",
      "thisNode": true,
      "services": { "kv": 11210, "kvSSL": 11207, "mgmt": 8091, "n1ql": 8093 },
      "alternateAddresses": {
        "external": { "hostname": "public.example.com", "ports": { "kv": 31210, "n1ql": 38093 } }
      }
    }
  ]
})";

  auto config = relay::core::topology::parse_configuration(input, "10.0.0.5");
  REQUIRE(config.epoch == 2);
  REQUIRE(config.rev_str() == "2:7");
  REQUIRE(config.nodes.size() == 1);
  REQUIRE(config.nodes[0].this_node);
  REQUIRE(config.nodes[0].hostname == "10.0.0.5");
  REQUIRE(config.nodes[0].services_tls.key_value == 11207);
  REQUIRE_FALSE(config.vbmap.has_value());

  SECTION("network is detected from the bootstrap hostname")
  {
    REQUIRE(config.select_network("10.0.0.5") == "default");
    REQUIRE(config.select_network("public.example.com") == "external");
    REQUIRE(config.select_network("unknown.example.com") == "default");
  }

  SECTION("alternate addresses are used on the external network")
  {
    REQUIRE(config.nodes[0].endpoint("external", relay::service_type::key_value, false) == "public.example.com:31210");
    REQUIRE(config.nodes[0].endpoint("external", relay::service_type::query, false) == "public.example.com:38093");
    REQUIRE(config.nodes[0].endpoint("default", relay::service_type::key_value, true) == "10.0.0.5:11207");
  }

  SECTION("epoch takes precedence over revision")
  {
    relay::core::topology::configuration older{};
    older.epoch = 1;
    older.rev = 100;
    REQUIRE(older < config);
    REQUIRE(config > older);

    relay::core::topology::configuration same{};
    same.epoch = 2;
    same.rev = 7;
    REQUIRE(same == config);
    REQUIRE_FALSE(same < config);
  }
}

TEST_CASE("unit: parse cluster map rejects malformed input", "[unit]")
{
  test::utils::init_logger();

  REQUIRE_THROWS(relay::core::topology::parse_configuration("{", "node1"));
  REQUIRE_THROWS(relay::core::topology::parse_configuration(R"({"rev": 1, "nodesExt": [{"hostname": "a"}]})", "node1"));
}

TEST_CASE("unit: keys map to the owner of their vbucket", "[unit]")
{
  test::utils::init_logger();

  auto config = relay::core::topology::parse_configuration(test::utils::make_cluster_config(1, three_nodes()), "node1");
  for (const auto* key : { "airline_10", "hotel_42", "route_7", "" }) {
    auto [vbucket, index] = config.map_key(key);
    REQUIRE(vbucket < 8);
    REQUIRE(index.has_value());
    REQUIRE(index.value() == vbucket % 3);
    REQUIRE(config.map_key(key) == std::make_pair(vbucket, index));
  }

  relay::core::topology::configuration no_map{};
  REQUIRE_FALSE(no_map.map_key("key").second.has_value());
}

TEST_CASE("unit: topology manager publishes only newer revisions", "[unit]")
{
  test::utils::init_logger();
  test::utils::io_runner runner{};
  auto source = std::make_shared<scripted_config_source>(runner.io(), std::vector<std::string>{});
  auto manager = std::make_shared<relay::core::topology_manager>(
    runner.io(), relay::core::topology_manager_options{}, breakers(), std::vector<std::shared_ptr<relay::core::topology::config_source>>{ source });

  REQUIRE_FALSE(manager->current());

  auto parse = [](std::int64_t rev) {
    return relay::core::topology::parse_configuration(test::utils::make_cluster_config(rev, three_nodes()), "node1");
  };

  REQUIRE(manager->update(parse(5), "node1"));
  auto first = manager->current();
  REQUIRE(first);
  REQUIRE(first->rev == 5);
  REQUIRE(manager->network() == "default");

  REQUIRE_FALSE(manager->update(parse(5), "node1"));
  REQUIRE_FALSE(manager->update(parse(3), "node1"));
  REQUIRE(manager->current() == first);

  REQUIRE(manager->update(parse(6), "node1"));
  REQUIRE(manager->current()->rev == 6);
  REQUIRE(first->rev == 5);

  REQUIRE(manager->has_service(relay::service_type::query));
  REQUIRE_FALSE(manager->has_service(relay::service_type::search));
  manager->close();
}

TEST_CASE("unit: topology manager falls back to the next endpoint", "[unit]")
{
  test::utils::init_logger();
  test::utils::io_runner runner{};
  auto primary = std::make_shared<scripted_config_source>(runner.io(), std::vector<std::string>{ "node1:11210" });
  auto secondary = std::make_shared<scripted_config_source>(runner.io(), std::vector<std::string>{ "node1:8091", "node2:8091" });
  secondary->serve("node2:8091", test::utils::make_cluster_config(3, three_nodes()));

  relay::core::topology_manager_options options{};
  options.poll_interval = 1h;
  auto manager = std::make_shared<relay::core::topology_manager>(
    runner.io(), options, breakers(), std::vector<std::shared_ptr<relay::core::topology::config_source>>{ primary, secondary });
  manager->start();

  auto ready = wait_ready(manager, 1s);
  REQUIRE_SUCCESS(ready);
  REQUIRE(manager->current()->rev == 3);
  REQUIRE(primary->fetches("node1:11210") == 1);
  REQUIRE(secondary->fetches("node1:8091") == 1);
  REQUIRE(secondary->fetches("node2:8091") == 1);

  SECTION("waiting for a config that is already there completes immediately")
  {
    auto again = wait_ready(manager, 1ms);
    REQUIRE_SUCCESS(again);
  }

  manager->close();
}

TEST_CASE("unit: topology manager keeps polling until the first map arrives", "[unit]")
{
  test::utils::init_logger();
  test::utils::io_runner runner{};
  auto source = std::make_shared<scripted_config_source>(runner.io(), std::vector<std::string>{ "node1:11210" });

  relay::core::topology_manager_options options{};
  options.poll_floor = 5ms;
  options.poll_interval = 20ms;
  auto manager = std::make_shared<relay::core::topology_manager>(
    runner.io(), options, breakers(), std::vector<std::shared_ptr<relay::core::topology::config_source>>{ source });
  manager->start();

  SECTION("waiter times out")
  {
    REQUIRE(wait_ready(manager, 50ms) == relay::errc::common::timeout);
    REQUIRE(source->fetches("node1:11210") > 1);
  }

  SECTION("map served later is picked up")
  {
    REQUIRE(test::utils::wait_until([&source]() { return source->fetches("node1:11210") >= 2; }));
    source->serve("node1:11210", test::utils::make_cluster_config(1, three_nodes()));
    auto ready = wait_ready(manager, 2s);
    REQUIRE_SUCCESS(ready);
    REQUIRE(manager->current()->rev == 1);
  }

  SECTION("closing wakes up waiters")
  {
    auto barrier = std::make_shared<std::promise<std::error_code>>();
    auto f = barrier->get_future();
    manager->wait_for_config(10s, [barrier](std::error_code ec) {
      barrier->set_value(ec);
    });
    manager->close();
    REQUIRE(f.get() == relay::errc::common::cluster_closed);
  }

  manager->close();
}

TEST_CASE("unit: topology manager coalesces refresh requests", "[unit]")
{
  test::utils::init_logger();
  test::utils::io_runner runner{};
  auto source = std::make_shared<scripted_config_source>(runner.io(), std::vector<std::string>{ "node1:11210" });
  source->serve("node1:11210", test::utils::make_cluster_config(1, three_nodes()));

  relay::core::topology_manager_options options{};
  options.poll_floor = 200ms;
  options.poll_interval = 1h;
  auto manager = std::make_shared<relay::core::topology_manager>(
    runner.io(), options, breakers(), std::vector<std::shared_ptr<relay::core::topology::config_source>>{ source });
  manager->start();
  auto ready = wait_ready(manager, 1s);
  REQUIRE_SUCCESS(ready);

  std::atomic_size_t notified{ 0 };
  for (int i = 0; i < 10; ++i) {
    manager->on_next_refresh([&notified]() {
      ++notified;
    });
  }
  auto canceled = manager->on_next_refresh([&notified]() {
    notified += 100;
  });
  manager->cancel_waiter(canceled);

  REQUIRE(test::utils::wait_until([&notified]() { return notified == 10; }, 2s));
  REQUIRE(source->total_fetches() <= 2);
  manager->close();
  REQUIRE(notified == 10);
}

TEST_CASE("unit: topology manager selects nodes", "[unit]")
{
  test::utils::init_logger();
  test::utils::io_runner runner{};
  auto registry = breakers();
  auto manager = std::make_shared<relay::core::topology_manager>(
    runner.io(), relay::core::topology_manager_options{}, registry, std::vector<std::shared_ptr<relay::core::topology::config_source>>{});
  relay::core::attempt_context ctx{};

  SECTION("nothing to select without a map")
  {
    auto selection = manager->select_node(relay::service_type::query, ctx);
    REQUIRE_FALSE(selection);
    REQUIRE(selection.error() == relay::errc::common::topology_unavailable);
  }

  auto config = relay::core::topology::parse_configuration(test::utils::make_cluster_config(1, three_nodes()), "node1");
  REQUIRE(manager->update(config, "node1"));

  SECTION("keys are routed to the vbucket owner")
  {
    auto [vbucket, index] = config.map_key("airline_10");
    auto selection = manager->select_node(relay::service_type::key_value, ctx, "airline_10");
    REQUIRE(selection);
    REQUIRE(selection->vbucket == vbucket);
    REQUIRE(selection->endpoint == fmt::format("node{}:11210", index.value() + 1));
  }

  SECTION("requests without key are spread over the nodes")
  {
    std::set<std::string> seen{};
    for (int i = 0; i < 4; ++i) {
      auto selection = manager->select_node(relay::service_type::query, ctx);
      REQUIRE(selection);
      REQUIRE_FALSE(selection->vbucket.has_value());
      seen.insert(selection->endpoint);
    }
    REQUIRE(seen == std::set<std::string>{ "node1:8093", "node2:8093" });
  }

  SECTION("service missing from the map")
  {
    auto selection = manager->select_node(relay::service_type::search, ctx);
    REQUIRE_FALSE(selection);
    REQUIRE(selection.error() == relay::errc::common::service_not_available);
  }

  SECTION("retry targets")
  {
    ctx.last_dispatched_to = "node2:8093";
    ctx.target = relay::retry_target::preserve;
    for (int i = 0; i < 3; ++i) {
      REQUIRE(manager->select_node(relay::service_type::query, ctx)->endpoint == "node2:8093");
    }
    ctx.target = relay::retry_target::avoid_last;
    for (int i = 0; i < 3; ++i) {
      REQUIRE(manager->select_node(relay::service_type::query, ctx)->endpoint == "node1:8093");
    }
  }

  SECTION("open breakers are skipped")
  {
    registry->report("node1:8093",
                     relay::service_type::query,
                     registry->allow("node1:8093", relay::service_type::query).value(),
                     relay::core::circuit_outcome::failure);
    for (int i = 0; i < 3; ++i) {
      REQUIRE(manager->select_node(relay::service_type::query, ctx)->endpoint == "node2:8093");
    }

    ctx.last_dispatched_to = "node1:8093";
    ctx.target = relay::retry_target::preserve;
    REQUIRE(manager->select_node(relay::service_type::query, ctx)->endpoint == "node2:8093");

    registry->report("node2:8093",
                     relay::service_type::query,
                     registry->allow("node2:8093", relay::service_type::query).value(),
                     relay::core::circuit_outcome::failure);
    auto selection = manager->select_node(relay::service_type::query, ctx);
    REQUIRE_FALSE(selection);
    REQUIRE(selection.error() == relay::errc::common::circuit_open);
  }

  manager->close();
}

TEST_CASE("unit: HTTP config source bounds the size of the map", "[unit]")
{
  test::utils::init_logger();
  test::utils::io_runner runner{};
  auto cluster = std::make_shared<test::utils::mock_cluster>();

  relay::core::dispatcher_options options{};
  options.bucket_name = "default";
  options.user_agent = "relay/test";
  options.stream_factory = cluster->stream_factory();
  options.http_connect_timeout = 1s;
  auto transport = std::make_shared<relay::core::dispatcher>(runner.io(), options, breakers());
  relay::core::topology::http_config_source source{ runner.io(), transport, { "node1:8091" }, false, "default", 5s, 10ms };

  auto fetch = [&source]() {
    auto barrier = std::make_shared<std::promise<std::pair<std::error_code, std::optional<relay::core::topology::configuration>>>>();
    auto f = barrier->get_future();
    source.fetch("node1:8091", [barrier](std::error_code ec, std::optional<relay::core::topology::configuration> config) {
      barrier->set_value({ ec, std::move(config) });
    });
    return f.get();
  };

  auto config = test::utils::make_cluster_config(7, three_nodes());

  SECTION("regular map")
  {
    cluster->set_config(config);
    auto [ec, parsed] = fetch();
    REQUIRE_SUCCESS(ec);
    REQUIRE(parsed);
    REQUIRE(parsed->rev == 7);
  }

  SECTION("oversized map")
  {
    config.append(relay::core::topology::max_config_size, ' ');
    cluster->set_config(config);
    auto [ec, parsed] = fetch();
    REQUIRE(ec == relay::errc::common::protocol_failure);
    REQUIRE_FALSE(parsed);
  }

  transport->close();
}

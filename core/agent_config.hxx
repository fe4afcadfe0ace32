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

#pragma once

#include "circuit_breaker_config.hxx"
#include "error.hxx"
#include "io/streams.hxx"

#include <relay/authenticator.hxx>
#include <relay/retry_strategy.hxx>
#include <relay/service_type.hxx>
#include <relay/tracing/request_tracer.hxx>

#include <asio/ssl/context.hpp>
#include <tl/expected.hpp>

#include <chrono>
#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace relay::core
{
enum class log_redaction {
  none,
  /**
   * user data (document keys, bucket names) is wrapped into <ud></ud>
   */
  partial,
  /**
   * hostnames are wrapped too
   */
  full,
};

struct timeout_config {
  static constexpr std::chrono::milliseconds default_connect_timeout{ 10'000 };
  static constexpr std::chrono::milliseconds default_key_value_connect_timeout{ 7'000 };
  static constexpr std::chrono::milliseconds default_key_value_timeout{ 2'500 };
  static constexpr std::chrono::milliseconds default_query_timeout{ 75'000 };
  static constexpr std::chrono::milliseconds default_analytics_timeout{ 75'000 };
  static constexpr std::chrono::milliseconds default_search_timeout{ 75'000 };
  static constexpr std::chrono::milliseconds default_view_timeout{ 75'000 };
  static constexpr std::chrono::milliseconds default_management_timeout{ 75'000 };

  std::chrono::milliseconds connect_timeout{ default_connect_timeout };
  std::chrono::milliseconds key_value_connect_timeout{ default_key_value_connect_timeout };
  std::chrono::milliseconds key_value_timeout{ default_key_value_timeout };
  std::chrono::milliseconds query_timeout{ default_query_timeout };
  std::chrono::milliseconds analytics_timeout{ default_analytics_timeout };
  std::chrono::milliseconds search_timeout{ default_search_timeout };
  std::chrono::milliseconds view_timeout{ default_view_timeout };
  std::chrono::milliseconds management_timeout{ default_management_timeout };

  [[nodiscard]] auto for_service(service_type service) const -> std::chrono::milliseconds;
  [[nodiscard]] auto to_string() const -> std::string;
};

struct polling_config {
  /**
   * period of the topology refresh loop
   */
  std::chrono::milliseconds poll_interval{ std::chrono::milliseconds{ 2'500 } };

  /**
   * on-demand refreshes closer to each other than this are coalesced
   */
  std::chrono::milliseconds poll_floor{ std::chrono::milliseconds{ 50 } };

  /**
   * time allowed for a single binary configuration request
   */
  std::chrono::milliseconds poll_timeout{ std::chrono::milliseconds{ 2'500 } };

  /**
   * time the HTTP configuration source waits after a failed request before trying the next node
   */
  std::chrono::milliseconds http_retry_delay{ std::chrono::seconds{ 10 } };

  [[nodiscard]] auto to_string() const -> std::string;
};

struct connection_config {
  /**
   * binary protocol connections per storage node
   */
  std::size_t kv_pool_size{ 1 };

  /**
   * requests allowed to wait for a connection, per endpoint
   */
  std::size_t max_queue_size{ 2048 };

  std::size_t max_idle_http_connections{ 64 };
  std::size_t max_perhost_idle_http_connections{ 16 };
  std::chrono::milliseconds idle_http_connection_timeout{ std::chrono::milliseconds{ 4'500 } };

  bool use_compression{ true };
  std::size_t compression_min_size{ 32 };
  double compression_min_ratio{ 0.83 };
  bool use_mutation_tokens{ true };
  bool use_server_durations{ true };

  [[nodiscard]] auto to_string() const -> std::string;
};

/**
 * Static configuration snapshot of an agent. Read-only once the agent has been constructed.
 */
struct agent_config {
  /**
   * host:port of the binary protocol endpoints used to bootstrap
   */
  std::vector<std::string> memd_addresses{};

  /**
   * host:port of the management endpoints used to bootstrap
   */
  std::vector<std::string> http_addresses{};

  bool use_tls{ false };
  std::shared_ptr<asio::ssl::context> tls_context{};

  std::string bucket_name{};
  /**
   * Empty selects the network from the address used to bootstrap.
   */
  std::string network{};
  std::string user_agent{ "relay/1.0.0" };

  std::shared_ptr<relay::authenticator> authenticator{};
  std::shared_ptr<relay::tracing::request_tracer> tracer{};
  std::shared_ptr<relay::retry_strategy> default_retry_strategy{};
  circuit_breaker_config circuit_breaker{};

  timeout_config timeouts{};
  polling_config polling{};
  connection_config connections{};

  /**
   * Operations submitted before the first topology snapshot wait for it (bounded by their
   * deadline) instead of failing with topology_unavailable.
   */
  bool wait_for_config{ false };

  log_redaction redaction{ log_redaction::none };

  /**
   * Creates the transport streams. When empty, plain or TLS sockets are used depending on
   * use_tls.
   */
  io::stream_factory stream_factory{};

  [[nodiscard]] auto to_string() const -> std::string;

  /**
   * Builds the configuration from couchbase[s]://host[:port][=mode],...[/bucket][?key=value&...]
   *
   * Malformed options are reported as configuration_error naming the option, unknown options
   * are logged and ignored.
   */
  static auto from_connection_string(const std::string& input) -> tl::expected<agent_config, error>;
};

/**
 * TLS client context. Without a CA certificate the peer is not verified.
 */
auto
make_tls_context(const std::string& ca_cert_path = {}) -> tl::expected<std::shared_ptr<asio::ssl::context>, error>;

/**
 * Wraps user data into <ud></ud> tags, according to the redaction level.
 */
auto
redact_user_data(log_redaction redaction, const std::string& value) -> std::string;

auto
redact_system_data(log_redaction redaction, const std::string& value) -> std::string;
} // namespace relay::core

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

#include "error.hxx"
#include "pending_operation.hxx"
#include "io/connection_pool.hxx"
#include "io/http_message.hxx"
#include "io/streams.hxx"
#include "mcbp/packet.hxx"
#include "utils/movable_function.hxx"

#include <relay/authenticator.hxx>
#include <relay/retry_reason.hxx>
#include <relay/service_type.hxx>
#include <relay/tracing/request_span.hxx>
#include <relay/tracing/request_tracer.hxx>

#include <chrono>
#include <cstddef>
#include <memory>
#include <string>
#include <utility>

namespace asio
{
class io_context;
} // namespace asio

namespace relay::core
{
class circuit_breaker_registry;
class dispatcher_impl;

struct dispatcher_options {
  std::string bucket_name{};
  std::string user_agent{};
  std::shared_ptr<relay::authenticator> authenticator{};
  std::shared_ptr<relay::tracing::request_tracer> tracer{};
  io::stream_factory stream_factory{};
  std::chrono::milliseconds kv_connect_timeout{ std::chrono::seconds{ 7 } };
  std::chrono::milliseconds http_connect_timeout{ std::chrono::seconds{ 10 } };
  bool use_compression{ true };
  std::size_t compression_min_size{ 32 };
  double compression_min_ratio{ 0.83 };
  bool use_mutation_tokens{ true };
  bool use_server_durations{ true };
  io::connection_pool_options kv_pool{};
  io::connection_pool_options http_pool{};
};

/**
 * Where an exchange went and how it ended, from the transport point of view.
 */
struct dispatch_info {
  std::string dispatched_to{};
  std::string dispatched_from{};
  retry_reason reason{ retry_reason::do_not_retry };
};

struct kv_exchange_result {
  mcbp::packet response{};
  dispatch_info info{};
};

struct http_exchange_result {
  io::http_response response{};
  dispatch_info info{};
};

/**
 * Binds requests to pooled connections and drives the exchange. Consults the circuit breaker
 * before dispatch and reports the outcome of every exchange to it.
 *
 * Transport failures are reported with the retry reason that describes them, the dispatcher
 * itself never retries.
 */
class dispatcher
{
public:
  using kv_handler = utils::movable_function<void(error, kv_exchange_result)>;
  using http_handler = utils::movable_function<void(error, http_exchange_result)>;

  dispatcher(asio::io_context& io,
             dispatcher_options options,
             std::shared_ptr<circuit_breaker_registry> breakers);
  dispatcher(const dispatcher&) = delete;
  dispatcher(dispatcher&&) = delete;
  auto operator=(const dispatcher&) -> dispatcher& = delete;
  auto operator=(dispatcher&&) -> dispatcher& = delete;
  ~dispatcher();

  /**
   * The handler is invoked exactly once, unless the returned exchange is canceled first. It is
   * never invoked from within this call.
   *
   * @param endpoint host:port of the binary protocol endpoint
   * @param use_breaker topology polling bypasses the breaker
   */
  auto send_kv(const std::string& endpoint,
               mcbp::packet request,
               std::shared_ptr<relay::tracing::request_span> parent_span,
               kv_handler&& handler,
               bool use_breaker = true) -> std::shared_ptr<pending_operation>;

  /**
   * Completes once the response headers arrived. The body is streamed through
   * http_response::body, the connection returns to its pool once the body has been read
   * completely.
   *
   * 503, 429 and 401 responses are reported as failures.
   */
  auto send_http(const std::string& endpoint,
                 io::http_request request,
                 std::shared_ptr<relay::tracing::request_span> parent_span,
                 http_handler&& handler,
                 bool use_breaker = true) -> std::shared_ptr<pending_operation>;

  /**
   * Closes every pool. Pending and later exchanges fail with cluster_closed.
   */
  void close();

  [[nodiscard]] auto idle_connections() const -> std::size_t;
  [[nodiscard]] auto open_connections() const -> std::size_t;

private:
  std::shared_ptr<dispatcher_impl> impl_;
};

/**
 * Splits host:port, [ipv6]:port is accepted.
 */
auto
split_endpoint(const std::string& endpoint) -> std::pair<std::string, std::string>;
} // namespace relay::core

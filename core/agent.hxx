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

#include "agent_config.hxx"
#include "error.hxx"
#include "http_component.hxx"
#include "kv_component.hxx"
#include "pending_operation.hxx"
#include "query_component.hxx"
#include "topology/configuration.hxx"
#include "utils/movable_function.hxx"

#include <tl/expected.hpp>

#include <chrono>
#include <cstddef>
#include <memory>
#include <string>

namespace asio
{
class io_context;
} // namespace asio

namespace relay::core
{
class agent_impl;

/**
 * Entry point of the engine: owns the topology, the transport and the components, and exposes
 * them as "submit, get a handle, get exactly one callback" operations.
 *
 * Every submission either fails synchronously (invalid request, no node can take it, agent
 * closed) or returns a handle whose callback fires exactly once.
 */
class agent
{
public:
  agent(asio::io_context& io, agent_config config);
  agent(const agent&) = delete;
  agent(agent&&) = delete;
  auto operator=(const agent&) -> agent& = delete;
  auto operator=(agent&&) -> agent& = delete;
  ~agent();

  /**
   * Starts bootstrap and the topology refresh loop.
   */
  void start();

  /**
   * Invokes the handler once the first topology snapshot is available, or with timeout.
   */
  void wait_until_ready(std::chrono::milliseconds timeout, utils::movable_function<void(error)>&& handler);

  auto execute(kv_request request, kv_callback&& callback)
    -> tl::expected<std::shared_ptr<pending_operation>, error>;

  auto http_request(core::http_request request, http_callback&& callback)
    -> tl::expected<std::shared_ptr<pending_operation>, error>;

  auto analytics_query(analytics_query_request request, query_callback&& callback)
    -> tl::expected<std::shared_ptr<pending_operation>, error>;

  auto n1ql_query(n1ql_query_request request, query_callback&& callback)
    -> tl::expected<std::shared_ptr<pending_operation>, error>;

  auto search_query(search_query_request request, query_callback&& callback)
    -> tl::expected<std::shared_ptr<pending_operation>, error>;

  auto view_query(view_query_request request, query_callback&& callback)
    -> tl::expected<std::shared_ptr<pending_operation>, error>;

  [[nodiscard]] auto topology() const -> std::shared_ptr<const topology::configuration>;
  [[nodiscard]] auto bucket_name() const -> const std::string&;

  /**
   * Cancels every outstanding operation with cluster_closed, stops polling and closes the pools.
   * Later submissions fail with cluster_closed.
   */
  void close();

  [[nodiscard]] auto outstanding_operations() const -> std::size_t;
  [[nodiscard]] auto background_tasks() const -> std::size_t;
  [[nodiscard]] auto open_connections() const -> std::size_t;

private:
  std::shared_ptr<agent_impl> impl_;
};
} // namespace relay::core

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
#include "pending_operation.hxx"
#include "query_result.hxx"
#include "utils/movable_function.hxx"

#include <relay/retry_strategy.hxx>
#include <relay/service_type.hxx>
#include <relay/tracing/request_span.hxx>

#include <tao/json/forward.hpp>
#include <tl/expected.hpp>

#include <chrono>
#include <memory>
#include <optional>
#include <string>

namespace relay::core
{
struct component_context;
class query_component_impl;

struct analytics_query_request {
  /**
   * Encoded JSON body (statement, parameters, client_context_id, ...).
   */
  std::string payload{};
  bool priority{ false };
  bool read_only{ false };
  std::string client_context_id{};
  std::string endpoint{};
  std::optional<std::chrono::steady_clock::time_point> deadline{};
  std::chrono::milliseconds timeout{ 0 };
  std::shared_ptr<retry_strategy> retry_strategy{};
  std::shared_ptr<relay::tracing::request_span> parent_span{};
};

struct n1ql_query_request {
  std::string payload{};
  bool read_only{ false };
  std::string client_context_id{};
  std::string endpoint{};
  std::optional<std::chrono::steady_clock::time_point> deadline{};
  std::chrono::milliseconds timeout{ 0 };
  std::shared_ptr<retry_strategy> retry_strategy{};
  std::shared_ptr<relay::tracing::request_span> parent_span{};
};

struct search_query_request {
  std::string index_name{};
  std::string payload{};
  std::string client_context_id{};
  std::string endpoint{};
  std::optional<std::chrono::steady_clock::time_point> deadline{};
  std::chrono::milliseconds timeout{ 0 };
  std::shared_ptr<retry_strategy> retry_strategy{};
  std::shared_ptr<relay::tracing::request_span> parent_span{};
};

struct view_query_request {
  std::string design_document_name{};
  std::string view_name{};
  bool development{ false };

  /**
   * Encoded query string without the leading '?', e.g. "limit=10&stale=false".
   */
  std::string query_string{};

  /**
   * Sent with POST when present (typically {"keys": [...]}).
   */
  std::optional<std::string> body{};
  std::string endpoint{};
  std::optional<std::chrono::steady_clock::time_point> deadline{};
  std::chrono::milliseconds timeout{ 0 };
  std::shared_ptr<retry_strategy> retry_strategy{};
  std::shared_ptr<relay::tracing::request_span> parent_span{};
};

using query_callback = utils::movable_function<void(query_result result, error err)>;

/**
 * Row-oriented queries over HTTP. The result is surfaced once the response metadata preceding the
 * rows has been checked for errors, rows are streamed afterwards.
 */
class query_component
{
public:
  query_component(const component_context& ctx, timeout_config timeouts, std::string bucket_name);

  auto analytics_query(analytics_query_request request, query_callback&& callback)
    -> tl::expected<std::shared_ptr<pending_operation>, error>;
  auto n1ql_query(n1ql_query_request request, query_callback&& callback)
    -> tl::expected<std::shared_ptr<pending_operation>, error>;
  auto search_query(search_query_request request, query_callback&& callback)
    -> tl::expected<std::shared_ptr<pending_operation>, error>;
  auto view_query(view_query_request request, query_callback&& callback)
    -> tl::expected<std::shared_ptr<pending_operation>, error>;

private:
  std::shared_ptr<query_component_impl> impl_;
};

/**
 * @return true if the service reported a condition that goes away by itself (index being built,
 * queue full, ...)
 */
[[nodiscard]] auto
is_retryable_query_error(service_type service, const tao::json::value& entry) -> bool;
} // namespace relay::core

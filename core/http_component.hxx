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
#include "io/http_message.hxx"
#include "pending_operation.hxx"
#include "utils/movable_function.hxx"

#include <relay/retry_strategy.hxx>
#include <relay/service_type.hxx>
#include <relay/tracing/request_span.hxx>

#include <tl/expected.hpp>

#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <string>

namespace relay::core
{
struct component_context;
class http_component_impl;

/**
 * Free-form request to any HTTP service of the cluster.
 */
struct http_request {
  service_type service{ service_type::management };
  std::string method{ "GET" };
  std::string path{};
  std::map<std::string, std::string> headers{};
  std::string body{};

  /**
   * Sends to this "host:port" instead of picking a node of the service.
   */
  std::string endpoint{};

  bool idempotent{ false };

  std::optional<std::chrono::steady_clock::time_point> deadline{};

  /**
   * Used when no deadline is given. Zero selects the configured timeout of the service.
   */
  std::chrono::milliseconds timeout{ 0 };
  std::shared_ptr<retry_strategy> retry_strategy{};
  std::shared_ptr<relay::tracing::request_span> parent_span{};
};

/**
 * The response body is streamed, it has to be read to the end or canceled.
 */
using http_callback = utils::movable_function<void(io::http_response response, error err)>;

class http_component
{
public:
  http_component(const component_context& ctx, timeout_config timeouts);

  auto do_http_request(http_request request, http_callback&& callback)
    -> tl::expected<std::shared_ptr<pending_operation>, error>;

private:
  std::shared_ptr<http_component_impl> impl_;
};

namespace io
{
void
discard_unused_result(http_response& response);
} // namespace io
} // namespace relay::core

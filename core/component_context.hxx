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

#include "dispatcher.hxx"
#include "error.hxx"
#include "operation_registry.hxx"
#include "pending_request.hxx"
#include "retry_orchestrator.hxx"
#include "topology_manager.hxx"
#include "tracing/constants.hxx"

#include <relay/error_codes.hxx>
#include <relay/fmt/service_type.hxx>
#include <relay/retry_reason.hxx>
#include <relay/retry_strategy.hxx>
#include <relay/service_type.hxx>
#include <relay/tracing/request_span.hxx>
#include <relay/tracing/request_tracer.hxx>

#include <asio/io_context.hpp>
#include <fmt/core.h>

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <system_error>

namespace relay::core
{
/**
 * Everything a component needs to turn a request into a pending operation.
 */
struct component_context {
  asio::io_context& io;
  std::shared_ptr<operation_registry> registry;
  std::shared_ptr<const retry_orchestrator> orchestrator;
  std::shared_ptr<topology_manager> topology;
  std::shared_ptr<dispatcher> transport;
  std::shared_ptr<relay::tracing::request_tracer> tracer;
  bool wait_for_config{ false };
};

/**
 * Rejects the request at submission when no node can take it.
 */
inline auto
check_admission(const component_context& ctx, service_type service) -> std::optional<error>
{
  if (!ctx.topology->current()) {
    if (ctx.wait_for_config) {
      return {};
    }
    return error{ errc::common::topology_unavailable, "no topology snapshot has been obtained yet" };
  }
  if (!ctx.topology->has_service(service)) {
    return error{ errc::common::service_not_available, fmt::format("no node runs the {} service", service) };
  }
  return {};
}

/**
 * Retry reason for an attempt that could not pick a node.
 */
inline auto
selection_failure_reason(std::error_code ec) -> retry_reason
{
  if (ec == errc::common::circuit_open) {
    return retry_reason::circuit_breaker_open;
  }
  if (ec == errc::common::service_not_available) {
    return retry_reason::service_not_available;
  }
  return retry_reason::topology_stale;
}

/**
 * An absolute deadline wins over the relative timeout. A zero timeout selects the default of the
 * service, a negative one yields a deadline that has already passed.
 */
inline auto
resolve_deadline(const std::optional<std::chrono::steady_clock::time_point>& deadline,
                 std::chrono::milliseconds timeout,
                 std::chrono::milliseconds default_timeout) -> std::chrono::steady_clock::time_point
{
  if (deadline) {
    return deadline.value();
  }
  return std::chrono::steady_clock::now() + (timeout.count() != 0 ? timeout : default_timeout);
}

template<typename Result>
auto
start_operation(const component_context& ctx,
                const char* name,
                service_type service,
                typename pending_request<Result>::options options,
                std::shared_ptr<relay::tracing::request_span> parent_span,
                typename pending_request<Result>::attempt_function&& attempt,
                typename pending_request<Result>::callback_type&& callback) -> std::shared_ptr<pending_operation>
{
  std::shared_ptr<relay::tracing::request_span> span{};
  if (ctx.tracer) {
    span = ctx.tracer->start_span(name, std::move(parent_span));
    if (span && span->uses_tags()) {
      span->add_tag(tracing::attributes::system, "relay");
      span->add_tag(tracing::attributes::operation, name);
      span->add_tag(tracing::attributes::service, fmt::format("{}", service));
    }
  }
  if (options.name.empty()) {
    options.name = name;
  }
  auto request = std::make_shared<pending_request<Result>>(
    ctx.io, ctx.registry, ctx.orchestrator, ctx.topology, std::move(span), std::move(options), std::move(attempt));
  request->start(std::move(callback));
  return request;
}
} // namespace relay::core

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
#include "http_component.hxx"

#include "component_context.hxx"
#include "logger/logger.hxx"

#include <relay/error_codes.hxx>

#include <fmt/core.h>

#include <utility>

namespace relay::core
{
namespace io
{
void
discard_unused_result(http_response& response)
{
  if (response.body) {
    response.body->cancel();
  }
}
} // namespace io

class http_component_impl : public std::enable_shared_from_this<http_component_impl>
{
public:
  http_component_impl(const component_context& ctx, timeout_config timeouts)
    : ctx_{ ctx }
    , timeouts_{ timeouts }
  {
  }

  auto do_http_request(http_request request, http_callback&& callback)
    -> tl::expected<std::shared_ptr<pending_operation>, error>
  {
    if (request.service == service_type::key_value) {
      return tl::unexpected(error{ errc::common::configuration_error, "key_value is not an HTTP service" });
    }
    if (request.method.empty() || request.path.empty() || request.path.front() != '/') {
      return tl::unexpected(error{ errc::common::configuration_error,
                                   fmt::format(R"(invalid HTTP request: method="{}", path="{}")", request.method, request.path) });
    }
    if (request.endpoint.empty()) {
      if (auto err = check_admission(ctx_, request.service); err) {
        return tl::unexpected(std::move(err.value()));
      }
    }

    pending_request<io::http_response>::options options{};
    options.idempotent = request.idempotent;
    options.deadline = resolve_deadline(request.deadline, request.timeout, timeouts_.for_service(request.service));
    options.strategy = request.retry_strategy;
    auto parent_span = request.parent_span;
    auto service = request.service;

    auto shared_request = std::make_shared<const http_request>(std::move(request));
    return start_operation<io::http_response>(
      ctx_,
      tracing::operation::http,
      service,
      std::move(options),
      std::move(parent_span),
      [self = shared_from_this(), request = shared_request](const attempt_context& attempt,
                                                            pending_request<io::http_response>::outcome_handler&& handler) {
        return self->attempt(request, attempt, std::move(handler));
      },
      std::move(callback));
  }

private:
  auto attempt(const std::shared_ptr<const http_request>& request,
               const attempt_context& ctx,
               pending_request<io::http_response>::outcome_handler&& handler) -> std::shared_ptr<pending_operation>
  {
    std::string endpoint = request->endpoint;
    if (endpoint.empty()) {
      auto selection = ctx_.topology->select_node(request->service, ctx);
      if (!selection) {
        attempt_outcome<io::http_response> outcome{};
        outcome.err = error{ selection.error(), fmt::format("unable to select a node for the {} service", request->service) };
        outcome.reason = selection_failure_reason(selection.error());
        handler(std::move(outcome));
        return {};
      }
      endpoint = selection->endpoint;
    }

    io::http_request encoded{};
    encoded.type = request->service;
    encoded.method = request->method;
    encoded.path = request->path;
    encoded.headers = request->headers;
    encoded.body = request->body;
    encoded.endpoint = endpoint;

    return ctx_.transport->send_http(
      endpoint,
      std::move(encoded),
      ctx.parent_span,
      [handler = std::move(handler)](error err, http_exchange_result result) mutable {
        attempt_outcome<io::http_response> outcome{};
        outcome.dispatched_to = result.info.dispatched_to;
        outcome.dispatched_from = result.info.dispatched_from;
        if (err) {
          outcome.err = std::move(err);
          outcome.reason = result.info.reason;
        } else {
          outcome.value = std::move(result.response);
        }
        handler(std::move(outcome));
      });
  }

  component_context ctx_;
  timeout_config timeouts_;
};

http_component::http_component(const component_context& ctx, timeout_config timeouts)
  : impl_{ std::make_shared<http_component_impl>(ctx, timeouts) }
{
}

auto
http_component::do_http_request(http_request request, http_callback&& callback)
  -> tl::expected<std::shared_ptr<pending_operation>, error>
{
  return impl_->do_http_request(std::move(request), std::move(callback));
}
} // namespace relay::core

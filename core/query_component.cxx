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
#include "query_component.hxx"

#include "component_context.hxx"
#include "logger/logger.hxx"
#include "row_streamer.hxx"
#include "utils/json.hxx"
#include "utils/url_codec.hxx"

#include <relay/error_codes.hxx>

#include <fmt/core.h>
#include <tao/json/value.hpp>
#include <tao/pegtl/parse_error.hpp>

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>

namespace relay::core
{
auto
is_retryable_query_error(service_type service, const tao::json::value& entry) -> bool
{
  if (!entry.is_object()) {
    return false;
  }
  if (const auto* retriable = entry.find("retriable"); retriable != nullptr && retriable->is_boolean() &&
                                                        retriable->get_boolean()) {
    return true;
  }
  const auto* code = entry.find("code");
  if (code == nullptr || !code->is_integer()) {
    return false;
  }
  const auto value = code->as<std::int64_t>();
  switch (service) {
    case service_type::analytics:
      return value == 23000 || value == 23003 || value == 23007;
    case service_type::query:
      if (value == 4040 || value == 4050 || value == 4070) {
        return true;
      }
      if (value == 5000) {
        const auto* msg = entry.find("msg");
        return msg != nullptr && msg->is_string() && msg->get_string().find("index not found") != std::string::npos;
      }
      return false;
    default:
      break;
  }
  return false;
}

namespace
{
/**
 * Describes one query on the wire, independent of the service.
 */
struct query_spec {
  const char* name{};
  service_type service{};
  std::string method{ "POST" };
  std::string path{};
  std::map<std::string, std::string> headers{};
  std::string body{};
  std::string pointer{};
  bool idempotent{ false };
  std::string client_context_id{};
  std::string endpoint{};
  std::optional<std::chrono::steady_clock::time_point> deadline{};
  std::chrono::milliseconds timeout{ 0 };
  std::shared_ptr<retry_strategy> strategy{};
  std::shared_ptr<relay::tracing::request_span> parent_span{};
};

/**
 * HTTP exchange of one attempt, followed by the read of the response metadata.
 */
class query_exchange : public pending_operation
{
public:
  void attach(std::shared_ptr<pending_operation> exchange)
  {
    {
      const std::scoped_lock lock(mutex_);
      if (!canceled_) {
        exchange_ = std::move(exchange);
        return;
      }
    }
    if (exchange) {
      exchange->cancel();
    }
  }

  /**
   * @return false if the attempt has been canceled already
   */
  auto attach(std::shared_ptr<row_streamer> rows) -> bool
  {
    const std::scoped_lock lock(mutex_);
    if (canceled_) {
      return false;
    }
    rows_ = std::move(rows);
    return true;
  }

  void detach()
  {
    const std::scoped_lock lock(mutex_);
    exchange_.reset();
    rows_.reset();
  }

  void cancel() override
  {
    std::shared_ptr<pending_operation> exchange{};
    std::shared_ptr<row_streamer> rows{};
    {
      const std::scoped_lock lock(mutex_);
      if (canceled_) {
        return;
      }
      canceled_ = true;
      exchange = std::move(exchange_);
      rows = std::move(rows_);
    }
    if (exchange) {
      exchange->cancel();
    }
    if (rows) {
      rows->cancel();
    }
  }

private:
  std::mutex mutex_{};
  std::shared_ptr<pending_operation> exchange_{};
  std::shared_ptr<row_streamer> rows_{};
  bool canceled_{ false };
};

/**
 * Reads rows until the stream ends. Rows already buffered are delivered from within next_row(),
 * so they are consumed in a loop instead of nesting a call per row.
 */
class row_drainer : public std::enable_shared_from_this<row_drainer>
{
public:
  row_drainer(std::shared_ptr<row_streamer> rows, utils::movable_function<void(std::error_code)>&& handler)
    : rows_{ std::move(rows) }
    , handler_{ std::move(handler) }
  {
  }

  void run()
  {
    while (true) {
      {
        const std::scoped_lock lock(mutex_);
        looping_ = true;
        delivered_ = false;
      }
      rows_->next_row([self = shared_from_this()](std::error_code ec, std::optional<std::string> row) {
        self->on_row(ec, std::move(row));
      });
      const std::scoped_lock lock(mutex_);
      looping_ = false;
      if (!delivered_) {
        return;
      }
    }
  }

private:
  void on_row(std::error_code ec, std::optional<std::string> row)
  {
    if (!row) {
      auto handler = std::move(handler_);
      return handler(ec);
    }
    {
      const std::scoped_lock lock(mutex_);
      if (looping_) {
        delivered_ = true;
        return;
      }
    }
    run();
  }

  std::shared_ptr<row_streamer> rows_;
  utils::movable_function<void(std::error_code)> handler_;
  std::mutex mutex_{};
  bool looping_{ false };
  bool delivered_{ false };
};

void
drain(std::shared_ptr<row_streamer> rows, utils::movable_function<void(std::error_code)>&& handler)
{
  std::make_shared<row_drainer>(std::move(rows), std::move(handler))->run();
}

auto
is_success(std::uint32_t status_code) -> bool
{
  return status_code >= 200 && status_code < 300;
}

/**
 * Error for a body that could not be read to the point where the outcome is known.
 */
auto
stream_failure(std::error_code ec) -> std::pair<error, retry_reason>
{
  if (ec.category() == core::impl::streaming_json_lexer_category()) {
    error err{ errc::common::protocol_failure, "unable to parse response body" };
    err.ctx["lexer_error"] = ec.message();
    return { std::move(err), retry_reason::do_not_retry };
  }
  if (ec == errc::common::request_canceled) {
    return { error{ ec, "response body read canceled" }, retry_reason::do_not_retry };
  }
  return { error{ ec, "connection failed while reading response body" }, retry_reason::socket_closed_while_in_flight };
}

auto
check_response(const query_spec& spec, std::uint32_t status_code, const tao::json::value& meta)
  -> std::optional<std::pair<error, retry_reason>>
{
  const auto* errors = meta.is_object() ? meta.find("errors") : nullptr;
  if (errors != nullptr && errors->is_array() && !errors->get_array().empty()) {
    bool all_retryable = true;
    for (const auto& entry : errors->get_array()) {
      all_retryable = all_retryable && is_retryable_query_error(spec.service, entry);
    }
    std::string message{ "service reported errors" };
    if (const auto& first = errors->get_array().front(); first.is_object()) {
      if (const auto* msg = first.find("msg"); msg != nullptr && msg->is_string()) {
        message = msg->get_string();
      }
    }
    error err{ errc::common::internal_server_failure, std::move(message) };
    err.ctx["errors"] = *errors;
    err.ctx["http_status"] = status_code;
    if (!spec.client_context_id.empty()) {
      err.ctx["client_context_id"] = spec.client_context_id;
    }
    return std::make_pair(std::move(err),
                          all_retryable ? retry_reason::service_response_code_indicated : retry_reason::do_not_retry);
  }
  if (!is_success(status_code)) {
    error err{ errc::common::internal_server_failure,
               fmt::format("{} service responded with HTTP status {}", spec.service, status_code) };
    err.ctx["http_status"] = status_code;
    if (!meta.is_uninitialized() && !meta.is_null()) {
      err.ctx["body"] = meta;
    }
    if (!spec.client_context_id.empty()) {
      err.ctx["client_context_id"] = spec.client_context_id;
    }
    return std::make_pair(std::move(err), retry_reason::do_not_retry);
  }
  return {};
}
} // namespace

class query_component_impl : public std::enable_shared_from_this<query_component_impl>
{
public:
  query_component_impl(const component_context& ctx, timeout_config timeouts, std::string bucket_name)
    : ctx_{ ctx }
    , timeouts_{ timeouts }
    , bucket_name_{ std::move(bucket_name) }
  {
  }

  auto analytics_query(analytics_query_request request, query_callback&& callback)
    -> tl::expected<std::shared_ptr<pending_operation>, error>
  {
    query_spec spec{};
    spec.name = tracing::operation::analytics;
    spec.service = service_type::analytics;
    spec.path = "/analytics/service";
    spec.headers["content-type"] = "application/json";
    if (request.priority) {
      spec.headers["analytics-priority"] = "-1";
    }
    spec.body = std::move(request.payload);
    spec.pointer = "/results/^";
    spec.idempotent = request.read_only;
    spec.client_context_id = std::move(request.client_context_id);
    spec.endpoint = std::move(request.endpoint);
    spec.deadline = request.deadline;
    spec.timeout = request.timeout;
    spec.strategy = std::move(request.retry_strategy);
    spec.parent_span = std::move(request.parent_span);
    return execute(std::move(spec), std::move(callback));
  }

  auto n1ql_query(n1ql_query_request request, query_callback&& callback)
    -> tl::expected<std::shared_ptr<pending_operation>, error>
  {
    query_spec spec{};
    spec.name = tracing::operation::query;
    spec.service = service_type::query;
    spec.path = "/query/service";
    spec.headers["content-type"] = "application/json";
    spec.body = std::move(request.payload);
    spec.pointer = "/results/^";
    spec.idempotent = request.read_only;
    spec.client_context_id = std::move(request.client_context_id);
    spec.endpoint = std::move(request.endpoint);
    spec.deadline = request.deadline;
    spec.timeout = request.timeout;
    spec.strategy = std::move(request.retry_strategy);
    spec.parent_span = std::move(request.parent_span);
    return execute(std::move(spec), std::move(callback));
  }

  auto search_query(search_query_request request, query_callback&& callback)
    -> tl::expected<std::shared_ptr<pending_operation>, error>
  {
    if (request.index_name.empty()) {
      return tl::unexpected(error{ errc::common::configuration_error, "search query requires an index name" });
    }
    query_spec spec{};
    spec.name = tracing::operation::search;
    spec.service = service_type::search;
    spec.path = fmt::format("/api/index/{}/query", utils::string_codec::path_escape(request.index_name));
    spec.headers["content-type"] = "application/json";
    spec.body = std::move(request.payload);
    spec.pointer = "/hits/^";
    spec.idempotent = true;
    spec.client_context_id = std::move(request.client_context_id);
    spec.endpoint = std::move(request.endpoint);
    spec.deadline = request.deadline;
    spec.timeout = request.timeout;
    spec.strategy = std::move(request.retry_strategy);
    spec.parent_span = std::move(request.parent_span);
    return execute(std::move(spec), std::move(callback));
  }

  auto view_query(view_query_request request, query_callback&& callback)
    -> tl::expected<std::shared_ptr<pending_operation>, error>
  {
    if (bucket_name_.empty()) {
      return tl::unexpected(error{ errc::common::configuration_error, "view query requires a bucket" });
    }
    if (request.design_document_name.empty() || request.view_name.empty()) {
      return tl::unexpected(
        error{ errc::common::configuration_error, "view query requires design document and view names" });
    }
    query_spec spec{};
    spec.name = tracing::operation::views;
    spec.service = service_type::view;
    spec.path = fmt::format("/{}/_design/{}{}/_view/{}",
                            utils::string_codec::path_escape(bucket_name_),
                            request.development ? "dev_" : "",
                            utils::string_codec::path_escape(request.design_document_name),
                            utils::string_codec::path_escape(request.view_name));
    if (!request.query_string.empty()) {
      spec.path += "?" + request.query_string;
    }
    if (request.body) {
      spec.headers["content-type"] = "application/json";
      spec.body = std::move(request.body.value());
    } else {
      spec.method = "GET";
    }
    spec.pointer = "/rows/^";
    spec.idempotent = true;
    spec.endpoint = std::move(request.endpoint);
    spec.deadline = request.deadline;
    spec.timeout = request.timeout;
    spec.strategy = std::move(request.retry_strategy);
    spec.parent_span = std::move(request.parent_span);
    return execute(std::move(spec), std::move(callback));
  }

private:
  auto execute(query_spec spec, query_callback&& callback) -> tl::expected<std::shared_ptr<pending_operation>, error>
  {
    if (spec.endpoint.empty()) {
      if (auto err = check_admission(ctx_, spec.service); err) {
        return tl::unexpected(std::move(err.value()));
      }
    }
    if (!spec.client_context_id.empty()) {
      spec.headers["client-context-id"] = spec.client_context_id;
    }

    pending_request<query_result>::options options{};
    options.idempotent = spec.idempotent;
    options.deadline = resolve_deadline(spec.deadline, spec.timeout, timeouts_.for_service(spec.service));
    options.strategy = spec.strategy;
    auto parent_span = spec.parent_span;
    const auto* name = spec.name;
    auto service = spec.service;

    auto shared_spec = std::make_shared<const query_spec>(std::move(spec));
    return start_operation<query_result>(
      ctx_,
      name,
      service,
      std::move(options),
      std::move(parent_span),
      [self = shared_from_this(), spec = shared_spec](const attempt_context& attempt,
                                                      pending_request<query_result>::outcome_handler&& handler) {
        return self->attempt(spec, attempt, std::move(handler));
      },
      std::move(callback));
  }

  auto attempt(const std::shared_ptr<const query_spec>& spec,
               const attempt_context& ctx,
               pending_request<query_result>::outcome_handler&& handler) -> std::shared_ptr<pending_operation>
  {
    std::string endpoint = spec->endpoint;
    if (endpoint.empty()) {
      auto selection = ctx_.topology->select_node(spec->service, ctx);
      if (!selection) {
        attempt_outcome<query_result> outcome{};
        outcome.err = error{ selection.error(), fmt::format("unable to select a node for the {} service", spec->service) };
        outcome.reason = selection_failure_reason(selection.error());
        handler(std::move(outcome));
        return {};
      }
      endpoint = selection->endpoint;
    }

    io::http_request encoded{};
    encoded.type = spec->service;
    encoded.method = spec->method;
    encoded.path = spec->path;
    encoded.headers = spec->headers;
    encoded.body = spec->body;
    encoded.endpoint = endpoint;

    auto exchange = std::make_shared<query_exchange>();
    auto http = ctx_.transport->send_http(
      endpoint,
      std::move(encoded),
      ctx.parent_span,
      [spec, exchange, handler = std::move(handler)](error err, http_exchange_result result) mutable {
        if (err) {
          attempt_outcome<query_result> outcome{};
          outcome.dispatched_to = result.info.dispatched_to;
          outcome.dispatched_from = result.info.dispatched_from;
          outcome.err = std::move(err);
          outcome.reason = result.info.reason;
          return handler(std::move(outcome));
        }
        on_response(spec, exchange, std::move(result), std::move(handler));
      });
    exchange->attach(std::move(http));
    return exchange;
  }

  static void on_response(std::shared_ptr<const query_spec> spec,
                          std::shared_ptr<query_exchange> exchange,
                          http_exchange_result result,
                          pending_request<query_result>::outcome_handler&& handler)
  {
    attempt_outcome<query_result> outcome{};
    outcome.dispatched_to = result.info.dispatched_to;
    outcome.dispatched_from = result.info.dispatched_from;
    const auto status_code = result.response.status_code;

    if (!result.response.body) {
      outcome.err = error{ errc::common::protocol_failure, "response has no body" };
      return handler(std::move(outcome));
    }
    auto rows = std::make_shared<row_streamer>(result.response.body, spec->pointer);
    if (!exchange->attach(rows)) {
      rows->cancel();
      outcome.err = error{ errc::common::request_canceled, "attempt canceled" };
      return handler(std::move(outcome));
    }

    if (!is_success(status_code)) {
      // the outcome is decided by the error document, read all of it
      drain(rows,
            [spec, rows, exchange, outcome = std::move(outcome), status_code, handler = std::move(handler)](
              std::error_code ec) mutable {
              exchange->detach();
              tao::json::value meta{};
              if (auto text = rows->metadata(); !ec && text) {
                try {
                  meta = utils::json::parse(text.value());
                } catch (const tao::pegtl::parse_error& e) {
                  RELAY_LOG_DEBUG("unable to parse error document: {}", e.what());
                }
              }
              auto failure = check_response(*spec, status_code, meta);
              outcome.err = std::move(failure->first);
              outcome.reason = failure->second;
              handler(std::move(outcome));
            });
      return;
    }

    rows->start([spec, rows, exchange, outcome = std::move(outcome), status_code, handler = std::move(handler)](
                  std::error_code ec, std::string header) mutable {
      exchange->detach();
      if (ec) {
        rows->cancel();
        auto [err, reason] = stream_failure(ec);
        outcome.err = std::move(err);
        outcome.reason = reason;
        return handler(std::move(outcome));
      }

      tao::json::value meta{};
      try {
        meta = utils::json::parse(header);
      } catch (const tao::pegtl::parse_error& e) {
        rows->cancel();
        outcome.err = error{ errc::common::protocol_failure, "unable to parse response metadata" };
        outcome.err.ctx["parse_error"] = e.what();
        return handler(std::move(outcome));
      }
      if (auto failure = check_response(*spec, status_code, meta); failure) {
        rows->cancel();
        outcome.err = std::move(failure->first);
        outcome.reason = failure->second;
        return handler(std::move(outcome));
      }

      outcome.value = query_result{ std::move(rows), std::move(header), status_code, outcome.dispatched_to };
      handler(std::move(outcome));
    });
  }

  component_context ctx_;
  timeout_config timeouts_;
  std::string bucket_name_;
};

query_component::query_component(const component_context& ctx, timeout_config timeouts, std::string bucket_name)
  : impl_{ std::make_shared<query_component_impl>(ctx, timeouts, std::move(bucket_name)) }
{
}

auto
query_component::analytics_query(analytics_query_request request, query_callback&& callback)
  -> tl::expected<std::shared_ptr<pending_operation>, error>
{
  return impl_->analytics_query(std::move(request), std::move(callback));
}

auto
query_component::n1ql_query(n1ql_query_request request, query_callback&& callback)
  -> tl::expected<std::shared_ptr<pending_operation>, error>
{
  return impl_->n1ql_query(std::move(request), std::move(callback));
}

auto
query_component::search_query(search_query_request request, query_callback&& callback)
  -> tl::expected<std::shared_ptr<pending_operation>, error>
{
  return impl_->search_query(std::move(request), std::move(callback));
}

auto
query_component::view_query(view_query_request request, query_callback&& callback)
  -> tl::expected<std::shared_ptr<pending_operation>, error>
{
  return impl_->view_query(std::move(request), std::move(callback));
}
} // namespace relay::core

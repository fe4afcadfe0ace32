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

#include "dispatcher.hxx"

#include "circuit_breaker.hxx"
#include "logger/logger.hxx"
#include "io/http_connection.hxx"
#include "io/mcbp_connection.hxx"
#include "tracing/constants.hxx"
#include "utils/base64.hxx"

#include <relay/error_codes.hxx>
#include <relay/fmt/service_type.hxx>

#include <asio/io_context.hpp>
#include <asio/post.hpp>
#include <fmt/core.h>

#include <atomic>
#include <map>
#include <mutex>
#include <optional>
#include <type_traits>

namespace relay::core
{
namespace
{
using kv_pool = io::connection_pool<io::mcbp_connection>;
using http_pool = io::connection_pool<io::http_connection>;

/**
 * Reason for a connection that could not be obtained.
 */
auto
checkout_failure_reason(std::error_code ec) -> retry_reason
{
  if (ec == errc::network::queue_full) {
    return retry_reason::socket_not_available;
  }
  if (ec == errc::common::cluster_closed || ec == errc::common::authentication_failure ||
      ec == errc::common::request_canceled) {
    return retry_reason::do_not_retry;
  }
  return retry_reason::node_not_available;
}

/**
 * Reason for an exchange that failed after the request was handed to the connection.
 */
auto
in_flight_failure_reason(std::error_code ec) -> retry_reason
{
  if (ec == errc::common::protocol_failure || ec == errc::network::protocol_error) {
    return retry_reason::protocol_failure;
  }
  if (ec == errc::common::request_canceled || ec == errc::common::cluster_closed) {
    return retry_reason::do_not_retry;
  }
  return retry_reason::socket_closed_while_in_flight;
}

auto
is_node_failure(retry_reason reason) -> bool
{
  return reason == retry_reason::node_not_available ||
         reason == retry_reason::socket_closed_while_in_flight ||
         reason == retry_reason::protocol_failure;
}

auto
start_dispatch_span(const std::shared_ptr<relay::tracing::request_tracer>& tracer,
                    const std::shared_ptr<relay::tracing::request_span>& parent,
                    service_type service) -> std::shared_ptr<relay::tracing::request_span>
{
  if (!tracer) {
    return {};
  }
  auto span = tracer->start_span(tracing::operation::step_dispatch, parent);
  if (span && span->uses_tags()) {
    span->add_tag(tracing::attributes::system, "relay");
    span->add_tag(tracing::attributes::service, fmt::format("{}", service));
  }
  return span;
}

void
end_dispatch_span(const std::shared_ptr<relay::tracing::request_span>& span, const dispatch_info& info)
{
  if (!span) {
    return;
  }
  if (span->uses_tags()) {
    if (!info.dispatched_to.empty()) {
      span->add_tag(tracing::attributes::remote_socket, info.dispatched_to);
    }
    if (!info.dispatched_from.empty()) {
      span->add_tag(tracing::attributes::local_socket, info.dispatched_from);
    }
  }
  span->end();
}

/**
 * One binary protocol request/response exchange on a pooled connection. The connection is checked
 * out only while the request is queued, concurrent exchanges share it.
 */
class kv_exchange
  : public std::enable_shared_from_this<kv_exchange>
  , public pending_operation
{
public:
  kv_exchange(std::shared_ptr<kv_pool> pool,
              std::shared_ptr<circuit_breaker_registry> breakers,
              mcbp::packet request,
              std::shared_ptr<relay::tracing::request_span> span,
              dispatcher::kv_handler&& handler,
              std::optional<circuit_ticket> ticket)
    : pool_{ std::move(pool) }
    , breakers_{ std::move(breakers) }
    , request_{ std::move(request) }
    , span_{ std::move(span) }
    , handler_{ std::move(handler) }
    , ticket_{ ticket }
  {
    info_.dispatched_to = pool_->endpoint();
  }

  void start()
  {
    auto waiter = pool_->checkout([self = shared_from_this()](std::error_code ec, kv_pool::connection_ptr connection) {
      self->on_connection(ec, std::move(connection));
    });
    const std::scoped_lock lock(mutex_);
    waiter_id_ = waiter;
  }

  void cancel() override
  {
    std::shared_ptr<io::mcbp_connection> connection{};
    std::uint32_t opaque{};
    std::optional<std::uint64_t> waiter{};
    dispatcher::kv_handler handler{};
    {
      const std::scoped_lock lock(mutex_);
      if (canceled_ || !handler_) {
        return;
      }
      canceled_ = true;
      handler = std::move(handler_);
      connection = std::move(connection_);
      opaque = opaque_;
      waiter = waiter_id_;
    }
    if (connection) {
      // other requests share the connection, only this response is forgotten
      connection->cancel(opaque);
    } else if (waiter) {
      pool_->cancel_checkout(waiter.value());
    }
    end_dispatch_span(span_, info_);
  }

private:
  void on_connection(std::error_code ec, kv_pool::connection_ptr connection)
  {
    {
      const std::scoped_lock lock(mutex_);
      waiter_id_.reset();
      if (canceled_) {
        if (connection) {
          pool_->checkin(std::move(connection));
        }
        return;
      }
    }
    if (ec) {
      info_.reason = checkout_failure_reason(ec);
      return finish(error{ ec, fmt::format("unable to get connection to {}", pool_->endpoint()) }, {});
    }
    info_.dispatched_from = connection->local_address();
    {
      const std::scoped_lock lock(mutex_);
      connection_ = connection;
      opaque_ = connection->send(request_, [self = shared_from_this()](std::error_code ec, mcbp::packet response) {
        self->on_response(ec, std::move(response));
      });
    }
    // the request is queued, the connection can carry other requests meanwhile
    pool_->checkin(std::move(connection));
  }

  void on_response(std::error_code ec, mcbp::packet response)
  {
    std::shared_ptr<io::mcbp_connection> connection{};
    {
      const std::scoped_lock lock(mutex_);
      connection = std::move(connection_);
      if (canceled_) {
        return;
      }
    }
    if (ec) {
      pool_->evict(connection);
      info_.reason = in_flight_failure_reason(ec);
      return finish(error{ ec, fmt::format("exchange with {} failed", pool_->endpoint()) }, {});
    }
    finish({}, std::move(response));
  }

  void finish(error err, mcbp::packet response)
  {
    dispatcher::kv_handler handler{};
    {
      const std::scoped_lock lock(mutex_);
      handler = std::move(handler_);
    }
    if (!handler) {
      return;
    }
    if (ticket_ && err.ec != errc::common::cluster_closed) {
      if (!err) {
        breakers_->report(pool_->endpoint(), service_type::key_value, ticket_.value(), circuit_outcome::success);
      } else if (is_node_failure(info_.reason)) {
        breakers_->report(pool_->endpoint(), service_type::key_value, ticket_.value(), circuit_outcome::failure);
      }
    }
    end_dispatch_span(span_, info_);
    handler(std::move(err), kv_exchange_result{ std::move(response), info_ });
  }

  std::shared_ptr<kv_pool> pool_;
  std::shared_ptr<circuit_breaker_registry> breakers_;
  mcbp::packet request_;
  std::shared_ptr<relay::tracing::request_span> span_;
  dispatch_info info_{};

  std::mutex mutex_{};
  dispatcher::kv_handler handler_;
  std::optional<circuit_ticket> ticket_;
  bool canceled_{ false };
  std::optional<std::uint64_t> waiter_id_{};
  std::shared_ptr<io::mcbp_connection> connection_{};
  std::uint32_t opaque_{ 0 };
};

/**
 * Streams the body of one response. The connection goes back to the pool after the last chunk,
 * and is discarded when the reader is canceled or dropped earlier.
 */
class pooled_body_reader : public io::http_body_reader
{
public:
  pooled_body_reader(std::shared_ptr<http_pool> pool, std::shared_ptr<io::http_connection> connection)
    : pool_{ std::move(pool) }
    , connection_{ std::move(connection) }
  {
  }

  pooled_body_reader(const pooled_body_reader&) = delete;
  pooled_body_reader(pooled_body_reader&&) = delete;
  auto operator=(const pooled_body_reader&) -> pooled_body_reader& = delete;
  auto operator=(pooled_body_reader&&) -> pooled_body_reader& = delete;

  ~pooled_body_reader() override
  {
    cancel();
  }

  void next(chunk_handler&& handler) override
  {
    if (!owns_connection_->load()) {
      return handler(errc::common::request_canceled, {}, false);
    }
    connection_->read_body([pool = pool_, connection = connection_, owns = owns_connection_, handler = std::move(handler)](
                             std::error_code ec, std::string chunk, bool complete) mutable {
      if ((ec || complete) && owns->exchange(false)) {
        if (ec) {
          pool->discard(connection);
        } else {
          pool->checkin(connection);
        }
      }
      handler(ec, std::move(chunk), complete);
    });
  }

  void cancel() override
  {
    if (owns_connection_->exchange(false)) {
      pool_->discard(connection_);
    }
  }

private:
  std::shared_ptr<http_pool> pool_;
  std::shared_ptr<io::http_connection> connection_;
  // shared with the pending read, the connection is returned to the pool exactly once
  std::shared_ptr<std::atomic_bool> owns_connection_{ std::make_shared<std::atomic_bool>(true) };
};

auto
http_status_failure(std::uint32_t status_code) -> std::optional<std::pair<std::error_code, retry_reason>>
{
  switch (status_code) {
    case 503:
      return std::make_pair(std::error_code{ errc::common::service_not_available },
                            retry_reason::service_not_available);
    case 429:
      return std::make_pair(std::error_code{ errc::common::temporary_failure },
                            retry_reason::node_overloaded);
    case 401:
      return std::make_pair(std::error_code{ errc::common::authentication_failure },
                            retry_reason::do_not_retry);
    default:
      break;
  }
  return std::nullopt;
}

/**
 * One HTTP request, complete once the response headers arrived.
 */
class http_exchange
  : public std::enable_shared_from_this<http_exchange>
  , public pending_operation
{
public:
  http_exchange(std::shared_ptr<http_pool> pool,
                std::shared_ptr<circuit_breaker_registry> breakers,
                io::http_request request,
                std::string authorization,
                std::shared_ptr<relay::tracing::request_span> span,
                dispatcher::http_handler&& handler,
                std::optional<circuit_ticket> ticket)
    : pool_{ std::move(pool) }
    , breakers_{ std::move(breakers) }
    , request_{ std::move(request) }
    , authorization_{ std::move(authorization) }
    , span_{ std::move(span) }
    , handler_{ std::move(handler) }
    , ticket_{ ticket }
  {
    info_.dispatched_to = pool_->endpoint();
  }

  void start()
  {
    auto waiter = pool_->checkout([self = shared_from_this()](std::error_code ec, http_pool::connection_ptr connection) {
      self->on_connection(ec, std::move(connection));
    });
    const std::scoped_lock lock(mutex_);
    waiter_id_ = waiter;
  }

  void cancel() override
  {
    std::shared_ptr<io::http_connection> connection{};
    std::optional<std::uint64_t> waiter{};
    dispatcher::http_handler handler{};
    {
      const std::scoped_lock lock(mutex_);
      if (canceled_ || !handler_) {
        return;
      }
      canceled_ = true;
      handler = std::move(handler_);
      connection = std::move(connection_);
      waiter = waiter_id_;
    }
    if (connection) {
      pool_->discard(std::move(connection));
    } else if (waiter) {
      pool_->cancel_checkout(waiter.value());
    }
    end_dispatch_span(span_, info_);
  }

private:
  void on_connection(std::error_code ec, http_pool::connection_ptr connection)
  {
    {
      const std::scoped_lock lock(mutex_);
      waiter_id_.reset();
      if (canceled_) {
        if (connection) {
          pool_->checkin(std::move(connection));
        }
        return;
      }
    }
    if (ec) {
      info_.reason = checkout_failure_reason(ec);
      return finish(error{ ec, fmt::format("unable to get connection to {}", pool_->endpoint()) }, {});
    }
    info_.dispatched_from = connection->local_address();
    {
      const std::scoped_lock lock(mutex_);
      connection_ = connection;
    }
    connection->send(request_, authorization_, [self = shared_from_this()](std::error_code ec, io::http_response response) {
      self->on_headers(ec, std::move(response));
    });
  }

  void on_headers(std::error_code ec, io::http_response response)
  {
    std::shared_ptr<io::http_connection> connection{};
    {
      const std::scoped_lock lock(mutex_);
      connection = std::move(connection_);
      if (canceled_) {
        return;
      }
    }
    if (ec) {
      if (connection) {
        pool_->discard(std::move(connection));
      }
      info_.reason = in_flight_failure_reason(ec);
      return finish(error{ ec, fmt::format("exchange with {} failed", pool_->endpoint()) }, {});
    }

    if (auto failure = http_status_failure(response.status_code); failure) {
      // the body is not interesting, dropping the connection is cheaper than draining it
      if (connection) {
        pool_->discard(std::move(connection));
      }
      info_.reason = failure->second;
      error err{ failure->first,
                 fmt::format("{} responded with {} {}", pool_->endpoint(), response.status_code, response.status_message) };
      err.ctx["http_status"] = response.status_code;
      return finish(std::move(err), {});
    }

    response.body = std::make_shared<pooled_body_reader>(pool_, std::move(connection));
    finish({}, std::move(response));
  }

  void finish(error err, io::http_response response)
  {
    dispatcher::http_handler handler{};
    {
      const std::scoped_lock lock(mutex_);
      handler = std::move(handler_);
    }
    if (!handler) {
      return;
    }
    if (ticket_ && err.ec != errc::common::cluster_closed) {
      if (!err) {
        breakers_->report(pool_->endpoint(), request_.type, ticket_.value(), circuit_outcome::success);
      } else if (is_node_failure(info_.reason) || info_.reason == retry_reason::service_not_available) {
        breakers_->report(pool_->endpoint(), request_.type, ticket_.value(), circuit_outcome::failure);
      }
    }
    end_dispatch_span(span_, info_);
    handler(std::move(err), http_exchange_result{ std::move(response), info_ });
  }

  std::shared_ptr<http_pool> pool_;
  std::shared_ptr<circuit_breaker_registry> breakers_;
  io::http_request request_;
  std::string authorization_;
  std::shared_ptr<relay::tracing::request_span> span_;
  dispatch_info info_{};

  std::mutex mutex_{};
  dispatcher::http_handler handler_;
  std::optional<circuit_ticket> ticket_;
  bool canceled_{ false };
  std::optional<std::uint64_t> waiter_id_{};
  std::shared_ptr<io::http_connection> connection_{};
};
} // namespace

auto
split_endpoint(const std::string& endpoint) -> std::pair<std::string, std::string>
{
  if (!endpoint.empty() && endpoint.front() == '[') {
    auto closing = endpoint.find(']');
    if (closing == std::string::npos) {
      return { endpoint, {} };
    }
    auto host = endpoint.substr(1, closing - 1);
    if (closing + 1 < endpoint.size() && endpoint[closing + 1] == ':') {
      return { host, endpoint.substr(closing + 2) };
    }
    return { host, {} };
  }
  auto colon = endpoint.rfind(':');
  if (colon == std::string::npos) {
    return { endpoint, {} };
  }
  return { endpoint.substr(0, colon), endpoint.substr(colon + 1) };
}

class dispatcher_impl : public std::enable_shared_from_this<dispatcher_impl>
{
public:
  dispatcher_impl(asio::io_context& io,
                  dispatcher_options options,
                  std::shared_ptr<circuit_breaker_registry> breakers)
    : io_{ io }
    , options_{ std::move(options) }
    , breakers_{ std::move(breakers) }
  {
    if (!options_.stream_factory) {
      options_.stream_factory = io::make_stream_factory({});
    }
  }

  auto send_kv(const std::string& endpoint,
               mcbp::packet request,
               std::shared_ptr<relay::tracing::request_span> parent_span,
               dispatcher::kv_handler&& handler,
               bool use_breaker) -> std::shared_ptr<pending_operation>
  {
    if (closed_) {
      reject(std::move(handler), endpoint, errc::common::cluster_closed, retry_reason::do_not_retry);
      return nullptr;
    }
    std::optional<circuit_ticket> ticket{};
    if (use_breaker) {
      ticket = breakers_->allow(endpoint, service_type::key_value);
      if (!ticket) {
        RELAY_LOG_TRACE("circuit breaker for {}/kv rejected request", endpoint);
        reject(std::move(handler), endpoint, errc::common::circuit_open, retry_reason::circuit_breaker_open);
        return nullptr;
      }
    }
    auto pool = kv_pool_for(endpoint);
    if (!pool) {
      reject(std::move(handler), endpoint, errc::common::cluster_closed, retry_reason::do_not_retry);
      return nullptr;
    }
    auto exchange = std::make_shared<kv_exchange>(std::move(pool),
                                                  breakers_,
                                                  std::move(request),
                                                  start_dispatch_span(options_.tracer, parent_span, service_type::key_value),
                                                  std::move(handler),
                                                  ticket);
    exchange->start();
    return exchange;
  }

  auto send_http(const std::string& endpoint,
                 io::http_request request,
                 std::shared_ptr<relay::tracing::request_span> parent_span,
                 dispatcher::http_handler&& handler,
                 bool use_breaker) -> std::shared_ptr<pending_operation>
  {
    if (closed_) {
      reject(std::move(handler), endpoint, errc::common::cluster_closed, retry_reason::do_not_retry);
      return nullptr;
    }
    std::optional<circuit_ticket> ticket{};
    if (use_breaker) {
      ticket = breakers_->allow(endpoint, request.type);
      if (!ticket) {
        RELAY_LOG_TRACE("circuit breaker for {}/{} rejected request", endpoint, request.type);
        reject(std::move(handler), endpoint, errc::common::circuit_open, retry_reason::circuit_breaker_open);
        return nullptr;
      }
    }
    auto pool = http_pool_for(endpoint);
    if (!pool) {
      reject(std::move(handler), endpoint, errc::common::cluster_closed, retry_reason::do_not_retry);
      return nullptr;
    }
    request.endpoint = endpoint;
    auto authorization = authorization_for(request.type, endpoint);
    auto span = start_dispatch_span(options_.tracer, parent_span, request.type);
    auto exchange = std::make_shared<http_exchange>(std::move(pool),
                                                    breakers_,
                                                    std::move(request),
                                                    std::move(authorization),
                                                    std::move(span),
                                                    std::move(handler),
                                                    ticket);
    exchange->start();
    return exchange;
  }

  void close()
  {
    if (closed_.exchange(true)) {
      return;
    }
    std::map<std::string, std::shared_ptr<kv_pool>> kv_pools{};
    std::map<std::string, std::shared_ptr<http_pool>> http_pools{};
    {
      const std::scoped_lock lock(pools_mutex_);
      std::swap(kv_pools, kv_pools_);
      std::swap(http_pools, http_pools_);
    }
    for (const auto& [endpoint, pool] : kv_pools) {
      pool->close();
    }
    for (const auto& [endpoint, pool] : http_pools) {
      pool->close();
    }
  }

  [[nodiscard]] auto idle_connections() const -> std::size_t
  {
    const std::scoped_lock lock(pools_mutex_);
    std::size_t result{ 0 };
    for (const auto& [endpoint, pool] : kv_pools_) {
      result += pool->idle_count();
    }
    for (const auto& [endpoint, pool] : http_pools_) {
      result += pool->idle_count();
    }
    return result;
  }

  [[nodiscard]] auto open_connections() const -> std::size_t
  {
    const std::scoped_lock lock(pools_mutex_);
    std::size_t result{ 0 };
    for (const auto& [endpoint, pool] : kv_pools_) {
      result += pool->total_count();
    }
    for (const auto& [endpoint, pool] : http_pools_) {
      result += pool->total_count();
    }
    return result;
  }

private:
  template<typename Handler>
  void reject(Handler&& handler, const std::string& endpoint, std::error_code ec, retry_reason reason)
  {
    asio::post(io_, [handler = std::forward<Handler>(handler), endpoint, ec, reason]() mutable {
      dispatch_info info{};
      info.dispatched_to = endpoint;
      info.reason = reason;
      using result_type = std::conditional_t<std::is_same_v<std::decay_t<Handler>, dispatcher::kv_handler>,
                                             kv_exchange_result,
                                             http_exchange_result>;
      result_type result{};
      result.info = std::move(info);
      handler(error{ ec, fmt::format("request to {} was not dispatched", endpoint) }, std::move(result));
    });
  }

  auto authorization_for(service_type type, const std::string& endpoint) const -> std::string
  {
    if (!options_.authenticator) {
      return {};
    }
    auto credentials = options_.authenticator->credentials({ type, endpoint });
    if (credentials.username.empty()) {
      return {};
    }
    return fmt::format("Basic {}",
                       utils::base64::encode(fmt::format("{}:{}", credentials.username, credentials.password)));
  }

  auto kv_pool_for(const std::string& endpoint) -> std::shared_ptr<kv_pool>
  {
    const std::scoped_lock lock(pools_mutex_);
    if (closed_) {
      return nullptr;
    }
    if (auto it = kv_pools_.find(endpoint); it != kv_pools_.end()) {
      return it->second;
    }
    auto [hostname, port] = split_endpoint(endpoint);
    io::mcbp_connection_options connection_options{};
    connection_options.hostname = hostname;
    connection_options.port = port;
    connection_options.bucket = options_.bucket_name;
    connection_options.user_agent = options_.user_agent;
    connection_options.authenticator = options_.authenticator;
    connection_options.connect_timeout = options_.kv_connect_timeout;
    connection_options.enable_compression = options_.use_compression;
    connection_options.compression_min_size = options_.compression_min_size;
    connection_options.compression_min_ratio = options_.compression_min_ratio;
    connection_options.enable_mutation_tokens = options_.use_mutation_tokens;
    connection_options.enable_server_durations = options_.use_server_durations;
    auto pool = std::make_shared<kv_pool>(
      io_,
      endpoint,
      options_.kv_pool,
      [&io = io_, factory = options_.stream_factory, connection_options](kv_pool::checkout_handler&& handler) {
        auto connection = std::make_shared<io::mcbp_connection>(io, factory(io), connection_options);
        connection->connect([connection, handler = std::move(handler)](std::error_code ec) mutable {
          if (ec) {
            return handler(ec, nullptr);
          }
          handler({}, std::move(connection));
        });
      });
    kv_pools_.emplace(endpoint, pool);
    return pool;
  }

  auto http_pool_for(const std::string& endpoint) -> std::shared_ptr<http_pool>
  {
    const std::scoped_lock lock(pools_mutex_);
    if (closed_) {
      return nullptr;
    }
    if (auto it = http_pools_.find(endpoint); it != http_pools_.end()) {
      return it->second;
    }
    auto [hostname, port] = split_endpoint(endpoint);
    io::http_connection_options connection_options{};
    connection_options.hostname = hostname;
    connection_options.port = port;
    connection_options.user_agent = options_.user_agent;
    connection_options.connect_timeout = options_.http_connect_timeout;
    auto pool = std::make_shared<http_pool>(
      io_,
      endpoint,
      options_.http_pool,
      [&io = io_, factory = options_.stream_factory, connection_options](http_pool::checkout_handler&& handler) {
        auto connection = std::make_shared<io::http_connection>(io, factory(io), connection_options);
        connection->connect([connection, handler = std::move(handler)](std::error_code ec) mutable {
          if (ec) {
            return handler(ec, nullptr);
          }
          handler({}, std::move(connection));
        });
      });
    http_pools_.emplace(endpoint, pool);
    return pool;
  }

  asio::io_context& io_;
  dispatcher_options options_;
  std::shared_ptr<circuit_breaker_registry> breakers_;
  std::atomic_bool closed_{ false };

  mutable std::mutex pools_mutex_{};
  std::map<std::string, std::shared_ptr<kv_pool>> kv_pools_{};
  std::map<std::string, std::shared_ptr<http_pool>> http_pools_{};
};

dispatcher::dispatcher(asio::io_context& io,
                       dispatcher_options options,
                       std::shared_ptr<circuit_breaker_registry> breakers)
  : impl_{ std::make_shared<dispatcher_impl>(io, std::move(options), std::move(breakers)) }
{
}

dispatcher::~dispatcher()
{
  impl_->close();
}

auto
dispatcher::send_kv(const std::string& endpoint,
                    mcbp::packet request,
                    std::shared_ptr<relay::tracing::request_span> parent_span,
                    kv_handler&& handler,
                    bool use_breaker) -> std::shared_ptr<pending_operation>
{
  return impl_->send_kv(endpoint, std::move(request), std::move(parent_span), std::move(handler), use_breaker);
}

auto
dispatcher::send_http(const std::string& endpoint,
                      io::http_request request,
                      std::shared_ptr<relay::tracing::request_span> parent_span,
                      http_handler&& handler,
                      bool use_breaker) -> std::shared_ptr<pending_operation>
{
  return impl_->send_http(endpoint, std::move(request), std::move(parent_span), std::move(handler), use_breaker);
}

void
dispatcher::close()
{
  return impl_->close();
}

auto
dispatcher::idle_connections() const -> std::size_t
{
  return impl_->idle_connections();
}

auto
dispatcher::open_connections() const -> std::size_t
{
  return impl_->open_connections();
}
} // namespace relay::core

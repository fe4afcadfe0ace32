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
#include "config_source.hxx"

#include "core/dispatcher.hxx"
#include "core/logger/logger.hxx"
#include "core/mcbp/codec.hxx"
#include "core/utils/url_codec.hxx"

#include <relay/error_codes.hxx>

#include <asio/io_context.hpp>
#include <asio/steady_timer.hpp>
#include <fmt/core.h>

#include <mutex>
#include <utility>

namespace relay::core::topology
{
namespace
{
/**
 * One poll of one endpoint: the exchange, the timer bounding it, and the handler waiting for the
 * parsed map.
 */
class config_fetch
  : public pending_operation
  , public std::enable_shared_from_this<config_fetch>
{
public:
  config_fetch(asio::io_context& io, std::string endpoint, config_source::fetch_handler&& handler)
    : timer_{ io }
    , endpoint_{ std::move(endpoint) }
    , handler_{ std::move(handler) }
  {
  }

  void arm(std::chrono::milliseconds timeout)
  {
    const std::scoped_lock lock(mutex_);
    timer_.expires_after(timeout);
    timer_.async_wait([self = shared_from_this()](std::error_code ec) {
      if (ec == asio::error::operation_aborted) {
        return;
      }
      RELAY_LOG_DEBUG("configuration fetch from {} timed out", self->endpoint_);
      self->complete(errc::common::timeout, {});
    });
  }

  void attach(std::shared_ptr<pending_operation> exchange)
  {
    {
      const std::scoped_lock lock(mutex_);
      if (!done_) {
        exchange_ = std::move(exchange);
        return;
      }
    }
    if (exchange) {
      exchange->cancel();
    }
  }

  void attach_body(std::shared_ptr<io::http_body_reader> body)
  {
    {
      const std::scoped_lock lock(mutex_);
      if (!done_) {
        body_ = std::move(body);
        return;
      }
    }
    if (body) {
      body->cancel();
    }
  }

  void complete(std::error_code ec, std::optional<configuration> config)
  {
    auto handler = release();
    if (handler) {
      handler(ec, std::move(config));
    }
  }

  void cancel() override
  {
    release();
  }

  [[nodiscard]] auto endpoint() const -> const std::string&
  {
    return endpoint_;
  }

  [[nodiscard]] auto hostname() const -> std::string
  {
    return split_endpoint(endpoint_).first;
  }

private:
  auto release() -> config_source::fetch_handler
  {
    config_source::fetch_handler handler;
    std::shared_ptr<pending_operation> exchange;
    std::shared_ptr<io::http_body_reader> body;
    {
      const std::scoped_lock lock(mutex_);
      if (done_) {
        return {};
      }
      done_ = true;
      handler = std::move(handler_);
      exchange = std::move(exchange_);
      body = std::move(body_);
      timer_.cancel();
    }
    if (exchange) {
      exchange->cancel();
    }
    if (body) {
      body->cancel();
    }
    return handler;
  }

  std::mutex mutex_{};
  asio::steady_timer timer_;
  std::string endpoint_;
  config_source::fetch_handler handler_;
  std::shared_ptr<pending_operation> exchange_{};
  std::shared_ptr<io::http_body_reader> body_{};
  bool done_{ false };
};

void
parse_and_complete(const std::shared_ptr<config_fetch>& fetch, std::string_view payload)
{
  try {
    auto config = parse_configuration(payload, fetch->hostname());
    fetch->complete({}, std::move(config));
  } catch (const std::exception& e) {
    RELAY_LOG_WARNING("unable to parse configuration from {}: {}", fetch->endpoint(), e.what());
    fetch->complete(errc::common::protocol_failure, {});
  }
}

void
read_body(std::shared_ptr<config_fetch> fetch,
          std::shared_ptr<io::http_body_reader> body,
          std::shared_ptr<std::string> payload)
{
  auto reader = body;
  reader->next([fetch = std::move(fetch), body = std::move(body), payload = std::move(payload)](
                 std::error_code ec, std::string chunk, bool complete) mutable {
    if (ec) {
      fetch->complete(ec, {});
      return;
    }
    if (payload->size() + chunk.size() > max_config_size) {
      RELAY_LOG_WARNING("configuration from {} exceeds {} bytes, dropping it", fetch->endpoint(), max_config_size);
      fetch->complete(errc::common::protocol_failure, {});
      return;
    }
    payload->append(chunk);
    if (complete) {
      parse_and_complete(fetch, *payload);
      return;
    }
    read_body(std::move(fetch), std::move(body), std::move(payload));
  });
}

auto
seeds_or_current(const std::shared_ptr<const configuration>& current,
                 const std::string& network,
                 service_type type,
                 bool use_tls,
                 const std::vector<std::string>& seeds) -> std::vector<std::string>
{
  if (current) {
    if (auto endpoints = current->endpoints_for(network, type, use_tls); !endpoints.empty()) {
      return endpoints;
    }
  }
  return seeds;
}
} // namespace

cccp_config_source::cccp_config_source(asio::io_context& io,
                                       std::shared_ptr<dispatcher> dispatcher,
                                       std::vector<std::string> seeds,
                                       bool use_tls,
                                       std::chrono::milliseconds timeout)
  : io_{ io }
  , dispatcher_{ std::move(dispatcher) }
  , seeds_{ std::move(seeds) }
  , use_tls_{ use_tls }
  , timeout_{ timeout }
{
}

auto
cccp_config_source::name() const -> const char*
{
  return "cccp";
}

auto
cccp_config_source::endpoints(const std::shared_ptr<const configuration>& current,
                              const std::string& network) const -> std::vector<std::string>
{
  return seeds_or_current(current, network, service_type::key_value, use_tls_, seeds_);
}

auto
cccp_config_source::fetch(const std::string& endpoint, fetch_handler&& handler) -> std::shared_ptr<pending_operation>
{
  auto fetch = std::make_shared<config_fetch>(io_, endpoint, std::move(handler));
  fetch->arm(timeout_);

  mcbp::packet request{};
  request.magic_ = protocol::magic::client_request;
  request.command_ = protocol::client_opcode::get_cluster_config;
  auto exchange = dispatcher_->send_kv(
    endpoint,
    std::move(request),
    nullptr,
    [fetch](error err, kv_exchange_result result) {
      if (err) {
        RELAY_LOG_DEBUG("unable to fetch configuration over cccp from {}: {}", fetch->endpoint(), err.ec.message());
        fetch->complete(err.ec, {});
        return;
      }
      if (result.response.status_code_ != protocol::key_value_status_code::success) {
        RELAY_LOG_DEBUG("{} rejected GET_CLUSTER_CONFIG, status={:#x}", fetch->endpoint(), result.response.status_);
        fetch->complete(errc::network::configuration_not_available, {});
        return;
      }
      parse_and_complete(fetch, mcbp::to_string(result.response.value_));
    },
    false);
  fetch->attach(std::move(exchange));
  return fetch;
}

http_config_source::http_config_source(asio::io_context& io,
                                       std::shared_ptr<dispatcher> dispatcher,
                                       std::vector<std::string> seeds,
                                       bool use_tls,
                                       std::string bucket_name,
                                       std::chrono::milliseconds timeout,
                                       std::chrono::milliseconds retry_delay)
  : io_{ io }
  , dispatcher_{ std::move(dispatcher) }
  , seeds_{ std::move(seeds) }
  , use_tls_{ use_tls }
  , bucket_name_{ std::move(bucket_name) }
  , timeout_{ timeout }
  , retry_delay_{ retry_delay }
  , backoff_{ std::make_shared<backoff_map>() }
{
}

auto
http_config_source::name() const -> const char*
{
  return "http";
}

auto
http_config_source::endpoints(const std::shared_ptr<const configuration>& current,
                              const std::string& network) const -> std::vector<std::string>
{
  auto endpoints = seeds_or_current(current, network, service_type::management, use_tls_, seeds_);
  const auto now = std::chrono::steady_clock::now();
  std::vector<std::string> ready{};
  {
    const std::scoped_lock lock(backoff_->mutex);
    for (const auto& endpoint : endpoints) {
      if (auto it = backoff_->failed_until.find(endpoint); it == backoff_->failed_until.end() || it->second <= now) {
        ready.emplace_back(endpoint);
      }
    }
  }
  if (ready.empty()) {
    return endpoints;
  }
  return ready;
}

auto
http_config_source::path() const -> std::string
{
  if (bucket_name_.empty()) {
    return "/pools/default/nodeServices";
  }
  return fmt::format("/pools/default/b/{}", utils::string_codec::path_escape(bucket_name_));
}

auto
http_config_source::fetch(const std::string& endpoint, fetch_handler&& handler) -> std::shared_ptr<pending_operation>
{
  auto fetch = std::make_shared<config_fetch>(
    io_,
    endpoint,
    [backoff = backoff_, retry_delay = retry_delay_, endpoint, handler = std::move(handler)](
      std::error_code ec, std::optional<configuration> config) mutable {
      {
        const std::scoped_lock lock(backoff->mutex);
        if (ec) {
          backoff->failed_until[endpoint] = std::chrono::steady_clock::now() + retry_delay;
        } else {
          backoff->failed_until.erase(endpoint);
        }
      }
      handler(ec, std::move(config));
    });
  fetch->arm(timeout_);

  io::http_request request{};
  request.type = service_type::management;
  request.method = "GET";
  request.path = path();
  request.endpoint = endpoint;
  auto exchange = dispatcher_->send_http(
    endpoint,
    std::move(request),
    nullptr,
    [fetch](error err, http_exchange_result result) {
      if (err) {
        RELAY_LOG_DEBUG("unable to fetch configuration over http from {}: {}", fetch->endpoint(), err.ec.message());
        fetch->complete(err.ec, {});
        return;
      }
      auto body = result.response.body;
      if (result.response.status_code != 200) {
        RELAY_LOG_DEBUG("{} responded with status {} to configuration request",
                        fetch->endpoint(),
                        result.response.status_code);
        if (body) {
          body->cancel();
        }
        fetch->complete(errc::network::configuration_not_available, {});
        return;
      }
      if (!body) {
        fetch->complete(errc::common::protocol_failure, {});
        return;
      }
      fetch->attach_body(body);
      read_body(fetch, std::move(body), std::make_shared<std::string>());
    },
    false);
  fetch->attach(std::move(exchange));
  return fetch;
}
} // namespace relay::core::topology

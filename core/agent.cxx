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
#include "agent.hxx"

#include "circuit_breaker.hxx"
#include "component_context.hxx"
#include "dispatcher.hxx"
#include "logger/logger.hxx"
#include "operation_registry.hxx"
#include "retry_orchestrator.hxx"
#include "topology/config_source.hxx"
#include "topology_manager.hxx"
#include "tracing/noop_tracer.hxx"

#include <relay/best_effort_retry_strategy.hxx>
#include <relay/error_codes.hxx>

#include <asio/io_context.hpp>
#include <asio/post.hpp>

#include <algorithm>
#include <atomic>
#include <utility>
#include <vector>

namespace relay::core
{
namespace
{
auto
make_dispatcher_options(const agent_config& config) -> dispatcher_options
{
  dispatcher_options options{};
  options.bucket_name = config.bucket_name;
  options.user_agent = config.user_agent;
  options.authenticator = config.authenticator;
  options.tracer = config.tracer;
  options.stream_factory = config.stream_factory;
  if (!options.stream_factory) {
    auto tls = config.tls_context;
    if (config.use_tls && !tls) {
      if (auto context = make_tls_context(); context) {
        tls = context.value();
      } else {
        RELAY_LOG_ERROR("unable to create TLS context: {}", context.error().message);
      }
    }
    options.stream_factory = io::make_stream_factory(config.use_tls ? tls : nullptr);
  }
  options.kv_connect_timeout = config.timeouts.key_value_connect_timeout;
  options.http_connect_timeout = config.timeouts.connect_timeout;
  options.use_compression = config.connections.use_compression;
  options.compression_min_size = config.connections.compression_min_size;
  options.compression_min_ratio = config.connections.compression_min_ratio;
  options.use_mutation_tokens = config.connections.use_mutation_tokens;
  options.use_server_durations = config.connections.use_server_durations;

  options.kv_pool.max_connections = config.connections.kv_pool_size;
  options.kv_pool.max_idle_connections = config.connections.kv_pool_size;
  options.kv_pool.max_queue_size = config.connections.max_queue_size;
  options.kv_pool.idle_timeout = std::chrono::hours{ 24 };

  options.http_pool.max_connections = 0;
  options.http_pool.max_idle_connections =
    std::min(config.connections.max_perhost_idle_http_connections, config.connections.max_idle_http_connections);
  options.http_pool.max_queue_size = config.connections.max_queue_size;
  options.http_pool.idle_timeout = config.connections.idle_http_connection_timeout;
  return options;
}

auto
make_config_sources(asio::io_context& io, const agent_config& config, const std::shared_ptr<dispatcher>& transport)
  -> std::vector<std::shared_ptr<topology::config_source>>
{
  std::vector<std::shared_ptr<topology::config_source>> sources{};
  if (!config.memd_addresses.empty()) {
    sources.emplace_back(std::make_shared<topology::cccp_config_source>(
      io, transport, config.memd_addresses, config.use_tls, config.polling.poll_timeout));
  }
  if (!config.http_addresses.empty()) {
    sources.emplace_back(std::make_shared<topology::http_config_source>(io,
                                                                        transport,
                                                                        config.http_addresses,
                                                                        config.use_tls,
                                                                        config.bucket_name,
                                                                        config.polling.poll_timeout,
                                                                        config.polling.http_retry_delay));
  }
  return sources;
}
} // namespace

class agent_impl
{
public:
  agent_impl(asio::io_context& io, agent_config config)
    : io_{ io }
    , config_{ std::move(config) }
    , registry_{ std::make_shared<operation_registry>() }
    , orchestrator_{ std::make_shared<retry_orchestrator>(
        config_.default_retry_strategy ? config_.default_retry_strategy
                                       : std::shared_ptr<retry_strategy>{ make_best_effort_retry_strategy() }) }
    , breakers_{ std::make_shared<circuit_breaker_registry>(config_.circuit_breaker) }
    , tracer_{ config_.tracer ? config_.tracer
                              : std::shared_ptr<relay::tracing::request_tracer>{ std::make_shared<tracing::noop_tracer>() } }
    , transport_{ std::make_shared<dispatcher>(io_, make_dispatcher_options(config_), breakers_) }
    , topology_{ std::make_shared<topology_manager>(
        io_,
        topology_manager_options{
          config_.network, config_.use_tls, config_.polling.poll_interval, config_.polling.poll_floor },
        breakers_,
        make_config_sources(io_, config_, transport_)) }
    , context_{ io_, registry_, orchestrator_, topology_, transport_, tracer_, config_.wait_for_config }
    , kv_{ context_, config_.timeouts.key_value_timeout }
    , http_{ context_, config_.timeouts }
    , query_{ context_, config_.timeouts, config_.bucket_name }
  {
    RELAY_LOG_DEBUG("creating new agent: {}", config_.to_string());
  }

  agent_impl(const agent_impl&) = delete;
  agent_impl(agent_impl&&) = delete;
  auto operator=(const agent_impl&) -> agent_impl& = delete;
  auto operator=(agent_impl&&) -> agent_impl& = delete;

  ~agent_impl()
  {
    close();
  }

  void start()
  {
    if (closed_) {
      return;
    }
    tracer_->start();
    topology_->start();
  }

  void wait_until_ready(std::chrono::milliseconds timeout, utils::movable_function<void(error)>&& handler)
  {
    if (closed_) {
      asio::post(io_, [handler = std::move(handler)]() mutable {
        handler(error{ errc::common::cluster_closed, "agent is closed" });
      });
      return;
    }
    topology_->wait_for_config(timeout, [handler = std::move(handler)](std::error_code ec) mutable {
      if (ec == errc::common::timeout) {
        return handler(error{ ec, "no topology snapshot has been obtained before the timeout" });
      }
      if (ec) {
        return handler(error{ ec, "agent closed while waiting for the topology" });
      }
      handler({});
    });
  }

  template<typename Request, typename Callback, typename Forward>
  auto submit(Request&& request, Callback&& callback, Forward&& forward)
    -> tl::expected<std::shared_ptr<pending_operation>, error>
  {
    if (closed_) {
      return tl::unexpected(error{ errc::common::cluster_closed, "agent is closed" });
    }
    return forward(std::forward<Request>(request), std::forward<Callback>(callback));
  }

  auto execute(kv_request request, kv_callback&& callback) -> tl::expected<std::shared_ptr<pending_operation>, error>
  {
    return submit(std::move(request), std::move(callback), [this](auto&& r, auto&& c) {
      return kv_.execute(std::forward<decltype(r)>(r), std::forward<decltype(c)>(c));
    });
  }

  auto http_request(core::http_request request, http_callback&& callback)
    -> tl::expected<std::shared_ptr<pending_operation>, error>
  {
    return submit(std::move(request), std::move(callback), [this](auto&& r, auto&& c) {
      return http_.do_http_request(std::forward<decltype(r)>(r), std::forward<decltype(c)>(c));
    });
  }

  auto analytics_query(analytics_query_request request, query_callback&& callback)
    -> tl::expected<std::shared_ptr<pending_operation>, error>
  {
    return submit(std::move(request), std::move(callback), [this](auto&& r, auto&& c) {
      return query_.analytics_query(std::forward<decltype(r)>(r), std::forward<decltype(c)>(c));
    });
  }

  auto n1ql_query(n1ql_query_request request, query_callback&& callback)
    -> tl::expected<std::shared_ptr<pending_operation>, error>
  {
    return submit(std::move(request), std::move(callback), [this](auto&& r, auto&& c) {
      return query_.n1ql_query(std::forward<decltype(r)>(r), std::forward<decltype(c)>(c));
    });
  }

  auto search_query(search_query_request request, query_callback&& callback)
    -> tl::expected<std::shared_ptr<pending_operation>, error>
  {
    return submit(std::move(request), std::move(callback), [this](auto&& r, auto&& c) {
      return query_.search_query(std::forward<decltype(r)>(r), std::forward<decltype(c)>(c));
    });
  }

  auto view_query(view_query_request request, query_callback&& callback)
    -> tl::expected<std::shared_ptr<pending_operation>, error>
  {
    return submit(std::move(request), std::move(callback), [this](auto&& r, auto&& c) {
      return query_.view_query(std::forward<decltype(r)>(r), std::forward<decltype(c)>(c));
    });
  }

  [[nodiscard]] auto topology() const -> std::shared_ptr<const topology::configuration>
  {
    return topology_->current();
  }

  [[nodiscard]] auto bucket_name() const -> const std::string&
  {
    return config_.bucket_name;
  }

  void close()
  {
    if (closed_.exchange(true)) {
      return;
    }
    RELAY_LOG_DEBUG("closing agent, outstanding operations={}", registry_->outstanding());
    registry_->abort_all(errc::common::cluster_closed, "agent closed");
    topology_->close();
    transport_->close();
    tracer_->stop();
  }

  [[nodiscard]] auto outstanding_operations() const -> std::size_t
  {
    return registry_->outstanding();
  }

  [[nodiscard]] auto background_tasks() const -> std::size_t
  {
    return registry_->background_tasks();
  }

  [[nodiscard]] auto open_connections() const -> std::size_t
  {
    return transport_->open_connections();
  }

private:
  asio::io_context& io_;
  agent_config config_;
  std::atomic_bool closed_{ false };
  std::shared_ptr<operation_registry> registry_;
  std::shared_ptr<const retry_orchestrator> orchestrator_;
  std::shared_ptr<circuit_breaker_registry> breakers_;
  std::shared_ptr<relay::tracing::request_tracer> tracer_;
  std::shared_ptr<dispatcher> transport_;
  std::shared_ptr<topology_manager> topology_;
  component_context context_;
  kv_component kv_;
  http_component http_;
  query_component query_;
};

agent::agent(asio::io_context& io, agent_config config)
  : impl_{ std::make_shared<agent_impl>(io, std::move(config)) }
{
}

agent::~agent()
{
  impl_->close();
}

void
agent::start()
{
  impl_->start();
}

void
agent::wait_until_ready(std::chrono::milliseconds timeout, utils::movable_function<void(error)>&& handler)
{
  impl_->wait_until_ready(timeout, std::move(handler));
}

auto
agent::execute(kv_request request, kv_callback&& callback) -> tl::expected<std::shared_ptr<pending_operation>, error>
{
  return impl_->execute(std::move(request), std::move(callback));
}

auto
agent::http_request(core::http_request request, http_callback&& callback)
  -> tl::expected<std::shared_ptr<pending_operation>, error>
{
  return impl_->http_request(std::move(request), std::move(callback));
}

auto
agent::analytics_query(analytics_query_request request, query_callback&& callback)
  -> tl::expected<std::shared_ptr<pending_operation>, error>
{
  return impl_->analytics_query(std::move(request), std::move(callback));
}

auto
agent::n1ql_query(n1ql_query_request request, query_callback&& callback)
  -> tl::expected<std::shared_ptr<pending_operation>, error>
{
  return impl_->n1ql_query(std::move(request), std::move(callback));
}

auto
agent::search_query(search_query_request request, query_callback&& callback)
  -> tl::expected<std::shared_ptr<pending_operation>, error>
{
  return impl_->search_query(std::move(request), std::move(callback));
}

auto
agent::view_query(view_query_request request, query_callback&& callback)
  -> tl::expected<std::shared_ptr<pending_operation>, error>
{
  return impl_->view_query(std::move(request), std::move(callback));
}

auto
agent::topology() const -> std::shared_ptr<const topology::configuration>
{
  return impl_->topology();
}

auto
agent::bucket_name() const -> const std::string&
{
  return impl_->bucket_name();
}

void
agent::close()
{
  impl_->close();
}

auto
agent::outstanding_operations() const -> std::size_t
{
  return impl_->outstanding_operations();
}

auto
agent::background_tasks() const -> std::size_t
{
  return impl_->background_tasks();
}

auto
agent::open_connections() const -> std::size_t
{
  return impl_->open_connections();
}
} // namespace relay::core

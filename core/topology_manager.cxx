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
#include "topology_manager.hxx"

#include "circuit_breaker.hxx"
#include "dispatcher.hxx"
#include "logger/logger.hxx"

#include <relay/error_codes.hxx>

#include <asio/post.hpp>

#include <algorithm>

namespace relay::core
{
topology_manager::topology_manager(asio::io_context& io,
                                   topology_manager_options options,
                                   std::shared_ptr<circuit_breaker_registry> breakers,
                                   std::vector<std::shared_ptr<topology::config_source>> sources)
  : io_{ io }
  , options_{ std::move(options) }
  , breakers_{ std::move(breakers) }
  , sources_{ std::move(sources) }
  , network_{ options_.network }
  , poll_timer_{ io_ }
{
}

void
topology_manager::start()
{
  {
    const std::scoped_lock lock(poll_mutex_);
    if (started_ || closed_) {
      return;
    }
    started_ = true;
  }
  asio::post(io_, [self = shared_from_this()]() {
    self->poll();
  });
}

void
topology_manager::close()
{
  std::shared_ptr<pending_operation> fetch{};
  {
    const std::scoped_lock lock(poll_mutex_);
    if (closed_) {
      return;
    }
    closed_ = true;
    poll_timer_.cancel();
    fetch = std::move(current_fetch_);
  }
  if (fetch) {
    fetch->cancel();
  }
  RELAY_LOG_DEBUG("stop polling topology");
  notify_config_waiters(errc::common::cluster_closed);
  notify_refresh_waiters();
}

auto
topology_manager::current() const -> std::shared_ptr<const topology::configuration>
{
  return std::atomic_load(&current_);
}

auto
topology_manager::network() const -> std::string
{
  const std::scoped_lock lock(network_mutex_);
  if (network_.empty()) {
    return "default";
  }
  return network_;
}

auto
topology_manager::update(topology::configuration config, const std::string& source_hostname) -> bool
{
  std::shared_ptr<const topology::configuration> published{};
  {
    const std::scoped_lock lock(update_mutex_);
    auto previous = std::atomic_load(&current_);
    if (previous && !(*previous < config)) {
      RELAY_LOG_TRACE("ignore configuration rev={}, current rev={}", config.rev_str(), previous->rev_str());
      return false;
    }
    if (!previous) {
      const std::scoped_lock network_lock(network_mutex_);
      if (network_.empty()) {
        network_ = config.select_network(source_hostname);
        RELAY_LOG_INFO(R"(detected network is "{}", bootstrap hostname="{}")", network_, source_hostname);
      }
      RELAY_LOG_DEBUG("initialize configuration rev={}", config.rev_str());
    } else {
      RELAY_LOG_DEBUG("will update the configuration old={} -> new={}", previous->rev_str(), config.rev_str());
    }
    published = std::make_shared<const topology::configuration>(std::move(config));
    std::atomic_store(&current_, published);
  }
  notify_config_waiters({});
  return true;
}

void
topology_manager::refresh_now()
{
  const std::scoped_lock lock(poll_mutex_);
  if (!started_ || closed_ || polling_) {
    return;
  }
  auto at = std::max(std::chrono::steady_clock::now(), last_poll_ + options_.poll_floor);
  if (next_poll_at_ <= at) {
    return;
  }
  schedule_poll_locked(at);
}

auto
topology_manager::on_next_refresh(utils::movable_function<void()>&& handler) -> std::uint64_t
{
  std::uint64_t id{};
  bool closed{ false };
  {
    const std::scoped_lock lock(poll_mutex_);
    closed = closed_;
  }
  {
    const std::scoped_lock lock(waiters_mutex_);
    id = ++next_waiter_id_;
    if (!closed) {
      refresh_waiters_.emplace(id, std::move(handler));
    }
  }
  if (closed) {
    asio::post(io_, [handler = std::move(handler)]() mutable {
      handler();
    });
    return id;
  }
  refresh_now();
  return id;
}

void
topology_manager::cancel_waiter(std::uint64_t id)
{
  utils::movable_function<void()> handler{};
  {
    const std::scoped_lock lock(waiters_mutex_);
    if (auto it = refresh_waiters_.find(id); it != refresh_waiters_.end()) {
      handler = std::move(it->second);
      refresh_waiters_.erase(it);
    }
  }
  // destroyed outside of the lock, it may own the last reference to its operation
}

void
topology_manager::wait_for_config(std::chrono::milliseconds timeout, ready_handler&& handler)
{
  if (current()) {
    asio::post(io_, [handler = std::move(handler)]() mutable {
      handler({});
    });
    return;
  }

  auto timer = std::make_shared<asio::steady_timer>(io_);
  std::uint64_t id{};
  {
    const std::scoped_lock lock(waiters_mutex_);
    id = ++next_waiter_id_;
    config_waiters_.emplace(id, config_waiter{ std::move(handler), timer });
  }
  timer->expires_after(timeout);
  timer->async_wait([self = shared_from_this(), id](std::error_code ec) {
    if (ec == asio::error::operation_aborted) {
      return;
    }
    ready_handler expired{};
    {
      const std::scoped_lock lock(self->waiters_mutex_);
      if (auto it = self->config_waiters_.find(id); it != self->config_waiters_.end()) {
        expired = std::move(it->second.handler);
        self->config_waiters_.erase(it);
      }
    }
    if (expired) {
      expired(errc::common::timeout);
    }
  });

  // the map may have been published between the check and the registration
  if (current()) {
    notify_config_waiters({});
  }
}

auto
topology_manager::has_service(service_type service) const -> bool
{
  auto snapshot = current();
  return snapshot && !snapshot->endpoints_for(network(), service, options_.use_tls).empty();
}

auto
topology_manager::select_node(service_type service,
                              const attempt_context& ctx,
                              std::optional<std::string_view> key) const
  -> tl::expected<node_selection, std::error_code>
{
  auto snapshot = current();
  if (!snapshot) {
    return tl::unexpected(std::error_code{ errc::common::topology_unavailable });
  }
  const auto net = network();

  if (key && service == service_type::key_value && snapshot->vbmap) {
    auto [vbucket, index] = snapshot->map_key(key.value());
    if (!index || index.value() >= snapshot->nodes.size()) {
      return tl::unexpected(std::error_code{ errc::network::configuration_not_available });
    }
    auto endpoint = snapshot->nodes[index.value()].endpoint(net, service, options_.use_tls);
    if (!endpoint) {
      return tl::unexpected(std::error_code{ errc::common::service_not_available });
    }
    return node_selection{ endpoint.value(), vbucket };
  }

  auto candidates = snapshot->endpoints_for(net, service, options_.use_tls);
  if (candidates.empty()) {
    return tl::unexpected(std::error_code{ errc::common::service_not_available });
  }

  if (ctx.target == retry_target::preserve && !ctx.last_dispatched_to.empty()) {
    if (std::find(candidates.begin(), candidates.end(), ctx.last_dispatched_to) != candidates.end() &&
        breakers_->would_allow(ctx.last_dispatched_to, service)) {
      return node_selection{ ctx.last_dispatched_to, {} };
    }
  }

  std::vector<std::string> admitted{};
  for (const auto& candidate : candidates) {
    if (breakers_->would_allow(candidate, service)) {
      admitted.emplace_back(candidate);
    }
  }
  if (admitted.empty()) {
    return tl::unexpected(std::error_code{ errc::common::circuit_open });
  }
  if (ctx.target == retry_target::avoid_last && admitted.size() > 1) {
    admitted.erase(std::remove(admitted.begin(), admitted.end(), ctx.last_dispatched_to), admitted.end());
  }
  auto index = round_robin_.fetch_add(1) % admitted.size();
  return node_selection{ admitted[index], {} };
}

void
topology_manager::poll()
{
  auto snapshot = current();
  auto net = network();
  auto plan = std::make_shared<std::vector<poll_step>>();
  {
    const std::scoped_lock lock(poll_mutex_);
    if (closed_ || polling_) {
      return;
    }
    polling_ = true;
    last_poll_ = std::chrono::steady_clock::now();
    next_poll_at_ = std::chrono::steady_clock::time_point::max();

    for (const auto& source : sources_) {
      auto endpoints = source->endpoints(snapshot, net);
      if (endpoints.empty()) {
        continue;
      }
      auto offset = poll_offset_ % endpoints.size();
      std::rotate(endpoints.begin(), endpoints.begin() + static_cast<std::ptrdiff_t>(offset), endpoints.end());
      for (auto& endpoint : endpoints) {
        plan->push_back({ source, std::move(endpoint) });
      }
    }
    ++poll_offset_;
  }
  RELAY_LOG_TRACE("poll topology, rev={}, candidates={}", snapshot ? snapshot->rev_str() : "(none)", plan->size());
  try_next(std::move(plan), 0);
}

void
topology_manager::try_next(std::shared_ptr<std::vector<poll_step>> plan, std::size_t index)
{
  if (index >= plan->size()) {
    if (!current()) {
      RELAY_LOG_WARNING("unable to fetch configuration from any of {} endpoints", plan->size());
    }
    return finish_poll();
  }

  const auto& step = plan->at(index);
  auto endpoint = step.endpoint;
  auto fetch = step.source->fetch(
    endpoint,
    [self = shared_from_this(), plan, index, endpoint](std::error_code ec,
                                                       std::optional<topology::configuration> config) mutable {
      if (!ec && config) {
        self->update(std::move(config.value()), split_endpoint(endpoint).first);
        return self->finish_poll();
      }
      RELAY_LOG_DEBUG(R"(unable to fetch configuration from "{}" over {}, ec={})",
                      endpoint,
                      plan->at(index).source->name(),
                      ec.message());
      self->try_next(std::move(plan), index + 1);
    });

  bool closed{ false };
  {
    const std::scoped_lock lock(poll_mutex_);
    closed = closed_;
    if (!closed) {
      current_fetch_ = fetch;
    }
  }
  if (closed && fetch) {
    fetch->cancel();
  }
}

void
topology_manager::finish_poll()
{
  {
    const std::scoped_lock lock(poll_mutex_);
    polling_ = false;
    current_fetch_.reset();
    if (!closed_) {
      auto delay = options_.poll_interval;
      if (!current()) {
        auto backoff = options_.poll_floor * (1LL << std::min<std::size_t>(bootstrap_attempts_, 16));
        delay = std::min(options_.poll_interval, std::chrono::duration_cast<std::chrono::milliseconds>(backoff));
        ++bootstrap_attempts_;
      }
      schedule_poll_locked(std::chrono::steady_clock::now() + delay);
    }
  }
  notify_refresh_waiters();
}

void
topology_manager::schedule_poll_locked(std::chrono::steady_clock::time_point at)
{
  next_poll_at_ = at;
  poll_timer_.expires_at(at);
  poll_timer_.async_wait([self = shared_from_this()](std::error_code ec) {
    if (ec == asio::error::operation_aborted) {
      return;
    }
    self->poll();
  });
}

void
topology_manager::notify_refresh_waiters()
{
  std::map<std::uint64_t, utils::movable_function<void()>> waiters{};
  {
    const std::scoped_lock lock(waiters_mutex_);
    std::swap(waiters, refresh_waiters_);
  }
  for (auto& [id, handler] : waiters) {
    handler();
  }
}

void
topology_manager::notify_config_waiters(std::error_code ec)
{
  std::map<std::uint64_t, config_waiter> waiters{};
  {
    const std::scoped_lock lock(waiters_mutex_);
    std::swap(waiters, config_waiters_);
  }
  for (auto& [id, waiter] : waiters) {
    waiter.timer->cancel();
    waiter.handler(ec);
  }
}
} // namespace relay::core

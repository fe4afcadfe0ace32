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

#include "circuit_breaker.hxx"

#include "core/logger/logger.hxx"

#include <relay/fmt/service_type.hxx>

#include <fmt/core.h>

#include <algorithm>

namespace relay::core
{
consecutive_failures_policy::consecutive_failures_policy(std::size_t threshold)
  : threshold_{ std::max<std::size_t>(threshold, 1) }
{
}

void
consecutive_failures_policy::record(circuit_outcome outcome, circuit_clock::time_point /* now */)
{
  if (outcome == circuit_outcome::success) {
    consecutive_failures_ = 0;
  } else {
    ++consecutive_failures_;
  }
}

auto
consecutive_failures_policy::should_trip(circuit_clock::time_point /* now */) -> bool
{
  return consecutive_failures_ >= threshold_;
}

void
consecutive_failures_policy::reset()
{
  consecutive_failures_ = 0;
}

rolling_window_policy::rolling_window_policy(std::chrono::milliseconds window,
                                             std::size_t volume_threshold,
                                             double error_threshold_percentage)
  : window_{ window }
  , volume_threshold_{ std::max<std::size_t>(volume_threshold, 1) }
  , error_threshold_percentage_{ error_threshold_percentage }
{
}

void
rolling_window_policy::expire(circuit_clock::time_point now)
{
  while (!outcomes_.empty() && outcomes_.front().first + window_ <= now) {
    if (outcomes_.front().second == circuit_outcome::failure) {
      --failures_;
    }
    outcomes_.pop_front();
  }
}

void
rolling_window_policy::record(circuit_outcome outcome, circuit_clock::time_point now)
{
  expire(now);
  outcomes_.emplace_back(now, outcome);
  if (outcome == circuit_outcome::failure) {
    ++failures_;
  }
}

auto
rolling_window_policy::should_trip(circuit_clock::time_point now) -> bool
{
  expire(now);
  if (outcomes_.size() < volume_threshold_) {
    return false;
  }
  const auto failure_percentage =
    100.0 * static_cast<double>(failures_) / static_cast<double>(outcomes_.size());
  return failure_percentage >= error_threshold_percentage_;
}

void
rolling_window_policy::reset()
{
  outcomes_.clear();
  failures_ = 0;
}

auto
make_failure_policy(const circuit_breaker_config& config) -> std::unique_ptr<failure_policy>
{
  switch (config.policy) {
    case circuit_breaker_policy::consecutive_failures:
      return std::make_unique<consecutive_failures_policy>(config.failure_threshold);
    case circuit_breaker_policy::rolling_window:
      break;
  }
  return std::make_unique<rolling_window_policy>(
    config.rolling_window, config.volume_threshold, config.error_threshold_percentage);
}

circuit_breaker::circuit_breaker(std::string name,
                                 const circuit_breaker_config& config,
                                 circuit_clock_function now)
  : name_{ std::move(name) }
  , config_{ config }
  , now_{ std::move(now) }
  , policy_{ make_failure_policy(config) }
  , sleep_window_{ config.sleep_window }
{
}

auto
circuit_breaker::claim_canary(circuit_clock::time_point now) -> circuit_ticket
{
  ++generation_;
  canary_in_flight_ = true;
  canary_started_at_ = now;
  return { generation_, true };
}

auto
circuit_breaker::allow_request() -> std::optional<circuit_ticket>
{
  const std::scoped_lock lock(mutex_);
  switch (state_) {
    case circuit_state::closed:
      return circuit_ticket{ generation_, false };

    case circuit_state::open: {
      auto now = now_();
      if (now < open_until_) {
        return std::nullopt;
      }
      state_ = circuit_state::half_open;
      RELAY_LOG_DEBUG("circuit breaker {} is half_open, letting canary through", name_);
      return claim_canary(now);
    }

    case circuit_state::half_open: {
      auto now = now_();
      if (canary_in_flight_ && now < canary_started_at_ + config_.canary_timeout) {
        return std::nullopt;
      }
      // the previous canary is forgotten, its outcome no longer counts
      return claim_canary(now);
    }
  }
  return std::nullopt;
}

auto
circuit_breaker::would_allow() const -> bool
{
  const std::scoped_lock lock(mutex_);
  switch (state_) {
    case circuit_state::closed:
      return true;
    case circuit_state::open:
      return now_() >= open_until_;
    case circuit_state::half_open:
      return !canary_in_flight_ || now_() >= canary_started_at_ + config_.canary_timeout;
  }
  return false;
}

void
circuit_breaker::trip(circuit_clock::time_point now)
{
  state_ = circuit_state::open;
  ++generation_;
  canary_in_flight_ = false;
  open_until_ = now + sleep_window_;
  RELAY_LOG_INFO("circuit breaker {} is open for {}ms", name_, sleep_window_.count());
}

void
circuit_breaker::report(const circuit_ticket& ticket, circuit_outcome outcome)
{
  const std::scoped_lock lock(mutex_);
  if (ticket.generation != generation_) {
    RELAY_LOG_TRACE("circuit breaker {} ignores outcome of generation {}, current is {}", name_, ticket.generation, generation_);
    return;
  }
  auto now = now_();
  switch (state_) {
    case circuit_state::closed:
      policy_->record(outcome, now);
      if (outcome == circuit_outcome::failure && policy_->should_trip(now)) {
        trip(now);
      }
      return;

    case circuit_state::half_open:
      if (!ticket.canary) {
        return;
      }
      if (outcome == circuit_outcome::success) {
        state_ = circuit_state::closed;
        ++generation_;
        canary_in_flight_ = false;
        sleep_window_ = config_.sleep_window;
        policy_->reset();
        RELAY_LOG_INFO("circuit breaker {} is closed after successful canary", name_);
        return;
      }
      if (config_.max_sleep_window > std::chrono::milliseconds::zero()) {
        auto next = std::chrono::milliseconds(static_cast<std::chrono::milliseconds::rep>(
          static_cast<double>(sleep_window_.count()) * config_.sleep_window_backoff_factor));
        sleep_window_ = std::min(next, config_.max_sleep_window);
      }
      trip(now);
      return;

    case circuit_state::open:
      return;
  }
}

auto
circuit_breaker::state() const -> circuit_state
{
  const std::scoped_lock lock(mutex_);
  return state_;
}

void
circuit_breaker::reset()
{
  const std::scoped_lock lock(mutex_);
  state_ = circuit_state::closed;
  ++generation_;
  canary_in_flight_ = false;
  sleep_window_ = config_.sleep_window;
  policy_->reset();
}

circuit_breaker_registry::circuit_breaker_registry(circuit_breaker_config config,
                                                   circuit_clock_function now)
  : config_{ std::move(config) }
  , now_{ std::move(now) }
{
}

auto
circuit_breaker_registry::breaker_for(const std::string& node, service_type service)
  -> std::shared_ptr<circuit_breaker>
{
  const std::scoped_lock lock(mutex_);
  auto key = std::make_pair(node, service);
  if (auto it = breakers_.find(key); it != breakers_.end()) {
    return it->second;
  }
  auto breaker =
    std::make_shared<circuit_breaker>(fmt::format("{}/{}", node, service), config_, now_);
  breakers_.emplace(std::move(key), breaker);
  return breaker;
}

auto
circuit_breaker_registry::allow(const std::string& node, service_type service) -> std::optional<circuit_ticket>
{
  if (!config_.enabled) {
    return circuit_ticket{};
  }
  return breaker_for(node, service)->allow_request();
}

auto
circuit_breaker_registry::would_allow(const std::string& node, service_type service) const -> bool
{
  if (!config_.enabled) {
    return true;
  }
  std::shared_ptr<circuit_breaker> breaker{};
  {
    const std::scoped_lock lock(mutex_);
    if (auto it = breakers_.find(std::make_pair(node, service)); it != breakers_.end()) {
      breaker = it->second;
    }
  }
  return !breaker || breaker->would_allow();
}

void
circuit_breaker_registry::report(const std::string& node,
                                 service_type service,
                                 const circuit_ticket& ticket,
                                 circuit_outcome outcome)
{
  if (!config_.enabled) {
    return;
  }
  breaker_for(node, service)->report(ticket, outcome);
}

auto
circuit_breaker_registry::state(const std::string& node, service_type service) -> circuit_state
{
  if (!config_.enabled) {
    return circuit_state::closed;
  }
  return breaker_for(node, service)->state();
}
} // namespace relay::core

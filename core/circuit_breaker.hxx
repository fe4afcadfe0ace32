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

#include "circuit_breaker_config.hxx"

#include <relay/service_type.hxx>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>

namespace relay::core
{
enum class circuit_state {
  closed,
  open,
  half_open,
};

enum class circuit_outcome {
  success,
  failure,
};

/**
 * Handed out on admission and carried back with the outcome. Every state change starts a new
 * generation, outcomes of requests admitted in an earlier generation are not counted.
 */
struct circuit_ticket {
  std::uint64_t generation{ 0 };
  bool canary{ false };
};

using circuit_clock = std::chrono::steady_clock;
using circuit_clock_function = std::function<circuit_clock::time_point()>;

/**
 * Decides when a closed breaker trips.
 */
class failure_policy
{
public:
  failure_policy() = default;
  failure_policy(const failure_policy& other) = delete;
  failure_policy(failure_policy&& other) = delete;
  auto operator=(const failure_policy& other) -> failure_policy& = delete;
  auto operator=(failure_policy&& other) -> failure_policy& = delete;
  virtual ~failure_policy() = default;

  virtual void record(circuit_outcome outcome, circuit_clock::time_point now) = 0;
  [[nodiscard]] virtual auto should_trip(circuit_clock::time_point now) -> bool = 0;
  virtual void reset() = 0;
};

class consecutive_failures_policy : public failure_policy
{
public:
  explicit consecutive_failures_policy(std::size_t threshold);

  void record(circuit_outcome outcome, circuit_clock::time_point now) override;
  [[nodiscard]] auto should_trip(circuit_clock::time_point now) -> bool override;
  void reset() override;

private:
  std::size_t threshold_;
  std::size_t consecutive_failures_{ 0 };
};

class rolling_window_policy : public failure_policy
{
public:
  rolling_window_policy(std::chrono::milliseconds window,
                        std::size_t volume_threshold,
                        double error_threshold_percentage);

  void record(circuit_outcome outcome, circuit_clock::time_point now) override;
  [[nodiscard]] auto should_trip(circuit_clock::time_point now) -> bool override;
  void reset() override;

private:
  void expire(circuit_clock::time_point now);

  std::chrono::milliseconds window_;
  std::size_t volume_threshold_;
  double error_threshold_percentage_;
  std::deque<std::pair<circuit_clock::time_point, circuit_outcome>> outcomes_{};
  std::size_t failures_{ 0 };
};

auto
make_failure_policy(const circuit_breaker_config& config) -> std::unique_ptr<failure_policy>;

/**
 * Admission gate for one (node, service) pair.
 *
 * closed: everything is allowed, outcomes feed the failure policy. open: everything is rejected
 * until the sleep window elapses. half_open: a single canary is allowed, its success closes the
 * breaker, its failure opens it again. Only the canary's ticket settles a half_open breaker.
 */
class circuit_breaker
{
public:
  circuit_breaker(std::string name,
                  const circuit_breaker_config& config,
                  circuit_clock_function now = circuit_clock::now);

  /**
   * @return the ticket to report the outcome with, or nothing when the request is rejected
   */
  [[nodiscard]] auto allow_request() -> std::optional<circuit_ticket>;

  /**
   * Same answer as allow_request(), without claiming the canary of a half_open breaker.
   */
  [[nodiscard]] auto would_allow() const -> bool;
  void report(const circuit_ticket& ticket, circuit_outcome outcome);
  [[nodiscard]] auto state() const -> circuit_state;
  void reset();

  [[nodiscard]] auto name() const -> const std::string&
  {
    return name_;
  }

private:
  void trip(circuit_clock::time_point now);
  auto claim_canary(circuit_clock::time_point now) -> circuit_ticket;

  std::string name_;
  circuit_breaker_config config_;
  circuit_clock_function now_;
  std::unique_ptr<failure_policy> policy_;

  mutable std::mutex mutex_{};
  circuit_state state_{ circuit_state::closed };
  std::uint64_t generation_{ 0 };
  std::chrono::milliseconds sleep_window_;
  circuit_clock::time_point open_until_{};
  bool canary_in_flight_{ false };
  circuit_clock::time_point canary_started_at_{};
};

/**
 * Breakers keyed by node and service. Each breaker is synchronized on its own, the registry lock
 * only guards the lookup.
 */
class circuit_breaker_registry
{
public:
  explicit circuit_breaker_registry(circuit_breaker_config config,
                                    circuit_clock_function now = circuit_clock::now);

  [[nodiscard]] auto allow(const std::string& node, service_type service) -> std::optional<circuit_ticket>;

  /**
   * Used for node selection, does not change the state of the breaker.
   */
  [[nodiscard]] auto would_allow(const std::string& node, service_type service) const -> bool;
  void report(const std::string& node,
              service_type service,
              const circuit_ticket& ticket,
              circuit_outcome outcome);
  [[nodiscard]] auto state(const std::string& node, service_type service) -> circuit_state;

  [[nodiscard]] auto enabled() const -> bool
  {
    return config_.enabled;
  }

private:
  auto breaker_for(const std::string& node, service_type service)
    -> std::shared_ptr<circuit_breaker>;

  circuit_breaker_config config_;
  circuit_clock_function now_;
  mutable std::mutex mutex_{};
  std::map<std::pair<std::string, service_type>, std::shared_ptr<circuit_breaker>> breakers_{};
};
} // namespace relay::core

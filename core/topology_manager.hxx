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

#include "error.hxx"
#include "pending_operation.hxx"
#include "pending_request.hxx"
#include "topology/config_source.hxx"
#include "topology/configuration.hxx"
#include "topology_notifier.hxx"
#include "utils/movable_function.hxx"

#include <relay/service_type.hxx>

#include <asio/io_context.hpp>
#include <asio/steady_timer.hpp>
#include <tl/expected.hpp>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace relay::core
{
class circuit_breaker_registry;

struct topology_manager_options {
  /**
   * Empty selects the network from the hostname the first map was fetched from.
   */
  std::string network{};
  bool use_tls{ false };
  std::chrono::milliseconds poll_interval{ std::chrono::milliseconds{ 2500 } };
  std::chrono::milliseconds poll_floor{ std::chrono::milliseconds{ 50 } };
};

struct node_selection {
  std::string endpoint{};
  std::optional<std::uint16_t> vbucket{};
};

/**
 * Owns the current topology snapshot and the loop refreshing it.
 *
 * Readers get an immutable snapshot without blocking. A fetched map replaces the snapshot only when
 * its revision is newer. Refresh requests are coalesced, polls never run closer than poll_floor
 * to each other.
 */
class topology_manager
  : public topology_notifier
  , public std::enable_shared_from_this<topology_manager>
{
public:
  using ready_handler = utils::movable_function<void(std::error_code ec)>;

  topology_manager(asio::io_context& io,
                   topology_manager_options options,
                   std::shared_ptr<circuit_breaker_registry> breakers,
                   std::vector<std::shared_ptr<topology::config_source>> sources);

  /**
   * Performs the first poll and keeps polling every poll_interval until closed.
   */
  void start();

  /**
   * Stops polling. Pending waiters are invoked with cluster_closed.
   */
  void close();

  [[nodiscard]] auto current() const -> std::shared_ptr<const topology::configuration>;
  [[nodiscard]] auto network() const -> std::string;

  /**
   * @return true if the map has been published
   */
  auto update(topology::configuration config, const std::string& source_hostname = {}) -> bool;

  void refresh_now();

  auto on_next_refresh(utils::movable_function<void()>&& handler) -> std::uint64_t override;
  void cancel_waiter(std::uint64_t id) override;

  /**
   * Invokes the handler once a snapshot is available, with timeout if none arrives in time.
   */
  void wait_for_config(std::chrono::milliseconds timeout, ready_handler&& handler);

  /**
   * @return true if the current snapshot has at least one node running the service
   */
  [[nodiscard]] auto has_service(service_type service) const -> bool;

  /**
   * Picks the node for the next attempt. Requests with a key go to the node owning its vbucket
   * when the snapshot has a vbucket map, others are spread round-robin over the nodes whose
   * breaker admits traffic.
   *
   * @return topology_unavailable, service_not_available or circuit_open when no node can be picked
   */
  [[nodiscard]] auto select_node(service_type service,
                                 const attempt_context& ctx,
                                 std::optional<std::string_view> key = {}) const
    -> tl::expected<node_selection, std::error_code>;

private:
  struct poll_step {
    std::shared_ptr<topology::config_source> source;
    std::string endpoint;
  };

  struct config_waiter {
    ready_handler handler{};
    std::shared_ptr<asio::steady_timer> timer{};
  };

  void poll();
  void try_next(std::shared_ptr<std::vector<poll_step>> plan, std::size_t index);
  void finish_poll();
  void schedule_poll_locked(std::chrono::steady_clock::time_point at);
  void notify_refresh_waiters();
  void notify_config_waiters(std::error_code ec);

  asio::io_context& io_;
  const topology_manager_options options_;
  std::shared_ptr<circuit_breaker_registry> breakers_;
  std::vector<std::shared_ptr<topology::config_source>> sources_;

  std::mutex update_mutex_{};
  std::shared_ptr<const topology::configuration> current_{};
  mutable std::mutex network_mutex_{};
  std::string network_{};
  mutable std::atomic<std::size_t> round_robin_{ 0 };

  std::mutex poll_mutex_{};
  asio::steady_timer poll_timer_;
  bool started_{ false };
  bool closed_{ false };
  bool polling_{ false };
  std::size_t poll_offset_{ 0 };
  std::size_t bootstrap_attempts_{ 0 };
  std::chrono::steady_clock::time_point last_poll_{};
  std::chrono::steady_clock::time_point next_poll_at_{ std::chrono::steady_clock::time_point::max() };
  std::shared_ptr<pending_operation> current_fetch_{};

  std::mutex waiters_mutex_{};
  std::uint64_t next_waiter_id_{ 0 };
  std::map<std::uint64_t, utils::movable_function<void()>> refresh_waiters_{};
  std::map<std::uint64_t, config_waiter> config_waiters_{};
};
} // namespace relay::core

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

#include "core/logger/logger.hxx"
#include "core/utils/movable_function.hxx"

#include <relay/error_codes.hxx>

#include <asio/io_context.hpp>
#include <asio/post.hpp>

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

namespace relay::core::io
{
struct connection_pool_options {
  /**
   * Open plus connecting connections, zero means unbounded.
   */
  std::size_t max_connections{ 1 };
  std::size_t max_idle_connections{ 1 };
  std::size_t max_queue_size{ 2048 };
  std::chrono::milliseconds idle_timeout{ std::chrono::milliseconds{ 4500 } };
};

/**
 * Connections to one endpoint, safe for concurrent checkout and checkin. A checked out
 * connection belongs to the caller until it is checked in or discarded.
 *
 * Connection must provide is_usable() and close().
 */
template<typename Connection>
class connection_pool : public std::enable_shared_from_this<connection_pool<Connection>>
{
public:
  using connection_ptr = std::shared_ptr<Connection>;
  using checkout_handler = utils::movable_function<void(std::error_code, connection_ptr)>;
  using connector = std::function<void(checkout_handler&&)>;

  connection_pool(asio::io_context& io, std::string endpoint, connection_pool_options options, connector connect)
    : io_{ io }
    , endpoint_{ std::move(endpoint) }
    , options_{ options }
    , connect_{ std::move(connect) }
  {
  }

  /**
   * The handler is always invoked through the io_context, never from within checkout().
   *
   * @return identifier of the waiter, for cancel_checkout()
   */
  auto checkout(checkout_handler&& handler) -> std::uint64_t
  {
    std::unique_lock lock(mutex_);
    auto id = ++next_waiter_id_;
    if (closed_) {
      lock.unlock();
      post(std::move(handler), errc::common::cluster_closed, nullptr);
      return id;
    }

    if (auto connection = take_idle(); connection) {
      lock.unlock();
      post(std::move(handler), {}, std::move(connection));
      return id;
    }

    if (waiters_.size() >= options_.max_queue_size) {
      lock.unlock();
      RELAY_LOG_DEBUG("[pool] <{}> {} requests are already waiting for a connection", endpoint_, options_.max_queue_size);
      post(std::move(handler), errc::network::queue_full, nullptr);
      return id;
    }

    waiters_.emplace(id, std::move(handler));
    bool open_new = options_.max_connections == 0 || total_ < options_.max_connections;
    if (open_new) {
      ++total_;
    }
    lock.unlock();

    if (open_new) {
      open_connection();
    }
    return id;
  }

  /**
   * Forgets the waiter. Its handler is destroyed without being invoked.
   */
  void cancel_checkout(std::uint64_t id)
  {
    checkout_handler handler{};
    {
      const std::scoped_lock lock(mutex_);
      if (auto it = waiters_.find(id); it != waiters_.end()) {
        handler = std::move(it->second);
        waiters_.erase(it);
      }
    }
  }

  /**
   * Returns the connection after a complete exchange. Unusable connections are discarded.
   */
  void checkin(connection_ptr connection)
  {
    if (!connection) {
      return;
    }
    if (!connection->is_usable()) {
      return discard(std::move(connection));
    }
    hand_over(std::move(connection));
  }

  /**
   * Closes the connection, its slot becomes available for a new one.
   */
  void discard(connection_ptr connection)
  {
    if (connection) {
      connection->close();
    }
    bool open_new = false;
    {
      const std::scoped_lock lock(mutex_);
      if (total_ > 0) {
        --total_;
      }
      if (!closed_ && !waiters_.empty() && (options_.max_connections == 0 || total_ < options_.max_connections)) {
        ++total_;
        open_new = true;
      }
    }
    if (open_new) {
      open_connection();
    }
  }

  /**
   * Closes a connection that failed while it was shared. It leaves the pool only when it sits in
   * the idle list, a checked out connection is discarded by the holder on checkin.
   */
  void evict(const connection_ptr& connection)
  {
    if (!connection) {
      return;
    }
    bool found = false;
    {
      const std::scoped_lock lock(mutex_);
      if (auto it = std::find_if(idle_.begin(),
                                 idle_.end(),
                                 [&connection](const idle_entry& entry) { return entry.connection == connection; });
          it != idle_.end()) {
        idle_.erase(it);
        found = true;
      }
    }
    if (found) {
      RELAY_LOG_DEBUG("[pool] <{}> evicting broken connection", endpoint_);
      discard(connection);
    } else {
      connection->close();
    }
  }

  void close()
  {
    std::map<std::uint64_t, checkout_handler> waiters{};
    std::deque<idle_entry> idle{};
    {
      const std::scoped_lock lock(mutex_);
      if (closed_) {
        return;
      }
      closed_ = true;
      std::swap(waiters, waiters_);
      std::swap(idle, idle_);
      total_ -= std::min(total_, idle.size());
    }
    RELAY_LOG_DEBUG("[pool] <{}> closing, idle={}, waiting={}", endpoint_, idle.size(), waiters.size());
    for (auto& entry : idle) {
      entry.connection->close();
    }
    for (auto& [id, handler] : waiters) {
      post(std::move(handler), errc::common::cluster_closed, nullptr);
    }
  }

  [[nodiscard]] auto endpoint() const -> const std::string&
  {
    return endpoint_;
  }

  [[nodiscard]] auto idle_count() const -> std::size_t
  {
    const std::scoped_lock lock(mutex_);
    return idle_.size();
  }

  [[nodiscard]] auto total_count() const -> std::size_t
  {
    const std::scoped_lock lock(mutex_);
    return total_;
  }

  [[nodiscard]] auto waiting_count() const -> std::size_t
  {
    const std::scoped_lock lock(mutex_);
    return waiters_.size();
  }

private:
  struct idle_entry {
    connection_ptr connection;
    std::chrono::steady_clock::time_point since;
  };

  void post(checkout_handler&& handler, std::error_code ec, connection_ptr connection)
  {
    asio::post(io_, [handler = std::move(handler), ec, connection = std::move(connection)]() mutable {
      handler(ec, std::move(connection));
    });
  }

  auto take_idle() -> connection_ptr
  {
    auto now = std::chrono::steady_clock::now();
    while (!idle_.empty()) {
      auto entry = std::move(idle_.front());
      idle_.pop_front();
      if (entry.connection->is_usable() && now - entry.since < options_.idle_timeout) {
        return std::move(entry.connection);
      }
      RELAY_LOG_DEBUG("[pool] <{}> dropping idle connection", endpoint_);
      entry.connection->close();
      --total_;
    }
    return nullptr;
  }

  void hand_over(connection_ptr connection)
  {
    std::unique_lock lock(mutex_);
    if (closed_) {
      --total_;
      lock.unlock();
      connection->close();
      return;
    }
    if (!waiters_.empty()) {
      auto handler = std::move(waiters_.begin()->second);
      waiters_.erase(waiters_.begin());
      lock.unlock();
      post(std::move(handler), {}, std::move(connection));
      return;
    }
    if (idle_.size() >= options_.max_idle_connections) {
      --total_;
      lock.unlock();
      connection->close();
      return;
    }
    idle_.push_back({ std::move(connection), std::chrono::steady_clock::now() });
  }

  void open_connection()
  {
    RELAY_LOG_DEBUG("[pool] <{}> opening new connection", endpoint_);
    connect_([self = this->shared_from_this()](std::error_code ec, connection_ptr connection) {
      if (!ec) {
        return self->hand_over(std::move(connection));
      }
      // a failed connect fails every waiter
      std::map<std::uint64_t, checkout_handler> waiters{};
      {
        const std::scoped_lock lock(self->mutex_);
        --self->total_;
        std::swap(waiters, self->waiters_);
      }
      for (auto& [id, handler] : waiters) {
        handler(ec, nullptr);
      }
    });
  }

  asio::io_context& io_;
  std::string endpoint_;
  connection_pool_options options_;
  connector connect_;

  mutable std::mutex mutex_{};
  bool closed_{ false };
  std::size_t total_{ 0 };
  std::uint64_t next_waiter_id_{ 0 };
  std::map<std::uint64_t, checkout_handler> waiters_{};
  std::deque<idle_entry> idle_{};
};
} // namespace relay::core::io

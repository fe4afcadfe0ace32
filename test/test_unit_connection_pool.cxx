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

#include "test_helper.hxx"

#include "core/io/connection_pool.hxx"

#include <relay/error_codes.hxx>

#include <atomic>
#include <future>
#include <thread>

using namespace std::chrono_literals;

namespace
{
struct fake_connection {
  explicit fake_connection(std::size_t number)
    : id{ number }
  {
  }

  [[nodiscard]] auto is_usable() const -> bool
  {
    return usable && !closed;
  }

  void close()
  {
    closed = true;
  }

  std::size_t id;
  std::atomic_bool usable{ true };
  std::atomic_bool closed{ false };
};

using pool_type = relay::core::io::connection_pool<fake_connection>;

/**
 * Connect attempts complete when the test releases them, unless auto_complete is set.
 */
class scripted_connector
{
public:
  explicit scripted_connector(asio::io_context& io)
    : io_{ io }
  {
  }

  auto connector() -> pool_type::connector
  {
    return [this](pool_type::checkout_handler&& handler) {
      std::unique_lock lock(mutex_);
      ++attempts_;
      if (auto_complete_) {
        auto connection = std::make_shared<fake_connection>(attempts_);
        lock.unlock();
        asio::post(io_, [handler = std::move(handler), connection]() mutable {
          handler({}, connection);
        });
        return;
      }
      pending_.emplace_back(std::move(handler));
    };
  }

  void set_auto_complete(bool value)
  {
    const std::scoped_lock lock(mutex_);
    auto_complete_ = value;
  }

  void fail_pending(std::error_code ec)
  {
    std::vector<pool_type::checkout_handler> pending{};
    {
      const std::scoped_lock lock(mutex_);
      std::swap(pending, pending_);
    }
    for (auto& handler : pending) {
      asio::post(io_, [handler = std::move(handler), ec]() mutable {
        handler(ec, nullptr);
      });
    }
  }

  [[nodiscard]] auto attempts() const -> std::size_t
  {
    const std::scoped_lock lock(mutex_);
    return attempts_;
  }

  [[nodiscard]] auto pending() const -> std::size_t
  {
    const std::scoped_lock lock(mutex_);
    return pending_.size();
  }

private:
  asio::io_context& io_;
  mutable std::mutex mutex_{};
  bool auto_complete_{ true };
  std::size_t attempts_{ 0 };
  std::vector<pool_type::checkout_handler> pending_{};
};

struct checkout_result {
  std::error_code ec{};
  std::shared_ptr<fake_connection> connection{};
};

class checkout_future
{
public:
  explicit checkout_future(const std::shared_ptr<pool_type>& pool)
    : barrier_{ std::make_shared<std::promise<checkout_result>>() }
    , future_{ barrier_->get_future() }
  {
    id_ = pool->checkout([barrier = barrier_](std::error_code ec, std::shared_ptr<fake_connection> connection) {
      barrier->set_value({ ec, std::move(connection) });
    });
  }

  [[nodiscard]] auto ready(std::chrono::milliseconds timeout = 0ms) -> bool
  {
    return future_.wait_for(timeout) == std::future_status::ready;
  }

  auto get() -> checkout_result
  {
    return future_.get();
  }

  [[nodiscard]] auto id() const -> std::uint64_t
  {
    return id_;
  }

private:
  std::shared_ptr<std::promise<checkout_result>> barrier_;
  std::future<checkout_result> future_;
  std::uint64_t id_{};
};

auto
make_pool(test::utils::io_runner& runner, scripted_connector& connector, relay::core::io::connection_pool_options options)
  -> std::shared_ptr<pool_type>
{
  return std::make_shared<pool_type>(runner.io(), "node1:8093", options, connector.connector());
}
} // namespace

TEST_CASE("unit: connection pool reuses idle connections", "[unit]")
{
  test::utils::init_logger();
  test::utils::io_runner runner{};
  scripted_connector connector{ runner.io() };
  relay::core::io::connection_pool_options options{};
  options.max_connections = 2;
  options.max_idle_connections = 2;
  auto pool = make_pool(runner, connector, options);

  checkout_future first{ pool };
  auto result = first.get();
  REQUIRE_SUCCESS(result.ec);
  REQUIRE(result.connection);
  REQUIRE(connector.attempts() == 1);
  REQUIRE(pool->total_count() == 1);
  REQUIRE(pool->idle_count() == 0);

  pool->checkin(result.connection);
  REQUIRE(pool->idle_count() == 1);

  checkout_future second{ pool };
  auto reused = second.get();
  REQUIRE_SUCCESS(reused.ec);
  REQUIRE(reused.connection == result.connection);
  REQUIRE(connector.attempts() == 1);

  SECTION("unusable connections are not returned to the pool")
  {
    reused.connection->usable = false;
    pool->checkin(reused.connection);
    REQUIRE(reused.connection->closed);
    REQUIRE(pool->idle_count() == 0);
    REQUIRE(pool->total_count() == 0);
  }

  SECTION("evicting an idle connection frees its slot")
  {
    pool->checkin(reused.connection);
    REQUIRE(pool->idle_count() == 1);
    reused.connection->usable = false;
    pool->evict(reused.connection);
    REQUIRE(reused.connection->closed);
    REQUIRE(pool->idle_count() == 0);
    REQUIRE(pool->total_count() == 0);

    pool->evict(reused.connection);
    REQUIRE(pool->total_count() == 0);
  }

  SECTION("evicting a checked out connection leaves it to the holder")
  {
    pool->evict(reused.connection);
    REQUIRE(reused.connection->closed);
    REQUIRE(pool->total_count() == 1);

    pool->checkin(reused.connection);
    REQUIRE(pool->idle_count() == 0);
    REQUIRE(pool->total_count() == 0);
  }

  SECTION("idle connections expire")
  {
    relay::core::io::connection_pool_options short_lived{};
    short_lived.idle_timeout = 10ms;
    auto expiring = make_pool(runner, connector, short_lived);
    checkout_future one{ expiring };
    auto connection = one.get().connection;
    expiring->checkin(connection);
    std::this_thread::sleep_for(30ms);

    checkout_future two{ expiring };
    auto fresh = two.get();
    REQUIRE_SUCCESS(fresh.ec);
    REQUIRE(fresh.connection != connection);
    REQUIRE(connection->closed);
    REQUIRE(expiring->total_count() == 1);
    expiring->close();
  }

  SECTION("idle connections above the limit are closed")
  {
    relay::core::io::connection_pool_options single_idle{};
    single_idle.max_connections = 0;
    single_idle.max_idle_connections = 1;
    auto limited = make_pool(runner, connector, single_idle);
    checkout_future a{ limited };
    checkout_future b{ limited };
    auto one = a.get().connection;
    auto two = b.get().connection;
    REQUIRE(one != two);
    REQUIRE(limited->total_count() == 2);

    limited->checkin(one);
    limited->checkin(two);
    REQUIRE(limited->idle_count() == 1);
    REQUIRE_FALSE(one->closed);
    REQUIRE(two->closed);
    REQUIRE(limited->total_count() == 1);
    limited->close();
    REQUIRE(one->closed);
  }

  pool->close();
}

TEST_CASE("unit: connection pool queues requests when all connections are busy", "[unit]")
{
  test::utils::init_logger();
  test::utils::io_runner runner{};
  scripted_connector connector{ runner.io() };
  relay::core::io::connection_pool_options options{};
  options.max_connections = 1;
  options.max_idle_connections = 1;
  options.max_queue_size = 2;
  auto pool = make_pool(runner, connector, options);

  checkout_future owner{ pool };
  auto busy = owner.get();
  REQUIRE_SUCCESS(busy.ec);

  checkout_future waiter{ pool };
  REQUIRE_FALSE(waiter.ready(20ms));
  REQUIRE(pool->waiting_count() == 1);
  REQUIRE(connector.attempts() == 1);

  SECTION("checkin hands the connection to the waiter")
  {
    pool->checkin(busy.connection);
    auto handed = waiter.get();
    REQUIRE_SUCCESS(handed.ec);
    REQUIRE(handed.connection == busy.connection);
    REQUIRE(pool->idle_count() == 0);
  }

  SECTION("discard opens a replacement for the waiter")
  {
    pool->discard(busy.connection);
    REQUIRE(busy.connection->closed);
    auto replacement = waiter.get();
    REQUIRE_SUCCESS(replacement.ec);
    REQUIRE(replacement.connection != busy.connection);
    REQUIRE(connector.attempts() == 2);
    REQUIRE(pool->total_count() == 1);
  }

  SECTION("queue is bounded")
  {
    checkout_future second_waiter{ pool };
    checkout_future rejected{ pool };
    auto result = rejected.get();
    REQUIRE(result.ec == relay::errc::network::queue_full);
    REQUIRE_FALSE(result.connection);
    REQUIRE(pool->waiting_count() == 2);
  }

  SECTION("canceled waiter is forgotten")
  {
    pool->cancel_checkout(waiter.id());
    REQUIRE(pool->waiting_count() == 0);
    pool->checkin(busy.connection);
    REQUIRE_FALSE(waiter.ready(20ms));
    REQUIRE(pool->idle_count() == 1);
  }

  SECTION("closing fails waiters")
  {
    pool->close();
    auto result = waiter.get();
    REQUIRE(result.ec == relay::errc::common::cluster_closed);

    checkout_future late{ pool };
    REQUIRE(late.get().ec == relay::errc::common::cluster_closed);

    pool->checkin(busy.connection);
    REQUIRE(busy.connection->closed);
    REQUIRE(pool->total_count() == 0);
  }

  pool->close();
}

TEST_CASE("unit: connection pool propagates connect failures", "[unit]")
{
  test::utils::init_logger();
  test::utils::io_runner runner{};
  scripted_connector connector{ runner.io() };
  connector.set_auto_complete(false);
  relay::core::io::connection_pool_options options{};
  options.max_connections = 1;
  auto pool = make_pool(runner, connector, options);

  checkout_future first{ pool };
  checkout_future second{ pool };
  REQUIRE(test::utils::wait_until([&connector]() { return connector.pending() == 1; }));
  REQUIRE(pool->total_count() == 1);

  connector.fail_pending(relay::errc::common::transport_failure);
  REQUIRE(first.get().ec == relay::errc::common::transport_failure);
  REQUIRE(second.get().ec == relay::errc::common::transport_failure);
  REQUIRE(pool->total_count() == 0);
  REQUIRE(pool->waiting_count() == 0);

  connector.set_auto_complete(true);
  checkout_future retry{ pool };
  auto result = retry.get();
  REQUIRE_SUCCESS(result.ec);
  REQUIRE(connector.attempts() == 2);
  pool->close();
}

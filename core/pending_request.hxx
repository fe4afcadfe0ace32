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
#include "logger/logger.hxx"
#include "operation_registry.hxx"
#include "pending_operation.hxx"
#include "retry_orchestrator.hxx"
#include "topology_notifier.hxx"
#include "tracing/constants.hxx"
#include "utils/movable_function.hxx"

#include <relay/best_effort_retry_strategy.hxx>
#include <relay/error_codes.hxx>
#include <relay/fmt/retry_reason.hxx>
#include <relay/retry_request.hxx>
#include <relay/retry_strategy.hxx>
#include <relay/tracing/request_span.hxx>

#include <asio/io_context.hpp>
#include <asio/post.hpp>
#include <asio/steady_timer.hpp>
#include <fmt/core.h>
#include <tao/json/value.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <utility>

namespace relay::core
{
/**
 * What a single attempt needs to know about the retries that preceded it.
 */
struct attempt_context {
  std::uint64_t operation_id{};
  std::size_t attempt{ 0 };
  retry_target target{ retry_target::reresolve };
  std::string last_dispatched_to{};
  std::chrono::steady_clock::time_point deadline{};
  std::shared_ptr<relay::tracing::request_span> parent_span{};
};

template<typename Result>
struct attempt_outcome {
  Result value{};
  error err{};
  retry_reason reason{ retry_reason::do_not_retry };
  std::string dispatched_to{};
  std::string dispatched_from{};
};

/**
 * Results that own resources (open streams) release them here when the operation settles by other
 * means. Found by ADL.
 */
template<typename Result>
void
discard_unused_result(Result& /* result */)
{
}

/**
 * Lifecycle of one accepted operation: attempt, retry, deadline, cancellation and exactly-once
 * settlement.
 *
 * The attempt function performs one exchange and reports its outcome through the handler, either
 * synchronously or later. It returns the handle of the exchange (if any) so that it can be
 * canceled when the operation settles first.
 */
template<typename Result>
class pending_request
  : public std::enable_shared_from_this<pending_request<Result>>
  , public pending_operation
  , public tracked_operation
  , public retry_request
{
public:
  using callback_type = utils::movable_function<void(Result, error)>;
  using outcome_handler = utils::movable_function<void(attempt_outcome<Result>)>;
  using attempt_function =
    utils::movable_function<std::shared_ptr<pending_operation>(const attempt_context&, outcome_handler&&)>;

  struct options {
    std::string name{};
    bool idempotent{ false };
    std::chrono::steady_clock::time_point deadline{};
    std::shared_ptr<retry_strategy> strategy{};
  };

  pending_request(asio::io_context& io,
                  std::shared_ptr<operation_registry> registry,
                  std::shared_ptr<const retry_orchestrator> orchestrator,
                  std::shared_ptr<topology_notifier> notifier,
                  std::shared_ptr<relay::tracing::request_span> span,
                  options opts,
                  attempt_function&& attempt)
    : io_{ io }
    , registry_{ std::move(registry) }
    , orchestrator_{ std::move(orchestrator) }
    , notifier_{ std::move(notifier) }
    , span_{ std::move(span) }
    , options_{ std::move(opts) }
    , attempt_{ std::move(attempt) }
    , id_{ registry_->next_id() }
    , deadline_timer_{ io_ }
    , retry_timer_{ io_ }
  {
  }

  /**
   * Registers the operation and performs the first attempt. The callback is never invoked from
   * within start().
   */
  void start(callback_type&& callback)
  {
    callback_ = std::move(callback);
    registry_->add(id_, this->weak_from_this());

    if (options_.deadline <= std::chrono::steady_clock::now()) {
      asio::post(io_, [self = this->shared_from_this(), token = registry_->make_task_token()]() {
        self->settle({}, error{ errc::common::timeout, "deadline elapsed before the first attempt" });
      });
      return;
    }

    {
      const std::scoped_lock lock(timers_mutex_);
      deadline_timer_.expires_at(options_.deadline);
      deadline_timer_.async_wait([self = this->shared_from_this(), token = registry_->make_task_token()](
                                   std::error_code ec) {
        if (ec == asio::error::operation_aborted) {
          return;
        }
        self->on_deadline();
      });
    }

    asio::post(io_, [self = this->shared_from_this(), token = registry_->make_task_token()]() {
      self->dispatch();
    });
  }

  void cancel() override
  {
    abort(errc::common::request_canceled, "canceled");
  }

  void abort(std::error_code ec, std::string message) override
  {
    settle({}, error{ ec, std::move(message) });
  }

  [[nodiscard]] auto settled() const -> bool
  {
    return state_.load() != settlement_state::pending;
  }

  [[nodiscard]] auto id() const -> std::uint64_t
  {
    return id_;
  }

  [[nodiscard]] auto retry_attempts() const -> std::size_t override
  {
    const std::scoped_lock lock(info_mutex_);
    return retry_attempts_;
  }

  [[nodiscard]] auto identifier() const -> std::string override
  {
    return fmt::format("{}/{}", options_.name, id_);
  }

  [[nodiscard]] auto idempotent() const -> bool override
  {
    return options_.idempotent;
  }

  [[nodiscard]] auto retry_reasons() const -> std::set<retry_reason> override
  {
    const std::scoped_lock lock(info_mutex_);
    return retry_reasons_;
  }

private:
  enum class settlement_state : std::uint8_t {
    pending,
    settling,
    settled,
  };

  void dispatch()
  {
    if (settled()) {
      return;
    }

    attempt_context ctx{};
    std::uint64_t attempt_id{};
    {
      const std::scoped_lock lock(info_mutex_);
      attempt_id = ++current_attempt_;
      ctx.attempt = retry_attempts_;
      ctx.target = next_target_;
      ctx.last_dispatched_to = last_dispatched_to_;
    }
    ctx.operation_id = id_;
    ctx.deadline = options_.deadline;
    ctx.parent_span = span_;

    auto exchange = attempt_(
      ctx,
      [self = this->shared_from_this(), attempt_id, token = registry_->make_task_token()](
        attempt_outcome<Result> outcome) mutable {
        token.release();
        self->on_attempt_complete(attempt_id, std::move(outcome));
      });

    if (!exchange) {
      return;
    }
    bool orphaned = false;
    {
      const std::scoped_lock lock(exchange_mutex_);
      if (settled()) {
        orphaned = true;
      } else if (completed_attempt_ != attempt_id) {
        exchange_ = std::move(exchange);
      }
    }
    if (orphaned) {
      exchange->cancel();
    }
  }

  void on_attempt_complete(std::uint64_t attempt_id, attempt_outcome<Result>&& outcome)
  {
    {
      const std::scoped_lock lock(exchange_mutex_);
      completed_attempt_ = attempt_id;
      exchange_.reset();
    }
    {
      const std::scoped_lock lock(info_mutex_);
      if (!outcome.dispatched_to.empty()) {
        last_dispatched_to_ = outcome.dispatched_to;
      }
      if (!outcome.dispatched_from.empty()) {
        last_dispatched_from_ = outcome.dispatched_from;
      }
    }

    if (!outcome.err) {
      settle(std::move(outcome.value), {});
      return;
    }
    discard_unused_result(outcome.value);
    maybe_retry(outcome.reason, std::move(outcome.err));
  }

  void maybe_retry(retry_reason reason, error err)
  {
    if (settled()) {
      return;
    }
    auto action = orchestrator_->classify(
      *this, options_.strategy, reason, options_.deadline, std::chrono::steady_clock::now());

    if (action.exhausted_deadline()) {
      error timeout{ errc::common::timeout, "deadline would elapse before the next retry" };
      timeout.cause = std::make_shared<error>(std::move(err));
      settle({}, std::move(timeout));
      return;
    }
    if (!action.need_to_retry()) {
      settle({}, std::move(err));
      return;
    }

    {
      const std::scoped_lock lock(info_mutex_);
      ++retry_attempts_;
      retry_reasons_.insert(reason);
      next_target_ = action.target();
      last_error_ = std::make_shared<error>(std::move(err));
    }

    switch (action.kind()) {
      case retry_action_kind::retry_now:
        asio::post(io_, [self = this->shared_from_this(), token = registry_->make_task_token()]() {
          self->dispatch();
        });
        return;

      case retry_action_kind::retry_after:
        schedule_retry(action.duration());
        return;

      case retry_action_kind::retry_on_new_topology:
        wait_for_topology();
        return;

      case retry_action_kind::do_not_retry:
        break;
    }
  }

  void schedule_retry(std::chrono::milliseconds delay)
  {
    const std::scoped_lock lock(timers_mutex_);
    if (settled()) {
      return;
    }
    retry_timer_.expires_after(delay);
    retry_timer_.async_wait(
      [self = this->shared_from_this(), token = registry_->make_task_token()](std::error_code ec) {
        if (ec == asio::error::operation_aborted) {
          return;
        }
        self->dispatch();
      });
  }

  void wait_for_topology()
  {
    if (!notifier_) {
      schedule_retry(controlled_backoff(retry_attempts()));
      return;
    }
    const std::scoped_lock lock(timers_mutex_);
    if (settled()) {
      return;
    }
    waiter_id_ = notifier_->on_next_refresh(
      [self = this->shared_from_this(), token = registry_->make_task_token()]() mutable {
        token.release();
        auto& io = self->io_;
        asio::post(io, [self = std::move(self)]() {
          self->dispatch();
        });
      });
  }

  void on_deadline()
  {
    error err{ errc::common::timeout, "deadline elapsed" };
    {
      const std::scoped_lock lock(info_mutex_);
      if (last_error_) {
        err.cause = last_error_;
      }
    }
    settle({}, std::move(err));
  }

  void enhance_error(error& err) const
  {
    const std::scoped_lock lock(info_mutex_);
    err.ctx["operation_id"] = identifier();
    err.ctx["retry_attempts"] = retry_attempts_;
    if (!retry_reasons_.empty()) {
      tao::json::value reasons = tao::json::empty_array;
      for (const auto& reason : retry_reasons_) {
        reasons.emplace_back(fmt::format("{}", reason));
      }
      err.ctx["retry_reasons"] = reasons;
    }
    if (!last_dispatched_to_.empty()) {
      err.ctx["last_dispatched_to"] = last_dispatched_to_;
    }
    if (!last_dispatched_from_.empty()) {
      err.ctx["last_dispatched_from"] = last_dispatched_from_;
    }
    if (err.cause) {
      err.ctx["last_error"] = err.cause->ec.message();
    }
  }

  void settle(Result value, error err)
  {
    auto expected = settlement_state::pending;
    if (!state_.compare_exchange_strong(expected, settlement_state::settling)) {
      discard_unused_result(value);
      return;
    }

    std::optional<std::uint64_t> waiter{};
    {
      const std::scoped_lock lock(timers_mutex_);
      deadline_timer_.cancel();
      retry_timer_.cancel();
      waiter = std::exchange(waiter_id_, std::nullopt);
    }
    if (waiter && notifier_) {
      notifier_->cancel_waiter(waiter.value());
    }
    std::shared_ptr<pending_operation> exchange{};
    {
      const std::scoped_lock lock(exchange_mutex_);
      exchange = std::move(exchange_);
    }
    if (exchange) {
      exchange->cancel();
    }

    if (err) {
      enhance_error(err);
    }
    if (span_) {
      if (span_->uses_tags()) {
        span_->add_tag(tracing::attributes::retries, retry_attempts());
        span_->add_tag(tracing::attributes::outcome, err ? err.ec.message() : std::string{ "success" });
      }
      span_->end();
    }
    registry_->remove(id_);

    if (err) {
      RELAY_LOG_DEBUG("operation {} settled with error: {}", identifier(), err.message_with_ctx());
    }

    auto callback = std::move(callback_);
    state_.store(settlement_state::settled);
    if (callback) {
      callback(std::move(value), std::move(err));
    } else {
      discard_unused_result(value);
    }
  }

  asio::io_context& io_;
  std::shared_ptr<operation_registry> registry_;
  std::shared_ptr<const retry_orchestrator> orchestrator_;
  std::shared_ptr<topology_notifier> notifier_;
  std::shared_ptr<relay::tracing::request_span> span_;
  options options_;
  attempt_function attempt_;
  std::uint64_t id_;
  callback_type callback_{};

  std::atomic<settlement_state> state_{ settlement_state::pending };

  std::mutex timers_mutex_{};
  asio::steady_timer deadline_timer_;
  asio::steady_timer retry_timer_;
  std::optional<std::uint64_t> waiter_id_{};

  std::mutex exchange_mutex_{};
  std::shared_ptr<pending_operation> exchange_{};
  std::uint64_t completed_attempt_{ 0 };

  mutable std::mutex info_mutex_{};
  std::uint64_t current_attempt_{ 0 };
  std::size_t retry_attempts_{ 0 };
  std::set<retry_reason> retry_reasons_{};
  retry_target next_target_{ retry_target::reresolve };
  std::string last_dispatched_to_{};
  std::string last_dispatched_from_{};
  std::shared_ptr<error> last_error_{};
};
} // namespace relay::core

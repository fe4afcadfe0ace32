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

#include <relay/best_effort_retry_strategy.hxx>

#include <fmt/core.h>

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <random>

namespace relay
{
auto
controlled_backoff(std::size_t retry_attempts) -> std::chrono::milliseconds
{
  switch (retry_attempts) {
    case 0:
      return std::chrono::milliseconds(1);

    case 1:
      return std::chrono::milliseconds(10);

    case 2:
      return std::chrono::milliseconds(50);

    case 3:
      return std::chrono::milliseconds(100);

    case 4:
      return std::chrono::milliseconds(500);

    default:
      break;
  }
  return std::chrono::milliseconds(1'000);
}

auto
exponential_backoff_with_full_jitter(std::chrono::milliseconds min_backoff,
                                     std::chrono::milliseconds max_backoff,
                                     double backoff_factor) -> backoff_calculator
{
  double min = 100;   // 100 milliseconds
  double max = 60000; // 1 minute
  double factor = 2;

  if (min_backoff > std::chrono::milliseconds::zero()) {
    min = static_cast<double>(min_backoff.count());
  }
  if (max_backoff > std::chrono::milliseconds::zero()) {
    max = static_cast<double>(max_backoff.count());
  }
  if (backoff_factor > 0) {
    factor = backoff_factor;
  }

  return [min, max, factor](std::size_t retry_attempts) -> std::chrono::milliseconds {
    const auto ceiling = static_cast<std::int64_t>(
      std::round(std::min(max, min * std::pow(factor, static_cast<double>(retry_attempts)))));

    thread_local std::mt19937 gen(std::random_device{}());
    std::uniform_int_distribution<std::int64_t> distrib(0, ceiling);

    return std::chrono::milliseconds(distrib(gen));
  };
}

best_effort_retry_strategy::best_effort_retry_strategy(backoff_calculator calculator,
                                                       bool preserve_target)
  : backoff_calculator_{ std::move(calculator) }
  , preserve_target_{ preserve_target }
{
}

auto
best_effort_retry_strategy::retry_after(const retry_request& request, retry_reason reason)
  -> retry_action
{
  if (request.idempotent() || allows_non_idempotent_retry(reason)) {
    auto target = retry_target::reresolve;
    if (implicates_target(reason)) {
      target = retry_target::avoid_last;
    } else if (preserve_target_) {
      target = retry_target::preserve;
    }
    return retry_action{ backoff_calculator_(request.retry_attempts()), target };
  }
  return retry_action::do_not_retry();
}

auto
best_effort_retry_strategy::to_string() const -> std::string
{
  return fmt::format(R"(#<best_effort_retry_strategy:{} preserve_target={}>)",
                     static_cast<const void*>(this),
                     preserve_target_);
}

auto
make_best_effort_retry_strategy(backoff_calculator calculator, bool preserve_target)
  -> std::shared_ptr<best_effort_retry_strategy>
{
  return std::make_shared<best_effort_retry_strategy>(std::move(calculator), preserve_target);
}
} // namespace relay

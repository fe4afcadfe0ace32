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

#include <relay/retry_strategy.hxx>

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <string>

namespace relay
{
using backoff_calculator = std::function<std::chrono::milliseconds(std::size_t retry_attempts)>;

/**
 * Fixed progression used for reasons that are always retried: 1ms, 10ms, 50ms, 100ms, 500ms and
 * 1s afterwards.
 */
auto
controlled_backoff(std::size_t retry_attempts) -> std::chrono::milliseconds;

/**
 * Picks the backoff uniformly from [0, min(max_backoff, min_backoff * backoff_factor^attempts)].
 * Non-positive arguments fall back to 100ms, 60s and 2 respectively.
 */
auto
exponential_backoff_with_full_jitter(std::chrono::milliseconds min_backoff,
                                     std::chrono::milliseconds max_backoff,
                                     double backoff_factor) -> backoff_calculator;

/**
 * Retries until the deadline of the request. Non-idempotent requests are retried only for reasons
 * which guarantee the request had no effect.
 */
class best_effort_retry_strategy : public retry_strategy
{
public:
  /**
   * @param calculator backoff between attempts
   * @param preserve_target dispatch the retry to the same node unless the reason implicates it
   */
  explicit best_effort_retry_strategy(backoff_calculator calculator, bool preserve_target = false);

  auto retry_after(const retry_request& request, retry_reason reason) -> retry_action override;

  [[nodiscard]] auto to_string() const -> std::string override;

private:
  backoff_calculator backoff_calculator_;
  bool preserve_target_;
};

auto
make_best_effort_retry_strategy(backoff_calculator calculator =
                                  exponential_backoff_with_full_jitter({}, {}, 0),
                                bool preserve_target = false)
  -> std::shared_ptr<best_effort_retry_strategy>;
} // namespace relay

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

#include "retry_orchestrator.hxx"

#include "core/logger/logger.hxx"

#include <relay/best_effort_retry_strategy.hxx>
#include <relay/fmt/retry_reason.hxx>

namespace relay::core
{
retry_orchestrator::retry_orchestrator(std::shared_ptr<retry_strategy> default_strategy)
  : default_strategy_{ std::move(default_strategy) }
{
  if (default_strategy_ == nullptr) {
    default_strategy_ = make_best_effort_retry_strategy();
  }
}

auto
retry_orchestrator::classify(const retry_request& request,
                             const std::shared_ptr<retry_strategy>& strategy,
                             retry_reason reason,
                             std::chrono::steady_clock::time_point deadline,
                             std::chrono::steady_clock::time_point now) const -> retry_action
{
  if (reason == retry_reason::do_not_retry) {
    return retry_action::do_not_retry();
  }
  if (now >= deadline) {
    return retry_action::deadline_exhausted();
  }

  if (always_retry(reason)) {
    // waits for the next topology refresh, which is bounded by the deadline timer
    RELAY_LOG_TRACE(R"(retrying request on new topology (id="{}", reason={}, attempts={}))",
                    request.identifier(),
                    reason,
                    request.retry_attempts());
    return retry_action::retry_on_new_topology();
  }

  const auto& effective = strategy ? strategy : default_strategy_;
  auto action = effective->retry_after(request, reason);
  if (!action.need_to_retry()) {
    RELAY_LOG_TRACE(R"(not retrying request (id="{}", reason={}, attempts={}, strategy={}))",
                    request.identifier(),
                    reason,
                    request.retry_attempts(),
                    effective->to_string());
    return action;
  }

  if (now + action.duration() >= deadline) {
    RELAY_LOG_DEBUG(
      R"(retry of request would exceed its deadline (id="{}", reason={}, attempts={}, backoff={}ms))",
      request.identifier(),
      reason,
      request.retry_attempts(),
      action.duration().count());
    return retry_action::deadline_exhausted();
  }

  if (action.target() == retry_target::preserve && implicates_target(reason)) {
    action = action.with_target(retry_target::avoid_last);
  }
  return action;
}
} // namespace relay::core

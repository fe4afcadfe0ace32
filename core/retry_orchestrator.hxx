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

#include <relay/retry_action.hxx>
#include <relay/retry_reason.hxx>
#include <relay/retry_request.hxx>
#include <relay/retry_strategy.hxx>

#include <chrono>
#include <memory>

namespace relay::core
{
/**
 * Decides what happens after a failed attempt. Pure function of the policy, the request and the
 * clock: it never performs I/O and never sleeps.
 */
class retry_orchestrator
{
public:
  explicit retry_orchestrator(std::shared_ptr<retry_strategy> default_strategy);

  /**
   * @param request the failed request, retry_attempts() does not include the failed attempt yet
   * @param strategy per-request override, the default strategy is used when empty
   * @param reason classification of the failure
   * @param deadline absolute deadline of the request
   * @param now current time
   */
  [[nodiscard]] auto classify(const retry_request& request,
                              const std::shared_ptr<retry_strategy>& strategy,
                              retry_reason reason,
                              std::chrono::steady_clock::time_point deadline,
                              std::chrono::steady_clock::time_point now) const -> retry_action;

  [[nodiscard]] auto default_strategy() const -> const std::shared_ptr<retry_strategy>&
  {
    return default_strategy_;
  }

private:
  std::shared_ptr<retry_strategy> default_strategy_;
};
} // namespace relay::core

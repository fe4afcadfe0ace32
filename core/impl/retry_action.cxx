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

#include <relay/retry_action.hxx>

namespace relay
{
retry_action::retry_action(retry_action_kind kind,
                           std::chrono::milliseconds waiting_duration,
                           retry_target target,
                           bool exhausted)
  : kind_{ kind }
  , waiting_duration_{ waiting_duration }
  , target_{ target }
  , exhausted_deadline_{ exhausted }
{
}

retry_action::retry_action(std::chrono::milliseconds waiting_duration, retry_target target)
  : retry_action{ waiting_duration > std::chrono::milliseconds::zero()
                    ? retry_action_kind::retry_after
                    : retry_action_kind::retry_now,
                  waiting_duration > std::chrono::milliseconds::zero()
                    ? waiting_duration
                    : std::chrono::milliseconds::zero(),
                  target,
                  false }
{
}

auto
retry_action::do_not_retry() -> const retry_action&
{
  static const retry_action instance{
    retry_action_kind::do_not_retry, std::chrono::milliseconds::zero(), retry_target::reresolve, false
  };
  return instance;
}

auto
retry_action::deadline_exhausted() -> const retry_action&
{
  static const retry_action instance{
    retry_action_kind::do_not_retry, std::chrono::milliseconds::zero(), retry_target::reresolve, true
  };
  return instance;
}

auto
retry_action::retry_now(retry_target target) -> retry_action
{
  return { retry_action_kind::retry_now, std::chrono::milliseconds::zero(), target, false };
}

auto
retry_action::retry_on_new_topology() -> retry_action
{
  return {
    retry_action_kind::retry_on_new_topology, std::chrono::milliseconds::zero(), retry_target::reresolve, false
  };
}

auto
retry_action::need_to_retry() const -> bool
{
  return kind_ != retry_action_kind::do_not_retry;
}

auto
retry_action::with_target(retry_target target) const -> retry_action
{
  return { kind_, waiting_duration_, target, exhausted_deadline_ };
}
} // namespace relay

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

#include <chrono>

namespace relay
{
/**
 * Where the next attempt is dispatched to.
 */
enum class retry_target {
  /**
   * select the node again from the latest topology
   */
  reresolve,

  /**
   * dispatch to the same node as the previous attempt, if it is still part of the topology
   */
  preserve,

  /**
   * select from the latest topology, but skip the node of the previous attempt when there are
   * other candidates
   */
  avoid_last,
};

enum class retry_action_kind {
  retry_now,
  retry_after,
  retry_on_new_topology,
  do_not_retry,
};

/**
 * Decision produced for one failed attempt. Immutable.
 */
class retry_action
{
public:
  static auto do_not_retry() -> const retry_action&;

  /**
   * The operation is not retried because its deadline would elapse before the next attempt. The
   * operation settles as timeout.
   */
  static auto deadline_exhausted() -> const retry_action&;

  static auto retry_now(retry_target target = retry_target::reresolve) -> retry_action;

  static auto retry_on_new_topology() -> retry_action;

  explicit retry_action(std::chrono::milliseconds waiting_duration,
                        retry_target target = retry_target::reresolve);

  [[nodiscard]] auto need_to_retry() const -> bool;

  [[nodiscard]] auto kind() const -> retry_action_kind
  {
    return kind_;
  }

  [[nodiscard]] auto duration() const -> std::chrono::milliseconds
  {
    return waiting_duration_;
  }

  [[nodiscard]] auto target() const -> retry_target
  {
    return target_;
  }

  [[nodiscard]] auto exhausted_deadline() const -> bool
  {
    return exhausted_deadline_;
  }

  /**
   * @return copy of the action dispatching to a different target
   */
  [[nodiscard]] auto with_target(retry_target target) const -> retry_action;

private:
  retry_action(retry_action_kind kind,
               std::chrono::milliseconds waiting_duration,
               retry_target target,
               bool exhausted);

  retry_action_kind kind_;
  std::chrono::milliseconds waiting_duration_;
  retry_target target_;
  bool exhausted_deadline_;
};
} // namespace relay

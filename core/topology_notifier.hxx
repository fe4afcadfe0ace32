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

#include "utils/movable_function.hxx"

#include <cstdint>

namespace relay::core
{
/**
 * Notifies interested parties when a topology refresh completes, whether or not it produced a new
 * revision.
 */
class topology_notifier
{
public:
  topology_notifier() = default;
  topology_notifier(const topology_notifier&) = delete;
  topology_notifier(topology_notifier&&) = delete;
  auto operator=(const topology_notifier&) -> topology_notifier& = delete;
  auto operator=(topology_notifier&&) -> topology_notifier& = delete;
  virtual ~topology_notifier() = default;

  /**
   * Registers a one-shot handler and requests a refresh.
   *
   * @return identifier for cancel_waiter()
   */
  virtual auto on_next_refresh(utils::movable_function<void()>&& handler) -> std::uint64_t = 0;

  /**
   * Drops the handler if it has not fired yet.
   */
  virtual void cancel_waiter(std::uint64_t id) = 0;
};
} // namespace relay::core

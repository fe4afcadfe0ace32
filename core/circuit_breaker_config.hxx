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
#include <cstddef>

namespace relay::core
{
enum class circuit_breaker_policy {
  /**
   * trips after failure_threshold consecutive failures
   */
  consecutive_failures,

  /**
   * trips when, within rolling_window, at least volume_threshold outcomes were reported and the
   * share of failures reached error_threshold_percentage
   */
  rolling_window,
};

struct circuit_breaker_config {
  bool enabled{ true };
  circuit_breaker_policy policy{ circuit_breaker_policy::rolling_window };
  std::size_t failure_threshold{ 5 };
  std::size_t volume_threshold{ 20 };
  double error_threshold_percentage{ 50 };
  std::chrono::milliseconds rolling_window{ std::chrono::minutes(1) };

  /**
   * time spent in the open state before a canary is let through
   */
  std::chrono::milliseconds sleep_window{ std::chrono::seconds(5) };

  /**
   * when positive, every failed canary multiplies the sleep window by sleep_window_backoff_factor,
   * up to this value
   */
  std::chrono::milliseconds max_sleep_window{ std::chrono::milliseconds::zero() };
  double sleep_window_backoff_factor{ 2 };

  /**
   * a canary that did not report its outcome within this duration is forgotten, and the next
   * request becomes the canary
   */
  std::chrono::milliseconds canary_timeout{ std::chrono::seconds(5) };
};
} // namespace relay::core

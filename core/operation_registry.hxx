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

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <system_error>

namespace relay::core
{
/**
 * Counts a piece of background work (armed timer, waiter, in-flight exchange) for as long as the
 * token is alive.
 */
class task_token
{
public:
  task_token() = default;
  explicit task_token(std::shared_ptr<std::atomic_size_t> counter);
  task_token(const task_token&) = delete;
  auto operator=(const task_token&) -> task_token& = delete;
  task_token(task_token&& other) noexcept;
  auto operator=(task_token&& other) noexcept -> task_token&;
  ~task_token();

  void release();

private:
  std::shared_ptr<std::atomic_size_t> counter_{};
};

/**
 * An accepted operation that can be settled from the outside.
 */
class tracked_operation
{
public:
  tracked_operation() = default;
  tracked_operation(const tracked_operation&) = delete;
  tracked_operation(tracked_operation&&) = delete;
  auto operator=(const tracked_operation&) -> tracked_operation& = delete;
  auto operator=(tracked_operation&&) -> tracked_operation& = delete;
  virtual ~tracked_operation() = default;

  /**
   * Settles the operation with the given error unless it already settled.
   */
  virtual void abort(std::error_code ec, std::string message) = 0;
};

/**
 * Keeps track of the operations that have been accepted but not settled yet, and of the background
 * work performed on their behalf.
 */
class operation_registry
{
public:
  operation_registry();

  [[nodiscard]] auto next_id() -> std::uint64_t;

  void add(std::uint64_t id, const std::weak_ptr<tracked_operation>& operation);
  void remove(std::uint64_t id);

  /**
   * Settles every outstanding operation with the given error.
   */
  void abort_all(std::error_code ec, const std::string& message);

  [[nodiscard]] auto outstanding() const -> std::size_t;
  [[nodiscard]] auto background_tasks() const -> std::size_t;
  [[nodiscard]] auto make_task_token() -> task_token;

private:
  std::atomic_uint64_t next_id_{ 0 };
  mutable std::mutex mutex_{};
  std::map<std::uint64_t, std::weak_ptr<tracked_operation>> operations_{};
  std::shared_ptr<std::atomic_size_t> background_tasks_;
};
} // namespace relay::core

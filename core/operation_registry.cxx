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

#include "operation_registry.hxx"

#include "core/logger/logger.hxx"

#include <utility>
#include <vector>

namespace relay::core
{
task_token::task_token(std::shared_ptr<std::atomic_size_t> counter)
  : counter_{ std::move(counter) }
{
  if (counter_) {
    counter_->fetch_add(1);
  }
}

task_token::task_token(task_token&& other) noexcept
  : counter_{ std::move(other.counter_) }
{
}

auto
task_token::operator=(task_token&& other) noexcept -> task_token&
{
  if (this != &other) {
    release();
    counter_ = std::move(other.counter_);
  }
  return *this;
}

task_token::~task_token()
{
  release();
}

void
task_token::release()
{
  if (auto counter = std::move(counter_); counter) {
    counter->fetch_sub(1);
  }
}

operation_registry::operation_registry()
  : background_tasks_{ std::make_shared<std::atomic_size_t>(0) }
{
}

auto
operation_registry::next_id() -> std::uint64_t
{
  return ++next_id_;
}

void
operation_registry::add(std::uint64_t id, const std::weak_ptr<tracked_operation>& operation)
{
  const std::scoped_lock lock(mutex_);
  operations_.insert_or_assign(id, operation);
}

void
operation_registry::remove(std::uint64_t id)
{
  const std::scoped_lock lock(mutex_);
  operations_.erase(id);
}

void
operation_registry::abort_all(std::error_code ec, const std::string& message)
{
  std::vector<std::shared_ptr<tracked_operation>> operations{};
  {
    const std::scoped_lock lock(mutex_);
    operations.reserve(operations_.size());
    for (const auto& [id, weak] : operations_) {
      if (auto operation = weak.lock(); operation) {
        operations.emplace_back(std::move(operation));
      }
    }
  }
  if (!operations.empty()) {
    RELAY_LOG_DEBUG("aborting {} outstanding operations: {}", operations.size(), ec.message());
  }
  for (const auto& operation : operations) {
    operation->abort(ec, message);
  }
}

auto
operation_registry::outstanding() const -> std::size_t
{
  const std::scoped_lock lock(mutex_);
  return operations_.size();
}

auto
operation_registry::background_tasks() const -> std::size_t
{
  return background_tasks_->load();
}

auto
operation_registry::make_task_token() -> task_token
{
  return task_token{ background_tasks_ };
}
} // namespace relay::core

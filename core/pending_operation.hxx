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

namespace relay::core
{
/**
 * Handle of an accepted operation, or of one exchange performed on its behalf.
 */
class pending_operation
{
public:
  pending_operation() = default;
  pending_operation(const pending_operation&) = delete;
  pending_operation(pending_operation&&) = delete;
  auto operator=(const pending_operation&) -> pending_operation& = delete;
  auto operator=(pending_operation&&) -> pending_operation& = delete;
  virtual ~pending_operation() = default;

  /**
   * Safe to call any number of times from any thread. No-op once the operation has settled.
   */
  virtual void cancel() = 0;
};
} // namespace relay::core

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

#include <memory>

namespace relay
{
/**
 * Never retries, every failure settles the operation.
 */
class fail_fast_retry_strategy : public retry_strategy
{
public:
  auto retry_after(const retry_request& request, retry_reason reason) -> retry_action override;

  [[nodiscard]] auto to_string() const -> std::string override;
};

auto
make_fail_fast_retry_strategy() -> std::shared_ptr<fail_fast_retry_strategy>;
} // namespace relay

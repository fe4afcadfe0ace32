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

#include <tao/json/value.hpp>

#include <memory>
#include <string>
#include <system_error>

namespace relay::core
{
/**
 * Error reported through a settlement callback or a synchronous rejection.
 *
 * ctx carries diagnostic properties (retry_attempts, retry_reasons, last_dispatched_to,
 * last_dispatched_from, server errors, ...). A timeout caused by an exhausted retry budget keeps
 * the error that was being retried in cause.
 */
struct error {
  std::error_code ec{};
  std::string message{};
  tao::json::value ctx = tao::json::empty_object;
  std::shared_ptr<error> cause{};

  error() = default;

  error(std::error_code code, std::string msg = {})
    : ec{ code }
    , message{ std::move(msg) }
  {
  }

  explicit operator bool() const;
  [[nodiscard]] auto message_with_ctx() const -> std::string;
};
} // namespace relay::core

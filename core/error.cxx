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

#include "error.hxx"

#include "core/utils/json.hxx"

#include <fmt/core.h>

namespace relay::core
{
error::operator bool() const
{
  return ec.value() != 0;
}

auto
error::message_with_ctx() const -> std::string
{
  std::string res = fmt::format("{} ({})", ec.message(), ec.value());
  if (!message.empty()) {
    res += ": " + message;
  }
  if (ctx.is_object() && !ctx.get_object().empty()) {
    res += ", ctx=" + utils::json::generate(ctx);
  }
  if (cause) {
    res += ", cause=" + cause->message_with_ctx();
  }
  return res;
}
} // namespace relay::core

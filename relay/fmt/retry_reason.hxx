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

#include <relay/retry_reason.hxx>

#include <fmt/core.h>

template<>
struct fmt::formatter<relay::retry_reason> {
  template<typename ParseContext>
  constexpr auto parse(ParseContext& ctx)
  {
    return ctx.begin();
  }

  template<typename FormatContext>
  auto format(relay::retry_reason reason, FormatContext& ctx) const
  {
    string_view name = "unknown";
    switch (reason) {
      case relay::retry_reason::do_not_retry:
        name = "do_not_retry";
        break;
      case relay::retry_reason::unknown:
        name = "unknown";
        break;
      case relay::retry_reason::socket_not_available:
        name = "socket_not_available";
        break;
      case relay::retry_reason::node_not_available:
        name = "node_not_available";
        break;
      case relay::retry_reason::node_overloaded:
        name = "node_overloaded";
        break;
      case relay::retry_reason::service_not_available:
        name = "service_not_available";
        break;
      case relay::retry_reason::topology_stale:
        name = "topology_stale";
        break;
      case relay::retry_reason::circuit_breaker_open:
        name = "circuit_breaker_open";
        break;
      case relay::retry_reason::socket_closed_while_in_flight:
        name = "socket_closed_while_in_flight";
        break;
      case relay::retry_reason::service_response_code_indicated:
        name = "service_response_code_indicated";
        break;
      case relay::retry_reason::key_value_locked:
        name = "kv_locked";
        break;
      case relay::retry_reason::sync_write_in_progress:
        name = "sync_write_in_progress";
        break;
      case relay::retry_reason::protocol_failure:
        name = "protocol_failure";
        break;
    }
    return format_to(ctx.out(), "{}", name);
  }
};

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

#include <relay/retry_reason.hxx>

namespace relay
{
auto
allows_non_idempotent_retry(retry_reason reason) -> bool
{
  switch (reason) {
    case retry_reason::socket_not_available:
    case retry_reason::node_not_available:
    case retry_reason::node_overloaded:
    case retry_reason::service_not_available:
    case retry_reason::topology_stale:
    case retry_reason::circuit_breaker_open:
    case retry_reason::service_response_code_indicated:
    case retry_reason::key_value_locked:
    case retry_reason::sync_write_in_progress:
      return true;
    case retry_reason::do_not_retry:
    case retry_reason::unknown:
    case retry_reason::socket_closed_while_in_flight:
    case retry_reason::protocol_failure:
      return false;
  }
  return false;
}

auto
always_retry(retry_reason reason) -> bool
{
  switch (reason) {
    case retry_reason::topology_stale:
      return true;
    case retry_reason::do_not_retry:
    case retry_reason::unknown:
    case retry_reason::socket_not_available:
    case retry_reason::node_not_available:
    case retry_reason::node_overloaded:
    case retry_reason::service_not_available:
    case retry_reason::circuit_breaker_open:
    case retry_reason::socket_closed_while_in_flight:
    case retry_reason::service_response_code_indicated:
    case retry_reason::key_value_locked:
    case retry_reason::sync_write_in_progress:
    case retry_reason::protocol_failure:
      return false;
  }
  return false;
}

auto
implicates_target(retry_reason reason) -> bool
{
  switch (reason) {
    case retry_reason::node_not_available:
    case retry_reason::node_overloaded:
    case retry_reason::circuit_breaker_open:
    case retry_reason::socket_closed_while_in_flight:
    case retry_reason::protocol_failure:
      return true;
    case retry_reason::do_not_retry:
    case retry_reason::unknown:
    case retry_reason::socket_not_available:
    case retry_reason::service_not_available:
    case retry_reason::topology_stale:
    case retry_reason::service_response_code_indicated:
    case retry_reason::key_value_locked:
    case retry_reason::sync_write_in_progress:
      return false;
  }
  return false;
}
} // namespace relay

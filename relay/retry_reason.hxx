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

namespace relay
{
/**
 * Classification of a failed attempt. Attached to every failure handed to the retry orchestrator.
 */
enum class retry_reason {
  /**
   * default value, e.g. when we don't need to retry
   */
  do_not_retry,

  /**
   * All unexpected/unknown retry errors must not be retried to avoid accidental data loss and
   * non-deterministic behavior.
   */
  unknown,

  /**
   * No connection could be obtained for the target, the request was never written.
   */
  socket_not_available,

  /**
   * The node where the operation is supposed to be dispatched to is not available.
   */
  node_not_available,

  /**
   * The node rejected the request because it is overloaded (temporary failure, busy, 429).
   */
  node_overloaded,

  /**
   * The service on a node (i.e. key_value, query) is not available.
   */
  service_not_available,

  /**
   * The topology snapshot used to route the request is outdated (e.g. not my vbucket), or no
   * snapshot has been received yet.
   */
  topology_stale,

  /**
   * The circuit breaker for the target node and service is open and the operation is not sent.
   */
  circuit_breaker_open,

  /**
   * While an operation was in-flight, the underlying socket has been closed.
   */
  socket_closed_while_in_flight,

  /**
   * The service listed only retriable errors in its response.
   */
  service_response_code_indicated,

  key_value_locked,

  sync_write_in_progress,

  /**
   * The response could not be parsed.
   */
  protocol_failure,
};

/**
 * @return true if the request provably did not take effect, so that non-idempotent requests can be
 * retried safely.
 */
auto
allows_non_idempotent_retry(retry_reason reason) -> bool;

/**
 * @return true if the request is retried regardless of the retry strategy.
 */
auto
always_retry(retry_reason reason) -> bool;

/**
 * @return true if the failure is attributed to the node the attempt was dispatched to.
 */
auto
implicates_target(retry_reason reason) -> bool;
} // namespace relay

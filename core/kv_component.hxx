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

#include "error.hxx"
#include "mcbp/packet.hxx"
#include "pending_operation.hxx"
#include "protocol/magic.hxx"
#include "utils/movable_function.hxx"

#include <relay/retry_reason.hxx>
#include <relay/retry_strategy.hxx>
#include <relay/tracing/request_span.hxx>

#include <tl/expected.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

namespace relay::core
{
struct component_context;
class kv_component_impl;

struct kv_request {
  protocol::client_opcode opcode{ protocol::client_opcode::get };
  std::string key{};
  std::vector<std::byte> extras{};
  std::vector<std::byte> value{};
  std::byte datatype{};
  std::uint64_t cas{ 0 };

  /**
   * Defaults to what the opcode implies: reads are idempotent, mutations are not.
   */
  std::optional<bool> idempotent{};

  /**
   * Absolute deadline of the operation, retries included. Takes precedence over the timeout.
   */
  std::optional<std::chrono::steady_clock::time_point> deadline{};

  /**
   * Used when no deadline is given. Zero selects the configured key_value timeout.
   */
  std::chrono::milliseconds timeout{ 0 };
  std::shared_ptr<retry_strategy> retry_strategy{};
  std::shared_ptr<relay::tracing::request_span> parent_span{};
};

struct kv_response {
  mcbp::packet packet{};
  std::string dispatched_to{};
};

using kv_callback = utils::movable_function<void(kv_response response, error err)>;

/**
 * Operations on the binary protocol. Requests with a key are routed to the node owning its
 * vbucket.
 */
class kv_component
{
public:
  kv_component(const component_context& ctx, std::chrono::milliseconds default_timeout);

  auto execute(kv_request request, kv_callback&& callback)
    -> tl::expected<std::shared_ptr<pending_operation>, error>;

private:
  std::shared_ptr<kv_component_impl> impl_;
};

/**
 * Retry reason and error for a binary protocol status. Success maps to an empty error.
 */
auto
map_key_value_status(protocol::key_value_status_code status) -> std::pair<std::error_code, retry_reason>;

[[nodiscard]] auto
is_idempotent(protocol::client_opcode opcode) -> bool;
} // namespace relay::core

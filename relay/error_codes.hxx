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

#include <system_error>

namespace relay
{
namespace core::impl
{
auto
common_category() noexcept -> const std::error_category&;

auto
key_value_category() noexcept -> const std::error_category&;

auto
network_category() noexcept -> const std::error_category&;

auto
streaming_json_lexer_category() noexcept -> const std::error_category&;
} // namespace core::impl

namespace errc
{
/**
 * Errors shared by every service.
 */
enum class common {
  /**
   * The caller (or the agent shutting down) canceled the operation before it settled.
   */
  request_canceled = 1,

  /**
   * The deadline of the operation elapsed before it settled. When the operation was being retried,
   * the error context lists the last error that caused the retry.
   */
  timeout = 2,

  /**
   * The circuit breaker for the target node and service rejected the request without sending it.
   */
  circuit_open = 3,

  /**
   * No topology snapshot has been obtained yet and the caller did not opt into waiting for one.
   */
  topology_unavailable = 4,

  /**
   * Connection level failure (connect, write or read error).
   */
  transport_failure = 5,

  /**
   * The peer sent something that could not be parsed.
   */
  protocol_failure = 6,

  /**
   * The request or the configuration is invalid. Reported synchronously at submission.
   */
  configuration_error = 7,

  /**
   * No node in the current topology advertises the requested service.
   */
  service_not_available = 8,

  authentication_failure = 9,

  /**
   * The agent has been closed.
   */
  cluster_closed = 10,

  temporary_failure = 11,

  internal_server_failure = 12,

  invalid_argument = 13,
};

/**
 * Terminal statuses of the binary protocol.
 */
enum class key_value {
  document_not_found = 101,
  document_exists = 102,
  value_too_large = 103,
  document_not_stored = 104,
  document_locked = 105,
  invalid_arguments = 106,
  no_access = 107,
  unknown_collection = 108,
};

enum class network {
  resolve_failure = 1001,
  no_endpoints_left = 1002,
  handshake_failure = 1003,
  protocol_error = 1004,
  configuration_not_available = 1005,
  end_of_stream = 1006,
  need_more_data = 1007,
  bucket_closed = 1008,
  queue_full = 1009,
};

enum class streaming_json_lexer {
  garbage_trailing = 1101,
  special_expected = 1102,
  special_incomplete = 1103,
  stray_token = 1104,
  missing_token = 1105,
  cannot_insert = 1106,
  escape_outside_string = 1107,
  key_outside_object = 1108,
  string_outside_container = 1109,
  found_null_byte = 1110,
  levels_exceeded = 1111,
  bracket_mismatch = 1112,
  object_key_expected = 1113,
  weird_whitespace = 1114,
  unicode_escape_is_too_short = 1115,
  escape_invalid = 1116,
  trailing_comma = 1117,
  invalid_number = 1118,
  value_expected = 1119,
  percent_bad_hex = 1120,
  json_pointer_bad_path = 1121,
  json_pointer_duplicated_slash = 1122,
  json_pointer_missing_root = 1123,
  not_enough_memory = 1124,
  invalid_codepoint = 1125,
  generic = 1126,
  root_is_not_an_object = 1127,
  root_does_not_match_json_pointer = 1128,
  truncated_input = 1129,
};
} // namespace errc

namespace errc
{
inline auto
make_error_code(common e) noexcept -> std::error_code
{
  return { static_cast<int>(e), core::impl::common_category() };
}

inline auto
make_error_code(key_value e) noexcept -> std::error_code
{
  return { static_cast<int>(e), core::impl::key_value_category() };
}

inline auto
make_error_code(network e) noexcept -> std::error_code
{
  return { static_cast<int>(e), core::impl::network_category() };
}

inline auto
make_error_code(streaming_json_lexer e) noexcept -> std::error_code
{
  return { static_cast<int>(e), core::impl::streaming_json_lexer_category() };
}
} // namespace errc
} // namespace relay

template<>
struct std::is_error_code_enum<relay::errc::common> : std::true_type {
};

template<>
struct std::is_error_code_enum<relay::errc::key_value> : std::true_type {
};

template<>
struct std::is_error_code_enum<relay::errc::network> : std::true_type {
};

template<>
struct std::is_error_code_enum<relay::errc::streaming_json_lexer> : std::true_type {
};

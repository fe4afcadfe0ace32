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

#include <cstdint>

namespace relay::core::protocol
{
enum class key_value_status_code : std::uint16_t {
  success = 0x00,
  not_found = 0x01,
  exists = 0x02,
  too_big = 0x03,
  invalid = 0x04,
  not_stored = 0x05,
  delta_bad_value = 0x06,
  not_my_vbucket = 0x07,
  no_bucket = 0x08,
  locked = 0x09,
  auth_stale = 0x1f,
  auth_error = 0x20,
  auth_continue = 0x21,
  range_error = 0x22,
  no_access = 0x24,
  not_initialized = 0x25,
  unknown_frame_info = 0x80,
  unknown_command = 0x81,
  no_memory = 0x82,
  not_supported = 0x83,
  internal = 0x84,
  busy = 0x85,
  temporary_failure = 0x86,
  unknown_collection = 0x88,
  sync_write_in_progress = 0xa2,
  sync_write_re_commit_in_progress = 0xa3,
  unknown = 0xffff,
};

constexpr auto
status_to_key_value_status_code(std::uint16_t status) -> key_value_status_code
{
  switch (static_cast<key_value_status_code>(status)) {
    case key_value_status_code::success:
    case key_value_status_code::not_found:
    case key_value_status_code::exists:
    case key_value_status_code::too_big:
    case key_value_status_code::invalid:
    case key_value_status_code::not_stored:
    case key_value_status_code::delta_bad_value:
    case key_value_status_code::not_my_vbucket:
    case key_value_status_code::no_bucket:
    case key_value_status_code::locked:
    case key_value_status_code::auth_stale:
    case key_value_status_code::auth_error:
    case key_value_status_code::auth_continue:
    case key_value_status_code::range_error:
    case key_value_status_code::no_access:
    case key_value_status_code::not_initialized:
    case key_value_status_code::unknown_frame_info:
    case key_value_status_code::unknown_command:
    case key_value_status_code::no_memory:
    case key_value_status_code::not_supported:
    case key_value_status_code::internal:
    case key_value_status_code::busy:
    case key_value_status_code::temporary_failure:
    case key_value_status_code::unknown_collection:
    case key_value_status_code::sync_write_in_progress:
    case key_value_status_code::sync_write_re_commit_in_progress:
      return static_cast<key_value_status_code>(status);
    case key_value_status_code::unknown:
      break;
  }
  return key_value_status_code::unknown;
}
} // namespace relay::core::protocol

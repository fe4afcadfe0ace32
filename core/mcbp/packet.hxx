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

#include "core/protocol/magic.hxx"
#include "core/protocol/status.hxx"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace relay::core::mcbp
{
class packet
{
public:
  [[nodiscard]] auto debug_string() const -> std::string;

  protocol::magic magic_{ protocol::magic::client_request };
  protocol::client_opcode command_{ protocol::client_opcode::invalid };
  std::byte datatype_{};
  std::uint16_t status_{ 0x00 };
  protocol::key_value_status_code status_code_{ protocol::key_value_status_code::success };
  std::uint16_t vbucket_{};
  std::uint32_t opaque_{};
  std::uint64_t cas_{};
  std::vector<std::byte> key_{};
  std::vector<std::byte> extras_{};
  std::vector<std::byte> value_{};
};
} // namespace relay::core::mcbp

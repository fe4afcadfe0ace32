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

#include <gsl/span>

#include <cstddef>
#include <cstdint>
#include <vector>

namespace relay::core::mcbp::big_endian
{
auto
read_uint64(gsl::span<const std::byte> buffer, std::size_t offset) -> std::uint64_t;

auto
read_uint32(gsl::span<const std::byte> buffer, std::size_t offset) -> std::uint32_t;

auto
read_uint16(gsl::span<const std::byte> buffer, std::size_t offset) -> std::uint16_t;

auto
read_uint8(gsl::span<const std::byte> buffer, std::size_t offset) -> std::uint8_t;

void
append_uint64(std::vector<std::byte>& buffer, std::uint64_t value);

void
append_uint32(std::vector<std::byte>& buffer, std::uint32_t value);

void
append_uint16(std::vector<std::byte>& buffer, std::uint16_t value);
} // namespace relay::core::mcbp::big_endian

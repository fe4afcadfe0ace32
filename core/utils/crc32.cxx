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

#include "crc32.hxx"

#include <array>

namespace relay::core::utils
{
namespace
{
constexpr auto
make_crc32_table() -> std::array<std::uint32_t, 256>
{
  std::array<std::uint32_t, 256> table{};
  for (std::uint32_t i = 0; i < 256; ++i) {
    std::uint32_t c = i;
    for (int k = 0; k < 8; ++k) {
      c = (c & 1U) != 0 ? 0xedb88320U ^ (c >> 1U) : c >> 1U;
    }
    table[i] = c;
  }
  return table;
}

constexpr auto crc32_table = make_crc32_table();
} // namespace

auto
hash_crc32(const char* key, std::size_t len) -> std::uint32_t
{
  std::uint32_t crc = 0xffffffffU;
  for (std::size_t i = 0; i < len; ++i) {
    crc = crc32_table[(crc ^ static_cast<std::uint8_t>(key[i])) & 0xffU] ^ (crc >> 8U);
  }
  return crc ^ 0xffffffffU;
}
} // namespace relay::core::utils

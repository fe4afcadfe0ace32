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

#include "base64.hxx"

#include <array>
#include <cstdint>

namespace relay::core::utils::base64
{
namespace
{
constexpr std::array codemap{ 'A', 'B', 'C', 'D', 'E', 'F', 'G', 'H', 'I', 'J', 'K', 'L', 'M', 'N', 'O', 'P',
                              'Q', 'R', 'S', 'T', 'U', 'V', 'W', 'X', 'Y', 'Z', 'a', 'b', 'c', 'd', 'e', 'f',
                              'g', 'h', 'i', 'j', 'k', 'l', 'm', 'n', 'o', 'p', 'q', 'r', 's', 't', 'u', 'v',
                              'w', 'x', 'y', 'z', '0', '1', '2', '3', '4', '5', '6', '7', '8', '9', '+', '/' };

auto
byte_at(std::string_view blob, std::size_t index) -> std::uint32_t
{
  return static_cast<std::uint8_t>(blob[index]);
}
} // namespace

auto
encode(std::string_view blob) -> std::string
{
  std::string result;
  result.reserve(((blob.size() + 2) / 3) * 4);

  std::size_t i = 0;
  for (; i + 3 <= blob.size(); i += 3) {
    auto val = (byte_at(blob, i) << 16U) | (byte_at(blob, i + 1) << 8U) | byte_at(blob, i + 2);
    result.push_back(codemap[(val >> 18U) & 63U]);
    result.push_back(codemap[(val >> 12U) & 63U]);
    result.push_back(codemap[(val >> 6U) & 63U]);
    result.push_back(codemap[val & 63U]);
  }

  auto rest = blob.size() - i;
  if (rest == 0) {
    return result;
  }
  std::uint32_t val = byte_at(blob, i) << 16U;
  if (rest == 2) {
    val |= byte_at(blob, i + 1) << 8U;
  }
  result.push_back(codemap[(val >> 18U) & 63U]);
  result.push_back(codemap[(val >> 12U) & 63U]);
  result.push_back(rest == 2 ? codemap[(val >> 6U) & 63U] : '=');
  result.push_back('=');
  return result;
}
} // namespace relay::core::utils::base64

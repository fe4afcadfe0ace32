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

#include "duration_parser.hxx"

#include <fmt/core.h>

#include <cstdint>
#include <limits>
#include <map>

namespace relay::core::utils
{
namespace
{
const std::map<std::string, std::uint64_t> unit_multipliers{
  { "ns", 1ULL },
  { "us", 1'000ULL },
  { "\xc2\xb5s", 1'000ULL }, // U+00B5 micro sign
  { "\xce\xbcs", 1'000ULL }, // U+03BC greek small letter mu
  { "ms", 1'000'000ULL },
  { "s", 1'000'000'000ULL },
  { "m", 60ULL * 1'000'000'000ULL },
  { "h", 3600ULL * 1'000'000'000ULL },
};

auto
is_digit(char c) -> bool
{
  return c >= '0' && c <= '9';
}

auto
invalid(const std::string& text) -> duration_parse_error
{
  return duration_parse_error(fmt::format(R"(invalid duration "{}")", text));
}
} // namespace

auto
parse_duration(const std::string& text) -> std::chrono::nanoseconds
{
  std::size_t pos = 0;
  bool negative = false;
  if (pos < text.size() && (text[pos] == '-' || text[pos] == '+')) {
    negative = text[pos] == '-';
    ++pos;
  }
  if (text.substr(pos) == "0") {
    return std::chrono::nanoseconds::zero();
  }
  if (pos == text.size()) {
    throw invalid(text);
  }

  constexpr auto limit = static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max());
  std::uint64_t total = 0;
  while (pos < text.size()) {
    std::uint64_t integer = 0;
    auto start = pos;
    while (pos < text.size() && is_digit(text[pos])) {
      if (integer > (limit - 9) / 10) {
        throw invalid(text);
      }
      integer = integer * 10 + static_cast<std::uint64_t>(text[pos] - '0');
      ++pos;
    }
    bool has_integer = pos != start;

    std::uint64_t fraction = 0;
    double scale = 1;
    bool has_fraction = false;
    if (pos < text.size() && text[pos] == '.') {
      ++pos;
      start = pos;
      while (pos < text.size() && is_digit(text[pos])) {
        // extra precision is dropped
        if (fraction <= (limit - 9) / 10) {
          fraction = fraction * 10 + static_cast<std::uint64_t>(text[pos] - '0');
          scale *= 10;
        }
        ++pos;
      }
      has_fraction = pos != start;
    }
    if (!has_integer && !has_fraction) {
      throw invalid(text);
    }

    start = pos;
    while (pos < text.size() && text[pos] != '.' && !is_digit(text[pos])) {
      ++pos;
    }
    if (start == pos) {
      throw duration_parse_error(fmt::format(R"(missing unit in duration "{}")", text));
    }
    auto unit = unit_multipliers.find(text.substr(start, pos - start));
    if (unit == unit_multipliers.end()) {
      throw duration_parse_error(
        fmt::format(R"(unknown unit "{}" in duration "{}")", text.substr(start, pos - start), text));
    }

    if (integer > limit / unit->second) {
      throw invalid(text);
    }
    std::uint64_t value = integer * unit->second;
    if (has_fraction) {
      value += static_cast<std::uint64_t>(static_cast<double>(fraction) *
                                          (static_cast<double>(unit->second) / scale));
    }
    if (value > limit - total) {
      throw invalid(text);
    }
    total += value;
  }

  auto result = static_cast<std::int64_t>(total);
  return std::chrono::nanoseconds(negative ? -result : result);
}
} // namespace relay::core::utils

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

#include "url_codec.hxx"

#include <cstddef>

namespace relay::core::utils::string_codec
{
namespace
{
constexpr auto upper_hex = "0123456789ABCDEF";

auto
hex_value(char c) -> int
{
  if (c >= '0' && c <= '9') {
    return c - '0';
  }
  if (c >= 'a' && c <= 'f') {
    return c - 'a' + 10;
  }
  if (c >= 'A' && c <= 'F') {
    return c - 'A' + 10;
  }
  return -1;
}

auto
should_escape_in_segment(char c) -> bool
{
  // §2.3 Unreserved characters (alphanum)
  if (('a' <= c && c <= 'z') || ('A' <= c && c <= 'Z') || ('0' <= c && c <= '9')) {
    return false;
  }
  switch (c) {
    case '-':
    case '_':
    case '.':
    case '~':
      // §2.3 Unreserved characters (mark)
      return false;

    case '$':
    case '&':
    case '+':
    case ':':
    case '=':
    case '@':
      // §3.3 The RFC allows : @ & = + $ but saves / ; , for assigning meaning to individual path
      // segments.
      return false;

    default:
      break;
  }
  return true;
}
} // namespace

auto
url_decode(const std::string& src) -> std::string
{
  std::string dst;
  dst.reserve(src.size());
  for (std::size_t i = 0; i < src.size(); ++i) {
    if (src[i] != '%') {
      dst.push_back(src[i]);
      continue;
    }
    if (i + 2 >= src.size()) {
      return src;
    }
    auto hi = hex_value(src[i + 1]);
    auto lo = hex_value(src[i + 2]);
    if (hi < 0 || lo < 0) {
      return src;
    }
    dst.push_back(static_cast<char>((hi << 4) | lo));
    i += 2;
  }
  return dst;
}

auto
path_escape(const std::string& s) -> std::string
{
  std::string t;
  t.reserve(s.size());
  for (const auto c : s) {
    if (should_escape_in_segment(c)) {
      t.push_back('%');
      t.push_back(upper_hex[(static_cast<unsigned char>(c) >> 4U) & 0x0fU]);
      t.push_back(upper_hex[static_cast<unsigned char>(c) & 0x0fU]);
    } else {
      t.push_back(c);
    }
  }
  return t;
}
} // namespace relay::core::utils::string_codec

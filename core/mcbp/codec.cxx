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

#include "codec.hxx"

#include "big_endian.hxx"

#include "core/logger/logger.hxx"

#include <relay/error_codes.hxx>

#include <fmt/core.h>
#include <snappy.h>

#include <algorithm>
#include <iterator>
#include <limits>
#include <string>

namespace relay::core::mcbp
{
auto
packet::debug_string() const -> std::string
{
  return fmt::format("magic=0x{:02x}, opcode=0x{:02x}, status=0x{:04x}, opaque={}, cas={}, key_len={}, "
                     "extras_len={}, value_len={}",
                     static_cast<std::uint8_t>(magic_),
                     static_cast<std::uint8_t>(command_),
                     status_,
                     opaque_,
                     cas_,
                     key_.size(),
                     extras_.size(),
                     value_.size());
}

codec::codec(bool inflate_snappy, compression_options deflate)
  : inflate_snappy_{ inflate_snappy }
  , deflate_{ deflate }
{
}

auto
codec::encode_packet(const packet& packet) const -> tl::expected<std::vector<std::byte>, std::error_code>
{
  const auto snappy_flag = static_cast<std::byte>(protocol::datatype::snappy);
  auto datatype = packet.datatype_;
  std::string compressed{};
  if (deflate_.enabled && packet.magic_ == protocol::magic::client_request &&
      (datatype & snappy_flag) == std::byte{ 0 } && !packet.value_.empty() &&
      packet.value_.size() >= deflate_.min_size) {
    snappy::Compress(reinterpret_cast<const char*>(packet.value_.data()), packet.value_.size(), &compressed);
    if (static_cast<double>(compressed.size()) / static_cast<double>(packet.value_.size()) <= deflate_.min_ratio) {
      datatype |= snappy_flag;
    } else {
      compressed.clear();
    }
  }
  const bool deflated = !compressed.empty();

  std::size_t ext_len = packet.extras_.size();
  std::size_t key_len = packet.key_.size();
  std::size_t val_len = deflated ? compressed.size() : packet.value_.size();
  std::size_t body_len = ext_len + key_len + val_len;

  if (ext_len > std::numeric_limits<std::uint8_t>::max() || key_len > std::numeric_limits<std::uint16_t>::max() ||
      body_len > std::numeric_limits<std::uint32_t>::max()) {
    RELAY_LOG_DEBUG("cannot encode packet, sections are too large: {}", packet.debug_string());
    return tl::unexpected(errc::common::invalid_argument);
  }

  std::vector<std::byte> buffer{};
  buffer.reserve(header_size + body_len);
  buffer.push_back(static_cast<std::byte>(packet.magic_));
  buffer.push_back(static_cast<std::byte>(packet.command_));
  big_endian::append_uint16(buffer, static_cast<std::uint16_t>(key_len));
  buffer.push_back(static_cast<std::byte>(ext_len));
  buffer.push_back(datatype);

  switch (packet.magic_) {
    case protocol::magic::client_request:
      if (packet.status_ != 0) {
        RELAY_LOG_DEBUG("cannot specify status in a request packet");
        return tl::unexpected(errc::common::invalid_argument);
      }
      big_endian::append_uint16(buffer, packet.vbucket_);
      break;

    case protocol::magic::client_response:
      if (packet.vbucket_ != 0) {
        RELAY_LOG_DEBUG("cannot specify vbucket in a response packet");
        return tl::unexpected(errc::common::invalid_argument);
      }
      big_endian::append_uint16(buffer, packet.status_);
      break;

    default:
      RELAY_LOG_DEBUG("cannot encode status/vbucket for packet magic 0x{:02x}",
                      static_cast<std::uint8_t>(packet.magic_));
      return tl::unexpected(errc::common::invalid_argument);
  }

  big_endian::append_uint32(buffer, static_cast<std::uint32_t>(body_len));
  big_endian::append_uint32(buffer, packet.opaque_);
  big_endian::append_uint64(buffer, packet.cas_);

  buffer.insert(buffer.end(), packet.extras_.begin(), packet.extras_.end());
  buffer.insert(buffer.end(), packet.key_.begin(), packet.key_.end());
  if (deflated) {
    std::transform(compressed.begin(), compressed.end(), std::back_inserter(buffer), [](char c) {
      return static_cast<std::byte>(c);
    });
  } else {
    buffer.insert(buffer.end(), packet.value_.begin(), packet.value_.end());
  }
  return buffer;
}

auto
codec::decode_packet(gsl::span<const std::byte> input) const -> std::tuple<packet, std::size_t, std::error_code>
{
  if (input.size() < header_size) {
    return { {}, 0, errc::network::need_more_data };
  }
  auto raw_magic = big_endian::read_uint8(input, 0);
  if (!protocol::is_valid_magic(raw_magic)) {
    RELAY_LOG_WARNING("invalid magic of the next frame: 0x{:02x}, {} bytes to parse", raw_magic, input.size());
    return { {}, 0, errc::network::protocol_error };
  }

  auto body_len = big_endian::read_uint32(input, 8);
  auto packet_len = header_size + body_len;
  if (input.size() < packet_len) {
    return { {}, 0, errc::network::need_more_data };
  }

  packet result{};
  result.magic_ = static_cast<protocol::magic>(raw_magic);
  result.command_ = static_cast<protocol::client_opcode>(big_endian::read_uint8(input, 1));
  result.datatype_ = input[5];
  result.opaque_ = big_endian::read_uint32(input, 12);
  result.cas_ = big_endian::read_uint64(input, 16);

  std::size_t framing_extras_len{ 0 };
  std::size_t key_len{ 0 };
  switch (result.magic_) {
    case protocol::magic::alt_client_request:
    case protocol::magic::alt_client_response:
      framing_extras_len = big_endian::read_uint8(input, 2);
      key_len = big_endian::read_uint8(input, 3);
      break;
    default:
      key_len = big_endian::read_uint16(input, 2);
      break;
  }
  std::size_t ext_len = big_endian::read_uint8(input, 4);

  switch (result.magic_) {
    case protocol::magic::client_response:
    case protocol::magic::alt_client_response:
    case protocol::magic::server_response:
      result.status_ = big_endian::read_uint16(input, 6);
      result.status_code_ = protocol::status_to_key_value_status_code(result.status_);
      result.magic_ = protocol::magic::client_response;
      break;
    default:
      result.vbucket_ = big_endian::read_uint16(input, 6);
      result.magic_ = protocol::magic::client_request;
      break;
  }

  if (framing_extras_len + ext_len + key_len > body_len) {
    return { {}, 0, errc::network::protocol_error };
  }

  auto body = input.subspan(header_size, body_len);
  std::size_t offset = framing_extras_len;
  result.extras_.assign(body.begin() + static_cast<std::ptrdiff_t>(offset),
                        body.begin() + static_cast<std::ptrdiff_t>(offset + ext_len));
  offset += ext_len;
  result.key_.assign(body.begin() + static_cast<std::ptrdiff_t>(offset),
                     body.begin() + static_cast<std::ptrdiff_t>(offset + key_len));
  offset += key_len;
  auto value = body.subspan(offset);

  const auto snappy_flag = static_cast<std::byte>(protocol::datatype::snappy);
  if (inflate_snappy_ && (result.datatype_ & snappy_flag) != std::byte{ 0 }) {
    std::string uncompressed;
    if (!snappy::Uncompress(reinterpret_cast<const char*>(value.data()), value.size(), &uncompressed)) {
      RELAY_LOG_DEBUG("unable to inflate value: {}", result.debug_string());
      return { {}, 0, errc::network::protocol_error };
    }
    result.value_ = to_bytes(uncompressed);
    result.datatype_ &= ~snappy_flag;
  } else {
    result.value_.assign(value.begin(), value.end());
  }
  return { std::move(result), packet_len, {} };
}

auto
to_bytes(std::string_view data) -> std::vector<std::byte>
{
  std::vector<std::byte> result(data.size());
  std::transform(data.begin(), data.end(), result.begin(), [](char c) {
    return static_cast<std::byte>(c);
  });
  return result;
}

auto
to_string(const std::vector<std::byte>& data) -> std::string
{
  return { reinterpret_cast<const char*>(data.data()), data.size() };
}
} // namespace relay::core::mcbp

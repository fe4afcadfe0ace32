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

#include "packet.hxx"

#include <gsl/span>
#include <tl/expected.hpp>

#include <cstddef>
#include <string>
#include <string_view>
#include <system_error>
#include <tuple>
#include <vector>

namespace relay::core::mcbp
{
constexpr std::size_t header_size{ 24 };

/**
 * Outgoing values of at least min_size bytes are sent compressed when the compressed form is at
 * most min_ratio of the original size.
 */
struct compression_options {
  bool enabled{ false };
  std::size_t min_size{ 32 };
  double min_ratio{ 0.83 };
};

/**
 * Binary protocol framing: 24 byte header followed by framing extras, extras, key and value.
 */
class codec
{
public:
  /**
   * @param inflate_snappy decompress values flagged with the snappy datatype
   * @param deflate compression of request values
   */
  explicit codec(bool inflate_snappy = true, compression_options deflate = {});

  [[nodiscard]] auto encode_packet(const packet& packet) const -> tl::expected<std::vector<std::byte>, std::error_code>;

  /**
   * Decodes the first frame of the input.
   *
   * @return the packet, the number of bytes consumed, and errc::network::need_more_data when the
   * frame is not complete yet or errc::network::protocol_error when the input is not a frame
   */
  [[nodiscard]] auto decode_packet(gsl::span<const std::byte> input) const
    -> std::tuple<packet, std::size_t, std::error_code>;

private:
  bool inflate_snappy_;
  compression_options deflate_;
};

[[nodiscard]] auto
to_bytes(std::string_view data) -> std::vector<std::byte>;

[[nodiscard]] auto
to_string(const std::vector<std::byte>& data) -> std::string;
} // namespace relay::core::mcbp

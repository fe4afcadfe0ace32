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

#include "test_helper.hxx"

#include "core/mcbp/big_endian.hxx"
#include "core/mcbp/codec.hxx"

#include <relay/error_codes.hxx>

#include <snappy.h>

namespace
{
auto
get_request() -> relay::core::mcbp::packet
{
  relay::core::mcbp::packet request{};
  request.command_ = relay::core::protocol::client_opcode::get;
  request.vbucket_ = 0x0102;
  request.opaque_ = 0xcafebabe;
  request.key_ = relay::core::mcbp::to_bytes("airline_10");
  return request;
}
} // namespace

TEST_CASE("unit: binary protocol request header layout", "[unit]")
{
  test::utils::init_logger();
  relay::core::mcbp::codec codec{};

  auto request = get_request();
  request.extras_ = relay::core::mcbp::to_bytes("\x00\x00\x00\x2a");
  request.value_ = relay::core::mcbp::to_bytes("{}");
  request.cas_ = 0x0102030405060708ULL;

  auto encoded = codec.encode_packet(request);
  REQUIRE(encoded.has_value());
  const auto& bytes = encoded.value();
  gsl::span<const std::byte> frame{ bytes };
  REQUIRE(bytes.size() == relay::core::mcbp::header_size + 4 + 10 + 2);
  REQUIRE(relay::core::mcbp::big_endian::read_uint8(frame, 0) == 0x80);
  REQUIRE(relay::core::mcbp::big_endian::read_uint8(frame, 1) == 0x00);
  REQUIRE(relay::core::mcbp::big_endian::read_uint16(frame, 2) == 10);
  REQUIRE(relay::core::mcbp::big_endian::read_uint8(frame, 4) == 4);
  REQUIRE(relay::core::mcbp::big_endian::read_uint16(frame, 6) == 0x0102);
  REQUIRE(relay::core::mcbp::big_endian::read_uint32(frame, 8) == 16);
  REQUIRE(relay::core::mcbp::big_endian::read_uint32(frame, 12) == 0xcafebabe);
  REQUIRE(relay::core::mcbp::big_endian::read_uint64(frame, 16) == 0x0102030405060708ULL);
  REQUIRE(relay::core::mcbp::big_endian::read_uint32(frame, 24) == 42);

  auto [decoded, consumed, ec] = codec.decode_packet(frame);
  REQUIRE_SUCCESS(ec);
  REQUIRE(consumed == bytes.size());
  REQUIRE(decoded.magic_ == relay::core::protocol::magic::client_request);
  REQUIRE(decoded.command_ == relay::core::protocol::client_opcode::get);
  REQUIRE(decoded.vbucket_ == 0x0102);
  REQUIRE(relay::core::mcbp::to_string(decoded.key_) == "airline_10");
  REQUIRE(decoded.extras_.size() == 4);
  REQUIRE(relay::core::mcbp::to_string(decoded.value_) == "{}");
}

TEST_CASE("unit: binary protocol response decoding", "[unit]")
{
  test::utils::init_logger();
  relay::core::mcbp::codec codec{};

  relay::core::mcbp::packet response{};
  response.magic_ = relay::core::protocol::magic::client_response;
  response.command_ = relay::core::protocol::client_opcode::get;
  response.status_ = 0x0001;
  response.opaque_ = 7;
  auto encoded = codec.encode_packet(response);
  REQUIRE(encoded.has_value());

  SECTION("status is mapped")
  {
    auto [decoded, consumed, ec] = codec.decode_packet(encoded.value());
    REQUIRE_SUCCESS(ec);
    REQUIRE(decoded.magic_ == relay::core::protocol::magic::client_response);
    REQUIRE(decoded.status_ == 0x0001);
    REQUIRE(decoded.status_code_ == relay::core::protocol::key_value_status_code::not_found);
    REQUIRE(decoded.opaque_ == 7);
  }

  SECTION("unknown status")
  {
    response.status_ = 0x7777;
    auto unknown = codec.encode_packet(response);
    REQUIRE(unknown.has_value());
    auto [decoded, consumed, ec] = codec.decode_packet(unknown.value());
    REQUIRE_SUCCESS(ec);
    REQUIRE(decoded.status_ == 0x7777);
    REQUIRE(decoded.status_code_ == relay::core::protocol::key_value_status_code::unknown);
  }

  SECTION("alternative response with framing extras")
  {
    auto bytes = relay::core::mcbp::to_bytes(std::string{
      "\x18\x00\x03\x02\x00\x00\x00\x00\x00\x00\x00\x08\x00\x00\x00\x09\x00\x00\x00\x00\x00\x00\x00\x00"
      "\x02\x00\x10"
      "ab"
      "xyz",
      32 });
    auto [decoded, consumed, ec] = codec.decode_packet(bytes);
    REQUIRE_SUCCESS(ec);
    REQUIRE(consumed == 32);
    REQUIRE(decoded.magic_ == relay::core::protocol::magic::client_response);
    REQUIRE(decoded.opaque_ == 9);
    REQUIRE(relay::core::mcbp::to_string(decoded.key_) == "ab");
    REQUIRE(relay::core::mcbp::to_string(decoded.value_) == "xyz");
  }
}

TEST_CASE("unit: binary protocol stream framing", "[unit]")
{
  test::utils::init_logger();
  relay::core::mcbp::codec codec{};

  auto first = codec.encode_packet(get_request()).value();
  auto second_request = get_request();
  second_request.opaque_ = 2;
  auto second = codec.encode_packet(second_request).value();

  std::vector<std::byte> stream{ first };
  stream.insert(stream.end(), second.begin(), second.end());

  SECTION("partial header")
  {
    auto [decoded, consumed, ec] = codec.decode_packet(gsl::span<const std::byte>{ stream }.first(10));
    REQUIRE(ec == relay::errc::network::need_more_data);
    REQUIRE(consumed == 0);
  }

  SECTION("partial body")
  {
    auto [decoded, consumed, ec] = codec.decode_packet(gsl::span<const std::byte>{ stream }.first(first.size() - 1));
    REQUIRE(ec == relay::errc::network::need_more_data);
    REQUIRE(consumed == 0);
  }

  SECTION("consecutive frames")
  {
    gsl::span<const std::byte> input{ stream };
    auto [one, one_consumed, one_ec] = codec.decode_packet(input);
    REQUIRE_SUCCESS(one_ec);
    REQUIRE(one.opaque_ == 0xcafebabe);
    auto [two, two_consumed, two_ec] = codec.decode_packet(input.subspan(one_consumed));
    REQUIRE_SUCCESS(two_ec);
    REQUIRE(two.opaque_ == 2);
    REQUIRE(one_consumed + two_consumed == stream.size());
  }

  SECTION("garbage")
  {
    stream[0] = std::byte{ 0x42 };
    auto [decoded, consumed, ec] = codec.decode_packet(stream);
    REQUIRE(ec == relay::errc::network::protocol_error);
  }

  SECTION("sections larger than the body")
  {
    stream[2] = std::byte{ 0xff };
    auto [decoded, consumed, ec] = codec.decode_packet(gsl::span<const std::byte>{ stream }.first(first.size()));
    REQUIRE(ec == relay::errc::network::protocol_error);
  }
}

TEST_CASE("unit: binary protocol snappy values", "[unit]")
{
  test::utils::init_logger();

  std::string document(512, 'x');
  std::string compressed{};
  snappy::Compress(document.data(), document.size(), &compressed);

  relay::core::mcbp::packet response{};
  response.magic_ = relay::core::protocol::magic::client_response;
  response.command_ = relay::core::protocol::client_opcode::get;
  response.datatype_ = static_cast<std::byte>(relay::core::protocol::datatype::snappy) |
                       static_cast<std::byte>(relay::core::protocol::datatype::json);
  response.value_ = relay::core::mcbp::to_bytes(compressed);

  relay::core::mcbp::codec inflating{};
  auto encoded = inflating.encode_packet(response).value();

  SECTION("inflated on decode")
  {
    auto [decoded, consumed, ec] = inflating.decode_packet(encoded);
    REQUIRE_SUCCESS(ec);
    REQUIRE(relay::core::mcbp::to_string(decoded.value_) == document);
    REQUIRE(decoded.datatype_ == static_cast<std::byte>(relay::core::protocol::datatype::json));
  }

  SECTION("kept compressed")
  {
    relay::core::mcbp::codec raw{ false };
    auto [decoded, consumed, ec] = raw.decode_packet(encoded);
    REQUIRE_SUCCESS(ec);
    REQUIRE(relay::core::mcbp::to_string(decoded.value_) == compressed);
  }

  SECTION("corrupted")
  {
    response.value_ = relay::core::mcbp::to_bytes("\xff\xff\xff\xff\xff");
    auto corrupted = inflating.encode_packet(response).value();
    auto [decoded, consumed, ec] = inflating.decode_packet(corrupted);
    REQUIRE(ec == relay::errc::network::protocol_error);
  }
}

TEST_CASE("unit: binary protocol compresses request values", "[unit]")
{
  test::utils::init_logger();

  const relay::core::mcbp::codec deflating{ true, relay::core::mcbp::compression_options{ true, 32, 0.83 } };
  const relay::core::mcbp::codec raw{ false };
  const auto snappy_flag = static_cast<std::byte>(relay::core::protocol::datatype::snappy);
  auto request = get_request();

  SECTION("large and compressible")
  {
    std::string document(4096, 'a');
    request.value_ = relay::core::mcbp::to_bytes(document);
    auto encoded = deflating.encode_packet(request).value();
    REQUIRE(encoded.size() < relay::core::mcbp::header_size + 10 + document.size());

    auto [on_wire, consumed, ec] = raw.decode_packet(encoded);
    REQUIRE_SUCCESS(ec);
    REQUIRE((on_wire.datatype_ & snappy_flag) == snappy_flag);
    std::string uncompressed{};
    REQUIRE(snappy::Uncompress(reinterpret_cast<const char*>(on_wire.value_.data()), on_wire.value_.size(), &uncompressed));
    REQUIRE(uncompressed == document);

    auto [inflated, inflated_consumed, inflated_ec] = deflating.decode_packet(encoded);
    REQUIRE_SUCCESS(inflated_ec);
    REQUIRE(relay::core::mcbp::to_string(inflated.value_) == document);
  }

  SECTION("smaller than the minimum size")
  {
    request.value_ = relay::core::mcbp::to_bytes(std::string(31, 'a'));
    auto encoded = deflating.encode_packet(request).value();
    auto [on_wire, consumed, ec] = raw.decode_packet(encoded);
    REQUIRE_SUCCESS(ec);
    REQUIRE((on_wire.datatype_ & snappy_flag) == std::byte{ 0 });
    REQUIRE(relay::core::mcbp::to_string(on_wire.value_) == std::string(31, 'a'));
  }

  SECTION("compression does not save enough")
  {
    std::string noise{};
    std::uint32_t state = 2463534242U;
    for (std::size_t i = 0; i < 256; ++i) {
      state ^= state << 13U;
      state ^= state >> 17U;
      state ^= state << 5U;
      noise.push_back(static_cast<char>(state & 0xffU));
    }
    request.value_ = relay::core::mcbp::to_bytes(noise);
    auto encoded = deflating.encode_packet(request).value();
    auto [on_wire, consumed, ec] = raw.decode_packet(encoded);
    REQUIRE_SUCCESS(ec);
    REQUIRE((on_wire.datatype_ & snappy_flag) == std::byte{ 0 });
    REQUIRE(relay::core::mcbp::to_string(on_wire.value_) == noise);
  }

  SECTION("disabled")
  {
    request.value_ = relay::core::mcbp::to_bytes(std::string(4096, 'a'));
    auto encoded = raw.encode_packet(request).value();
    REQUIRE(encoded.size() == relay::core::mcbp::header_size + 10 + 4096);
  }
}

TEST_CASE("unit: binary protocol rejects inconsistent packets", "[unit]")
{
  test::utils::init_logger();
  relay::core::mcbp::codec codec{};

  auto request = get_request();
  request.status_ = 1;
  REQUIRE(codec.encode_packet(request).error() == relay::errc::common::invalid_argument);

  relay::core::mcbp::packet response{};
  response.magic_ = relay::core::protocol::magic::client_response;
  response.vbucket_ = 3;
  REQUIRE(codec.encode_packet(response).error() == relay::errc::common::invalid_argument);

  request = get_request();
  request.extras_.resize(256);
  REQUIRE(codec.encode_packet(request).error() == relay::errc::common::invalid_argument);
}

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

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <string>

namespace relay::core::io
{
struct http_streaming_parser_state;

/**
 * Incremental HTTP/1.1 response parser on top of llhttp. Header names are lower-cased, repeated
 * headers are joined with ", ". Body bytes accumulate in body_chunk until the caller takes them.
 */
struct http_streaming_parser {
  struct feeding_result {
    bool failure{ false };
    bool complete{ false };
    bool headers_complete{ false };
    std::string error{};
  };

  std::uint32_t status_code{};
  std::string status_message{};
  std::map<std::string, std::string> headers{};
  std::string body_chunk{};

  bool headers_complete{ false };
  bool complete{ false };

  /**
   * Known once the headers are complete: false when the peer asked to close the connection or
   * the body is delimited by the end of the stream.
   */
  bool keep_alive{ true };

  http_streaming_parser();
  http_streaming_parser(http_streaming_parser&& other) noexcept;
  auto operator=(http_streaming_parser&& other) noexcept -> http_streaming_parser&;
  http_streaming_parser(const http_streaming_parser& other) = delete;
  auto operator=(const http_streaming_parser& other) -> http_streaming_parser& = delete;
  ~http_streaming_parser();

  /**
   * Prepares for the next response on the same connection.
   */
  void reset();

  auto feed(const char* data, std::size_t data_len) -> feeding_result;

  /**
   * Signals end of input, completes a response delimited by the connection closing.
   */
  auto finish() -> feeding_result;

private:
  void attach();
  [[nodiscard]] auto result_of(int code) const -> feeding_result;

  std::unique_ptr<http_streaming_parser_state> state_{};
};
} // namespace relay::core::io

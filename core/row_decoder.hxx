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

#include "utils/json_streaming_lexer.hxx"

#include <cstddef>
#include <deque>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

namespace relay::core
{
/**
 * Turns a row-oriented JSON response body, fed chunk by chunk, into a forward-only sequence of
 * rows. A row becomes available as soon as its closing token has been fed.
 *
 * Once the decoder reached the end of the stream, next() keeps returning an empty optional and
 * err() reports the terminal error, if any. Rows decoded before a failure are still returned.
 * The decoder is not thread safe.
 */
class row_decoder
{
public:
  /**
   * @param pointer_expression location of the rows, e.g. "/results/^"
   *
   * @throws std::invalid_argument if the pointer expression is malformed
   */
  explicit row_decoder(const std::string& pointer_expression);

  row_decoder(const row_decoder&) = delete;
  auto operator=(const row_decoder&) -> row_decoder& = delete;
  row_decoder(row_decoder&&) = default;
  auto operator=(row_decoder&&) -> row_decoder& = default;
  ~row_decoder() = default;

  void feed(std::string_view chunk);

  /**
   * No more input will be fed. A document that is not complete at this point is truncated.
   */
  void finish();

  /**
   * Terminates the stream with an error coming from the transport.
   */
  void fail(std::error_code ec);

  auto next() -> std::optional<std::string>;

  /**
   * @return true when all rows have been consumed and no more will come.
   */
  [[nodiscard]] auto end_of_stream() const -> bool;

  /**
   * @return true when the body needs no more input.
   */
  [[nodiscard]] auto input_complete() const -> bool;

  [[nodiscard]] auto err() const -> std::error_code;

  [[nodiscard]] auto buffered_rows() const -> std::size_t;

  /**
   * The document without its rows, available once the input is complete and valid.
   */
  [[nodiscard]] auto metadata() const -> const std::optional<std::string>&;

  /**
   * Everything preceding the first row, closed into a valid JSON object. Available once the first
   * row started, the rows array turned out empty, or the input completed.
   */
  [[nodiscard]] auto metadata_header() const -> const std::optional<std::string>&;

private:
  struct state {
    std::deque<std::string> rows{};
    std::optional<std::string> header{};
    std::optional<std::string> metadata{};
    std::error_code error{};
    bool complete{ false };
  };

  std::unique_ptr<state> state_{ std::make_unique<state>() };
  utils::json::streaming_lexer lexer_;
};
} // namespace relay::core

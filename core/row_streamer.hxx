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

#include "io/http_message.hxx"
#include "utils/movable_function.hxx"

#include <memory>
#include <optional>
#include <string>
#include <system_error>

namespace relay::core
{
class row_streamer_impl;

/**
 * Pulls the body of a row-oriented response through a row_decoder. The body is read only while
 * somebody waits for a row, so memory stays bounded by what the consumer has not taken yet.
 */
class row_streamer
{
public:
  using header_handler = utils::movable_function<void(std::error_code ec, std::string header)>;

  /**
   * Invoked with the next row, or with an empty row once the stream ended (ec tells how).
   */
  using row_handler = utils::movable_function<void(std::error_code ec, std::optional<std::string> row)>;

  row_streamer(std::shared_ptr<io::http_body_reader> body, const std::string& pointer_expression);

  /**
   * Reads until everything preceding the first row has arrived and returns it as a JSON object.
   */
  void start(header_handler&& handler);

  void next_row(row_handler&& handler);

  /**
   * Stops reading and releases the connection. A pending handler receives request_canceled.
   */
  void cancel();

  /**
   * The document without its rows, available once all rows have been streamed.
   */
  [[nodiscard]] auto metadata() const -> std::optional<std::string>;

private:
  std::shared_ptr<row_streamer_impl> impl_;
};
} // namespace relay::core

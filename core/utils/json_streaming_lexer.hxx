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

#include <relay/error_codes.hxx>

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <string_view>

namespace relay::core::utils::json
{
namespace detail
{
struct lexer_state;
} // namespace detail

/**
 * Incremental JSON lexer that extracts the elements of one array (the "rows") out of a document
 * that arrives in chunks. Everything outside the array is collected as metadata.
 *
 * The completion handler is invoked exactly once: after the closing brace of the root object, on
 * the first syntax error, or from finish() when the input ended before the document was complete.
 */
class streaming_lexer
{
public:
  using row_handler = std::function<void(std::string&& row)>;
  using header_handler = std::function<void(std::string&& header)>;
  using complete_handler =
    std::function<void(std::error_code ec, std::size_t number_of_rows, std::string&& meta)>;

  /**
   * @param pointer_expression JSON pointer of the rows, e.g. "/results/^"
   * @param depth stop emitting JSON events starting from this depth. Level 1 is root of the
   * object.
   *
   * @throws std::invalid_argument if pointer cannot be created from the expression.
   */
  streaming_lexer(const std::string& pointer_expression, std::uint32_t depth);

  void feed(std::string_view data);

  /**
   * Signals the end of input.
   */
  void finish();

  /**
   * The header is everything preceding the first row. It is reported when the first row starts, or
   * when the rows array turns out to be empty. Documents without the rows array report no header.
   */
  void on_metadata_header(header_handler handler);
  void on_row(row_handler handler);
  void on_complete(complete_handler handler);

  [[nodiscard]] auto completed() const -> bool;

private:
  std::shared_ptr<detail::lexer_state> state_{};
};
} // namespace relay::core::utils::json

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

#include "row_streamer.hxx"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace relay::core
{
/**
 * Successful response of an analytics, N1QL, search or view query. Rows are pulled with
 * next_row(), the metadata trailing the rows becomes available once they have all been read.
 */
class query_result
{
public:
  query_result() = default;
  query_result(std::shared_ptr<row_streamer> rows, std::string header, std::uint32_t status_code, std::string endpoint);

  void next_row(row_streamer::row_handler&& handler) const;

  /**
   * Stops the stream and releases its connection.
   */
  void cancel() const;

  /**
   * Everything preceding the first row (request identifiers, signature, ...).
   */
  [[nodiscard]] auto header() const -> const std::string&;

  [[nodiscard]] auto metadata() const -> std::optional<std::string>;
  [[nodiscard]] auto status_code() const -> std::uint32_t;
  [[nodiscard]] auto endpoint() const -> const std::string&;

private:
  std::shared_ptr<row_streamer> rows_{};
  std::string header_{};
  std::uint32_t status_code_{ 0 };
  std::string endpoint_{};
};

void
discard_unused_result(query_result& result);
} // namespace relay::core

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

#include "row_decoder.hxx"

#include <cstdint>
#include <utility>

namespace relay::core
{
namespace
{
constexpr std::uint32_t lexer_depth{ 4 };

auto
close_metadata_header(std::string header) -> std::string
{
  header.erase(header.find_last_not_of(" \t\f\v\n\r") + 1);
  if (!header.empty() && header.back() == ',') {
    header.pop_back();
  }
  // the header ends with the opening bracket of the rows array
  if (!header.empty() && header.back() == '[') {
    header.append("]}");
  }
  return header;
}
} // namespace

row_decoder::row_decoder(const std::string& pointer_expression)
  : lexer_{ pointer_expression, lexer_depth }
{
  auto* st = state_.get();
  lexer_.on_metadata_header([st](std::string&& header) {
    if (!st->header) {
      st->header = close_metadata_header(std::move(header));
    }
  });
  lexer_.on_row([st](std::string&& row) {
    st->rows.emplace_back(std::move(row));
  });
  lexer_.on_complete([st](std::error_code ec, std::size_t /* number_of_rows */, std::string&& meta) {
    st->complete = true;
    if (ec) {
      st->error = ec;
      return;
    }
    if (!st->header) {
      st->header = meta;
    }
    st->metadata = std::move(meta);
  });
}

void
row_decoder::feed(std::string_view chunk)
{
  if (state_->complete) {
    return;
  }
  lexer_.feed(chunk);
}

void
row_decoder::finish()
{
  if (state_->complete) {
    return;
  }
  lexer_.finish();
}

void
row_decoder::fail(std::error_code ec)
{
  if (state_->complete) {
    return;
  }
  state_->complete = true;
  state_->error = ec;
}

auto
row_decoder::next() -> std::optional<std::string>
{
  if (state_->rows.empty()) {
    return {};
  }
  auto row = std::move(state_->rows.front());
  state_->rows.pop_front();
  return row;
}

auto
row_decoder::end_of_stream() const -> bool
{
  return state_->complete && state_->rows.empty();
}

auto
row_decoder::input_complete() const -> bool
{
  return state_->complete;
}

auto
row_decoder::err() const -> std::error_code
{
  return state_->error;
}

auto
row_decoder::buffered_rows() const -> std::size_t
{
  return state_->rows.size();
}

auto
row_decoder::metadata() const -> const std::optional<std::string>&
{
  return state_->metadata;
}

auto
row_decoder::metadata_header() const -> const std::optional<std::string>&
{
  return state_->header;
}
} // namespace relay::core

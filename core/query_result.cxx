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
#include "query_result.hxx"

#include <relay/error_codes.hxx>

#include <utility>

namespace relay::core
{
query_result::query_result(std::shared_ptr<row_streamer> rows,
                           std::string header,
                           std::uint32_t status_code,
                           std::string endpoint)
  : rows_{ std::move(rows) }
  , header_{ std::move(header) }
  , status_code_{ status_code }
  , endpoint_{ std::move(endpoint) }
{
}

void
query_result::next_row(row_streamer::row_handler&& handler) const
{
  if (!rows_) {
    return handler(errc::common::request_canceled, {});
  }
  rows_->next_row(std::move(handler));
}

void
query_result::cancel() const
{
  if (rows_) {
    rows_->cancel();
  }
}

auto
query_result::header() const -> const std::string&
{
  return header_;
}

auto
query_result::metadata() const -> std::optional<std::string>
{
  if (!rows_) {
    return {};
  }
  return rows_->metadata();
}

auto
query_result::status_code() const -> std::uint32_t
{
  return status_code_;
}

auto
query_result::endpoint() const -> const std::string&
{
  return endpoint_;
}

void
discard_unused_result(query_result& result)
{
  result.cancel();
}
} // namespace relay::core

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
#include "http_streaming_parser.hxx"

#include <llhttp.h>

#include <algorithm>
#include <cctype>
#include <utility>

namespace relay::core::io
{
struct http_streaming_parser_state {
  http_streaming_parser* owner{ nullptr };
  llhttp_t parser{};
  std::string field{};
  std::string value{};
};

namespace
{
auto
state_of(llhttp_t* parser) -> http_streaming_parser_state*
{
  return static_cast<http_streaming_parser_state*>(parser->data);
}

/**
 * Callbacks are stateless, the parser being fed is reached through llhttp_t::data. Every piece of
 * the status line and of the headers may arrive split across several feeds.
 */
auto
response_settings() -> const llhttp_settings_t*
{
  static const llhttp_settings_t settings = []() {
    llhttp_settings_t s{};
    llhttp_settings_init(&s);
    s.on_status = [](llhttp_t* parser, const char* at, std::size_t length) -> int {
      state_of(parser)->owner->status_message.append(at, length);
      return HPE_OK;
    };
    s.on_header_field = [](llhttp_t* parser, const char* at, std::size_t length) -> int {
      state_of(parser)->field.append(at, length);
      return HPE_OK;
    };
    s.on_header_value = [](llhttp_t* parser, const char* at, std::size_t length) -> int {
      state_of(parser)->value.append(at, length);
      return HPE_OK;
    };
    s.on_header_value_complete = [](llhttp_t* parser) -> int {
      auto* state = state_of(parser);
      std::transform(state->field.begin(), state->field.end(), state->field.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
      });
      auto& value = state->owner->headers[state->field];
      if (!value.empty()) {
        value.append(", ");
      }
      value.append(state->value);
      state->field.clear();
      state->value.clear();
      return HPE_OK;
    };
    s.on_headers_complete = [](llhttp_t* parser) -> int {
      auto* owner = state_of(parser)->owner;
      owner->status_code = parser->status_code;
      owner->headers_complete = true;
      owner->keep_alive = llhttp_should_keep_alive(parser) != 0;
      return HPE_OK;
    };
    s.on_body = [](llhttp_t* parser, const char* at, std::size_t length) -> int {
      state_of(parser)->owner->body_chunk.append(at, length);
      return HPE_OK;
    };
    s.on_message_complete = [](llhttp_t* parser) -> int {
      state_of(parser)->owner->complete = true;
      return HPE_OK;
    };
    return s;
  }();
  return &settings;
}
} // namespace

http_streaming_parser::http_streaming_parser()
  : state_{ std::make_unique<http_streaming_parser_state>() }
{
  llhttp_init(&state_->parser, HTTP_RESPONSE, response_settings());
  attach();
}

http_streaming_parser::~http_streaming_parser() = default;

http_streaming_parser::http_streaming_parser(http_streaming_parser&& other) noexcept
  : status_code{ other.status_code }
  , status_message{ std::move(other.status_message) }
  , headers{ std::move(other.headers) }
  , body_chunk{ std::move(other.body_chunk) }
  , headers_complete{ other.headers_complete }
  , complete{ other.complete }
  , keep_alive{ other.keep_alive }
  , state_{ std::move(other.state_) }
{
  attach();
}

auto
http_streaming_parser::operator=(http_streaming_parser&& other) noexcept -> http_streaming_parser&
{
  if (this != &other) {
    status_code = other.status_code;
    status_message = std::move(other.status_message);
    headers = std::move(other.headers);
    body_chunk = std::move(other.body_chunk);
    headers_complete = other.headers_complete;
    complete = other.complete;
    keep_alive = other.keep_alive;
    state_ = std::move(other.state_);
    attach();
  }
  return *this;
}

void
http_streaming_parser::attach()
{
  if (state_) {
    state_->owner = this;
    state_->parser.data = state_.get();
  }
}

void
http_streaming_parser::reset()
{
  status_code = 0;
  status_message.clear();
  headers.clear();
  body_chunk.clear();
  headers_complete = false;
  complete = false;
  keep_alive = true;
  state_->field.clear();
  state_->value.clear();
  llhttp_init(&state_->parser, HTTP_RESPONSE, response_settings());
  attach();
}

auto
http_streaming_parser::result_of(int code) const -> feeding_result
{
  if (code != HPE_OK) {
    const auto* reason = llhttp_get_error_reason(&state_->parser);
    return { true, complete, headers_complete, reason != nullptr ? reason : llhttp_errno_name(static_cast<llhttp_errno_t>(code)) };
  }
  return { false, complete, headers_complete, {} };
}

auto
http_streaming_parser::feed(const char* data, std::size_t data_len) -> feeding_result
{
  return result_of(llhttp_execute(&state_->parser, data, data_len));
}

auto
http_streaming_parser::finish() -> feeding_result
{
  return result_of(llhttp_finish(&state_->parser));
}
} // namespace relay::core::io

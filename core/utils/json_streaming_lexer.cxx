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

#include "json_streaming_lexer.hxx"

#include <jsonsl.h>

#include <stdexcept>

namespace relay::core::utils::json
{
namespace detail
{
#define STATE_MARKER_ROOT (reinterpret_cast<void*>(1))
#define STATE_MARKER_ROWSET (reinterpret_cast<void*>(2))

struct lexer_state {
  lexer_state(jsonsl_t lexer, jsonsl_jpr_t pointer)
    : lexer_(lexer)
    , pointer_(pointer)
  {
  }

  lexer_state(const lexer_state& other) = delete;
  auto operator=(const lexer_state& other) -> lexer_state& = delete;
  lexer_state(lexer_state&& other) noexcept = delete;
  auto operator=(lexer_state&& other) -> lexer_state& = delete;

  ~lexer_state()
  {
    jsonsl_jpr_destroy(pointer_);
    jsonsl_jpr_match_state_cleanup(lexer_);
    jsonsl_destroy(lexer_);
  }

  void complete(std::error_code ec, std::string&& meta)
  {
    if (complete_) {
      return;
    }
    complete_ = true;
    if (ec) {
      error_ = ec;
    }
    if (on_complete_) {
      auto handler = std::move(on_complete_);
      handler(ec, number_of_rows_, std::move(meta));
    }
  }

  void validate_root(struct jsonsl_state_st* state, jsonsl_jpr_match_t match)
  {
    if (root_has_been_validated_) {
      return;
    }
    root_has_been_validated_ = true;

    if (state->type != JSONSL_T_OBJECT) {
      return complete(errc::streaming_json_lexer::root_is_not_an_object, {});
    }
    if (match != JSONSL_MATCH_POSSIBLE) {
      return complete(errc::streaming_json_lexer::root_does_not_match_json_pointer, {});
    }
    state->data = STATE_MARKER_ROOT;
  }

  [[nodiscard]] auto buffer_region(std::size_t pos, std::size_t desired = 0) const
    -> std::string_view
  {
    if (min_pos_ > pos) {
      return {};
    }

    const char* begin = buffer_.data() + (pos - min_pos_);
    const char* end = buffer_.data() + buffer_.size();
    if (begin >= end) {
      return {};
    }
    auto len = static_cast<std::size_t>(end - begin);
    if (desired > 0 && len > desired) {
      len = desired;
    }
    return { begin, len };
  }

  jsonsl_t lexer_{};
  jsonsl_jpr_t pointer_{};
  std::string meta_buffer_{};
  std::size_t number_of_rows_{};
  bool meta_complete_{ false };
  bool complete_{ false };

  /**
   * size of the metadata header chunk (i.e. everything until the opening bracket of the rows)
   */
  std::size_t meta_header_length_{};

  /**
   * End of the last row. When no rows follow, the metadata trailer starts here.
   */
  std::size_t last_row_end_position_{};

  /** absolute position of the first byte in buffer_ */
  std::size_t min_pos_{};

  /** minimum (absolute) position to keep */
  std::size_t keep_position_{};

  std::string buffer_{};
  std::string last_key_{};
  std::error_code error_{};
  streaming_lexer::header_handler on_header_{};
  streaming_lexer::row_handler on_row_{};
  streaming_lexer::complete_handler on_complete_{};
  bool root_has_been_validated_{ false };
};
} // namespace detail

namespace
{
auto
convert_status(jsonsl_error_t error) -> std::error_code
{
  switch (error) {
    case JSONSL_ERROR_SUCCESS:
      return {};
    case JSONSL_ERROR_GARBAGE_TRAILING:
      return errc::streaming_json_lexer::garbage_trailing;
    case JSONSL_ERROR_SPECIAL_EXPECTED:
      return errc::streaming_json_lexer::special_expected;
    case JSONSL_ERROR_SPECIAL_INCOMPLETE:
      return errc::streaming_json_lexer::special_incomplete;
    case JSONSL_ERROR_STRAY_TOKEN:
      return errc::streaming_json_lexer::stray_token;
    case JSONSL_ERROR_MISSING_TOKEN:
      return errc::streaming_json_lexer::missing_token;
    case JSONSL_ERROR_CANT_INSERT:
      return errc::streaming_json_lexer::cannot_insert;
    case JSONSL_ERROR_ESCAPE_OUTSIDE_STRING:
      return errc::streaming_json_lexer::escape_outside_string;
    case JSONSL_ERROR_KEY_OUTSIDE_OBJECT:
      return errc::streaming_json_lexer::key_outside_object;
    case JSONSL_ERROR_STRING_OUTSIDE_CONTAINER:
      return errc::streaming_json_lexer::string_outside_container;
    case JSONSL_ERROR_FOUND_NULL_BYTE:
      return errc::streaming_json_lexer::found_null_byte;
    case JSONSL_ERROR_LEVELS_EXCEEDED:
      return errc::streaming_json_lexer::levels_exceeded;
    case JSONSL_ERROR_BRACKET_MISMATCH:
      return errc::streaming_json_lexer::bracket_mismatch;
    case JSONSL_ERROR_HKEY_EXPECTED:
      return errc::streaming_json_lexer::object_key_expected;
    case JSONSL_ERROR_WEIRD_WHITESPACE:
      return errc::streaming_json_lexer::weird_whitespace;
    case JSONSL_ERROR_UESCAPE_TOOSHORT:
      return errc::streaming_json_lexer::unicode_escape_is_too_short;
    case JSONSL_ERROR_ESCAPE_INVALID:
      return errc::streaming_json_lexer::escape_invalid;
    case JSONSL_ERROR_TRAILING_COMMA:
      return errc::streaming_json_lexer::trailing_comma;
    case JSONSL_ERROR_INVALID_NUMBER:
      return errc::streaming_json_lexer::invalid_number;
    case JSONSL_ERROR_VALUE_EXPECTED:
      return errc::streaming_json_lexer::value_expected;
    case JSONSL_ERROR_PERCENT_BADHEX:
      return errc::streaming_json_lexer::percent_bad_hex;
    case JSONSL_ERROR_JPR_BADPATH:
      return errc::streaming_json_lexer::json_pointer_bad_path;
    case JSONSL_ERROR_JPR_DUPSLASH:
      return errc::streaming_json_lexer::json_pointer_duplicated_slash;
    case JSONSL_ERROR_JPR_NOROOT:
      return errc::streaming_json_lexer::json_pointer_missing_root;
    case JSONSL_ERROR_ENOMEM:
      return errc::streaming_json_lexer::not_enough_memory;
    case JSONSL_ERROR_INVALID_CODEPOINT:
      return errc::streaming_json_lexer::invalid_codepoint;
    case JSONSL_ERROR_GENERIC:
      return errc::streaming_json_lexer::generic;
    default:
      break;
  }
  return errc::streaming_json_lexer::generic;
}

auto
state_of(jsonsl_t lexer) -> detail::lexer_state*
{
  return static_cast<detail::lexer_state*>(lexer->data);
}

auto
error_callback(jsonsl_t lexer,
               jsonsl_error_t error,
               struct jsonsl_state_st* /* state */,
               jsonsl_char_t* /* at */) -> int
{
  state_of(lexer)->complete(convert_status(error), {});
  return 0;
}

void
meta_header_complete_callback(jsonsl_t lexer,
                              jsonsl_action_t /* action */,
                              struct jsonsl_state_st* state,
                              const jsonsl_char_t* /* at */)
{
  auto* self = state_of(lexer);

  self->meta_buffer_.append(self->buffer_.data(), state->pos_begin);
  self->meta_header_length_ = state->pos_begin;
  lexer->action_callback_PUSH = nullptr;
  if (self->on_header_) {
    self->on_header_(std::string{ self->meta_buffer_ });
  }
}

void
trailer_pop_callback(jsonsl_t lexer,
                     jsonsl_action_t /* action */,
                     struct jsonsl_state_st* state,
                     const jsonsl_char_t* /* at */)
{
  if (state->data != STATE_MARKER_ROOT) {
    return;
  }

  auto* self = state_of(lexer);
  if (self->meta_complete_) {
    return;
  }

  self->meta_buffer_.resize(self->meta_header_length_);
  self->meta_buffer_.append(self->buffer_region(self->last_row_end_position_));
  self->meta_complete_ = true;
  self->complete({}, std::move(self->meta_buffer_));
}

void
row_pop_callback(jsonsl_t lexer,
                 jsonsl_action_t /* action */,
                 struct jsonsl_state_st* state,
                 const jsonsl_char_t* /* at */)
{
  auto* self = state_of(lexer);
  if (self->complete_) {
    return;
  }

  self->keep_position_ = lexer->pos;
  self->last_row_end_position_ = lexer->pos;

  if (state->data == STATE_MARKER_ROWSET) {
    lexer->action_callback_POP = trailer_pop_callback;
    lexer->action_callback_PUSH = nullptr;
    if (self->number_of_rows_ == 0) {
      // the whole header is buffered, the closing part is handled by trailer_pop_callback
      self->meta_buffer_.append(self->buffer_.data(), lexer->pos);
      self->meta_header_length_ = lexer->pos;
      if (self->on_header_) {
        self->on_header_(std::string{ self->meta_buffer_ });
      }
    }
    return;
  }

  self->number_of_rows_++;
  if (self->meta_complete_) {
    return;
  }

  if (self->on_row_) {
    auto row = self->buffer_region(
      state->pos_begin, lexer->pos - state->pos_begin + (state->type == JSONSL_T_SPECIAL ? 0 : 1));
    self->on_row_(std::string(row));
  }
}

void
initial_action_pop_callback(jsonsl_t lexer,
                            jsonsl_action_t action,
                            struct jsonsl_state_st* state,
                            const jsonsl_char_t* at)
{
  auto* self = state_of(lexer);
  if (self->complete_) {
    return;
  }

  if (state->type == JSONSL_T_HKEY) {
    self->last_key_ =
      self->buffer_.substr(state->pos_begin + 1 - self->min_pos_, state->pos_cur - state->pos_begin - 1);
  }

  if (state->data == STATE_MARKER_ROOT) {
    trailer_pop_callback(lexer, action, state, at);
  }
}

void
initial_action_push_callback(jsonsl_t lexer,
                             jsonsl_action_t /* action */,
                             struct jsonsl_state_st* state,
                             const jsonsl_char_t* /* at */)
{
  auto* self = state_of(lexer);
  if (self->complete_) {
    return;
  }

  jsonsl_jpr_match_t match = JSONSL_MATCH_UNKNOWN;
  if (state->type != JSONSL_T_HKEY) {
    auto key = std::move(self->last_key_);
    jsonsl_jpr_match_state(lexer, state, key.data(), key.size(), &match);
  }
  self->validate_root(state, match);
  if (state->type == JSONSL_T_LIST && match == JSONSL_MATCH_POSSIBLE) {
    // found the rows array, e.g. "results":[
    lexer->action_callback_POP = row_pop_callback;
    lexer->action_callback_PUSH = meta_header_complete_callback;
    state->data = STATE_MARKER_ROWSET;
  }
}
} // namespace

streaming_lexer::streaming_lexer(const std::string& pointer_expression, std::uint32_t depth)
{
  jsonsl_error_t error = JSONSL_ERROR_SUCCESS;
  jsonsl_jpr_t ptr = jsonsl_jpr_new(pointer_expression.c_str(), &error);
  if (ptr == nullptr) {
    throw std::invalid_argument("unable to allocate JSON pointer");
  }
  if (error != JSONSL_ERROR_SUCCESS) {
    jsonsl_jpr_destroy(ptr);
    throw std::invalid_argument(std::string("unable to create JSON pointer: ") +
                                jsonsl_strerror(error));
  }

  state_ = std::make_shared<detail::lexer_state>(jsonsl_new(512), ptr);
  state_->lexer_->data = state_.get();
  state_->lexer_->action_callback_PUSH = initial_action_push_callback;
  state_->lexer_->action_callback_POP = initial_action_pop_callback;
  state_->lexer_->error_callback = error_callback;
  jsonsl_jpr_match_state_init(state_->lexer_, &state_->pointer_, 1);
  jsonsl_enable_all_callbacks(state_->lexer_);
  state_->lexer_->max_callback_level = depth;
}

void
streaming_lexer::feed(std::string_view data)
{
  if (state_->complete_) {
    return;
  }
  state_->buffer_.append(data);
  jsonsl_feed(state_->lexer_, data.data(), data.size());

  // drop the bytes that belong to rows already emitted
  if (state_->keep_position_ > state_->min_pos_) {
    state_->buffer_.erase(0, state_->keep_position_ - state_->min_pos_);
    state_->min_pos_ = state_->keep_position_;
  }
}

void
streaming_lexer::finish()
{
  state_->complete(errc::streaming_json_lexer::truncated_input, {});
}

void
streaming_lexer::on_metadata_header(header_handler handler)
{
  state_->on_header_ = std::move(handler);
}

void
streaming_lexer::on_row(row_handler handler)
{
  state_->on_row_ = std::move(handler);
}

void
streaming_lexer::on_complete(complete_handler handler)
{
  state_->on_complete_ = std::move(handler);
}

auto
streaming_lexer::completed() const -> bool
{
  return state_->complete_;
}
} // namespace relay::core::utils::json

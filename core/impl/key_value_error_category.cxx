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

#include <relay/error_codes.hxx>

#include <string>

namespace relay::core::impl
{
struct key_value_error_category : std::error_category {
  [[nodiscard]] auto name() const noexcept -> const char* override
  {
    return "relay.key_value";
  }

  [[nodiscard]] auto message(int ev) const noexcept -> std::string override
  {
    switch (static_cast<errc::key_value>(ev)) {
      case errc::key_value::document_not_found:
        return "document_not_found (101)";
      case errc::key_value::document_exists:
        return "document_exists (102)";
      case errc::key_value::value_too_large:
        return "value_too_large (103)";
      case errc::key_value::document_not_stored:
        return "document_not_stored (104)";
      case errc::key_value::document_locked:
        return "document_locked (105)";
      case errc::key_value::invalid_arguments:
        return "invalid_arguments (106)";
      case errc::key_value::no_access:
        return "no_access (107)";
      case errc::key_value::unknown_collection:
        return "unknown_collection (108)";
    }
    return "FIXME: unknown error code (recompile with newer library): relay.key_value." +
           std::to_string(ev);
  }
};

const inline static key_value_error_category key_value_category_instance;

auto
key_value_category() noexcept -> const std::error_category&
{
  return key_value_category_instance;
}
} // namespace relay::core::impl

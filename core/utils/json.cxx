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

#include "json.hxx"

#include <tao/json.hpp>

namespace relay::core::utils::json
{
/**
 * Servers occasionally send objects with duplicated keys (node service maps are the usual
 * offenders). The default consumer rejects them, this one keeps the last value.
 */
template<typename Consumer>
struct last_key_wins : Consumer {
  using Consumer::Consumer;

  using Consumer::keys_;
  using Consumer::stack_;
  using Consumer::value;

  void member()
  {
    Consumer::stack_.back().prepare_object()[Consumer::keys_.back()] = std::move(Consumer::value);
    Consumer::keys_.pop_back();
  }
};

auto
parse(std::string_view input) -> tao::json::value
{
  return tao::json::from_string<utils::json::last_key_wins>(input);
}

auto
parse(const char* input, std::size_t size) -> tao::json::value
{
  return tao::json::from_string<utils::json::last_key_wins>(input, size);
}

auto
generate(const tao::json::value& object) -> std::string
{
  return tao::json::to_string(object);
}
} // namespace relay::core::utils::json

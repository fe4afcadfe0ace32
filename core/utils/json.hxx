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

#include <tao/json/value.hpp>

#include <cstddef>
#include <string>
#include <string_view>

namespace relay::core::utils::json
{
/**
 * @throws tao::pegtl::parse_error when the input is not valid JSON
 */
auto
parse(std::string_view input) -> tao::json::value;

auto
parse(const char* input, std::size_t size) -> tao::json::value;

auto
generate(const tao::json::value& object) -> std::string;
} // namespace relay::core::utils::json

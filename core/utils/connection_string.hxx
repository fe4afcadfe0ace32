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

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace relay::core::utils
{
struct connection_string {
  enum class bootstrap_mode {
    unspecified,
    gcccp,
    http,
  };

  enum class address_type {
    ipv4,
    ipv6,
    dns,
  };

  struct node {
    std::string address{};
    std::uint16_t port{ 0 };
    address_type type{ address_type::dns };
    bootstrap_mode mode{ bootstrap_mode::unspecified };

    auto operator==(const node& rhs) const -> bool
    {
      return address == rhs.address && port == rhs.port && type == rhs.type && mode == rhs.mode;
    }

    auto operator!=(const node& rhs) const -> bool
    {
      return !(rhs == *this);
    }
  };

  std::string scheme{ "couchbase" };
  bool tls{ false };

  /**
   * Options in the query part, decoded. The last occurrence of a key wins.
   */
  std::map<std::string, std::string> params{};

  std::vector<node> bootstrap_nodes{};

  std::optional<std::string> default_bucket_name{};
  bootstrap_mode default_mode{ bootstrap_mode::gcccp };
  std::uint16_t default_port{ 11210 };
  std::uint16_t default_http_port{ 8091 };

  std::optional<std::string> error{};
};

/**
 * Parses couchbase[s]://host[:port][=mode],...[/bucket][?key=value&...]
 *
 * Parse errors are reported in connection_string::error, the function does not throw.
 */
auto
parse_connection_string(const std::string& input) -> connection_string;
} // namespace relay::core::utils

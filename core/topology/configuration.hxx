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

#include <relay/service_type.hxx>

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace relay::core::topology
{
/**
 * Immutable cluster map. Published by the topology manager as a whole, never mutated after that.
 */
struct configuration {
  struct port_map {
    std::optional<std::uint16_t> key_value{};
    std::optional<std::uint16_t> management{};
    std::optional<std::uint16_t> analytics{};
    std::optional<std::uint16_t> search{};
    std::optional<std::uint16_t> views{};
    std::optional<std::uint16_t> query{};
    std::optional<std::uint16_t> eventing{};

    [[nodiscard]] auto port(service_type type) const -> std::optional<std::uint16_t>;
  };

  struct alternate_address {
    std::string name{};
    std::string hostname{};
    port_map services_plain{};
    port_map services_tls{};
  };

  struct node {
    bool this_node{ false };
    std::size_t index{};
    std::string hostname{};
    port_map services_plain{};
    port_map services_tls{};
    std::map<std::string, alternate_address> alt{};

    [[nodiscard]] auto port_or(const std::string& network,
                               service_type type,
                               bool is_tls,
                               std::uint16_t default_value) const -> std::uint16_t;
    [[nodiscard]] auto hostname_for(const std::string& network) const -> const std::string&;

    /**
     * @return "host:port" of the service on this node, empty if the node does not run it
     */
    [[nodiscard]] auto endpoint(const std::string& network, service_type type, bool is_tls) const
      -> std::optional<std::string>;
  };

  using vbucket_map = typename std::vector<std::vector<std::int16_t>>;

  std::optional<std::int64_t> epoch{};
  std::optional<std::int64_t> rev{};
  std::vector<node> nodes{};
  std::optional<std::string> uuid{};
  std::optional<std::string> bucket{};
  std::optional<std::uint32_t> num_replicas{};
  std::optional<vbucket_map> vbmap{};

  auto operator==(const configuration& other) const -> bool
  {
    return epoch == other.epoch && rev == other.rev;
  }

  auto operator<(const configuration& other) const -> bool
  {
    return epoch < other.epoch || (epoch == other.epoch && rev < other.rev);
  }

  auto operator>(const configuration& other) const -> bool
  {
    return other < *this;
  }

  [[nodiscard]] auto rev_str() const -> std::string;
  [[nodiscard]] auto select_network(const std::string& bootstrap_hostname) const -> std::string;

  /**
   * Endpoints of every node that advertises the service, in node order.
   */
  [[nodiscard]] auto endpoints_for(const std::string& network, service_type type, bool is_tls) const
    -> std::vector<std::string>;

  /**
   * Maps the key to its vbucket and the index of the node holding the active copy.
   */
  [[nodiscard]] auto map_key(std::string_view key) const
    -> std::pair<std::uint16_t, std::optional<std::size_t>>;
};

/**
 * Parses the JSON cluster map, replacing the "$HOST" placeholder with the host it was fetched from.
 *
 * @throws tao::json exceptions and std::exception derived errors on malformed input
 */
auto
parse_configuration(std::string_view input, const std::string& source_hostname) -> configuration;
} // namespace relay::core::topology

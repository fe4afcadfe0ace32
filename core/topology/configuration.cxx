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

#include "configuration.hxx"

#include "configuration_json.hxx"

#include "core/logger/logger.hxx"
#include "core/utils/crc32.hxx"
#include "core/utils/json.hxx"

#include <relay/fmt/service_type.hxx>

#include <fmt/core.h>
#include <gsl/narrow>

namespace relay::core::topology
{
auto
configuration::port_map::port(service_type type) const -> std::optional<std::uint16_t>
{
  switch (type) {
    case service_type::key_value:
      return key_value;
    case service_type::query:
      return query;
    case service_type::analytics:
      return analytics;
    case service_type::search:
      return search;
    case service_type::view:
      return views;
    case service_type::management:
      return management;
    case service_type::eventing:
      return eventing;
  }
  return {};
}

auto
configuration::node::hostname_for(const std::string& network) const -> const std::string&
{
  if (network == "default") {
    return hostname;
  }
  const auto& address = alt.find(network);
  if (address == alt.end()) {
    RELAY_LOG_WARNING(R"(requested network "{}" is not found, fallback to "default" host)", network);
    return hostname;
  }
  return address->second.hostname;
}

auto
configuration::node::port_or(const std::string& network,
                             service_type type,
                             bool is_tls,
                             std::uint16_t default_value) const -> std::uint16_t
{
  const port_map* ports = is_tls ? &services_tls : &services_plain;
  if (network != "default") {
    if (const auto& address = alt.find(network); address != alt.end()) {
      ports = is_tls ? &address->second.services_tls : &address->second.services_plain;
    } else {
      RELAY_LOG_WARNING(
        R"(requested network "{}" is not found, fallback to "default" port of {} service)",
        network,
        type);
    }
  }
  return ports->port(type).value_or(default_value);
}

auto
configuration::node::endpoint(const std::string& network, service_type type, bool is_tls) const
  -> std::optional<std::string>
{
  auto port = port_or(network, type, is_tls, 0);
  if (port == 0) {
    return {};
  }
  const auto& host = hostname_for(network);
  if (host.find(':') != std::string::npos) {
    return fmt::format("[{}]:{}", host, port);
  }
  return fmt::format("{}:{}", host, port);
}

auto
configuration::rev_str() const -> std::string
{
  if (epoch) {
    return fmt::format("{}:{}", epoch.value(), rev.value_or(0));
  }
  return rev ? fmt::format("{}", *rev) : "(none)";
}

auto
configuration::select_network(const std::string& bootstrap_hostname) const -> std::string
{
  for (const auto& n : nodes) {
    if (n.this_node) {
      if (n.hostname == bootstrap_hostname) {
        return "default";
      }
      for (const auto& [network, address] : n.alt) {
        if (address.hostname == bootstrap_hostname) {
          return network;
        }
      }
    }
  }
  return "default";
}

auto
configuration::endpoints_for(const std::string& network, service_type type, bool is_tls) const
  -> std::vector<std::string>
{
  std::vector<std::string> result{};
  for (const auto& n : nodes) {
    if (auto address = n.endpoint(network, type, is_tls); address) {
      result.emplace_back(std::move(address.value()));
    }
  }
  return result;
}

auto
configuration::map_key(std::string_view key) const
  -> std::pair<std::uint16_t, std::optional<std::size_t>>
{
  if (!vbmap.has_value() || vbmap->empty()) {
    return { 0, {} };
  }
  auto crc = utils::hash_crc32(key.data(), key.size());
  auto vbucket = gsl::narrow_cast<std::uint16_t>(((crc >> 16U) & 0x7fffU) % vbmap->size());
  const auto& replicas = vbmap->at(vbucket);
  if (replicas.empty() || replicas[0] < 0) {
    return { vbucket, {} };
  }
  return { vbucket, static_cast<std::size_t>(replicas[0]) };
}

auto
parse_configuration(std::string_view input, const std::string& source_hostname) -> configuration
{
  std::string text{ input };
  static const std::string placeholder{ "$HOST" };
  for (auto pos = text.find(placeholder); pos != std::string::npos;
       pos = text.find(placeholder, pos + source_hostname.size())) {
    text.replace(pos, placeholder.size(), source_hostname);
  }
  return utils::json::parse(text).as<configuration>();
}
} // namespace relay::core::topology

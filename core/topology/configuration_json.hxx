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

#include "configuration.hxx"

#include <tao/json/value.hpp>

#include <gsl/narrow>

#include <string>

namespace relay::core::topology::detail
{
template<template<typename...> class Traits>
auto
parse_ports(const tao::json::basic_value<Traits>& v, bool tls) -> configuration::port_map
{
  configuration::port_map ports{};
  ports.key_value = v.template optional<std::uint16_t>(tls ? "kvSSL" : "kv");
  ports.management = v.template optional<std::uint16_t>(tls ? "mgmtSSL" : "mgmt");
  ports.search = v.template optional<std::uint16_t>(tls ? "ftsSSL" : "fts");
  ports.analytics = v.template optional<std::uint16_t>(tls ? "cbasSSL" : "cbas");
  ports.query = v.template optional<std::uint16_t>(tls ? "n1qlSSL" : "n1ql");
  ports.views = v.template optional<std::uint16_t>(tls ? "capiSSL" : "capi");
  ports.eventing = v.template optional<std::uint16_t>(tls ? "eventingSSL" : "eventingAdminPort");
  return ports;
}

inline auto
strip_port(const std::string& address) -> std::string
{
  if (auto colon = address.rfind(':'); colon != std::string::npos && address.find(']') == std::string::npos) {
    return address.substr(0, colon);
  }
  if (auto bracket = address.rfind("]:"); bracket != std::string::npos) {
    return address.substr(0, bracket + 1);
  }
  return address;
}
} // namespace relay::core::topology::detail

namespace tao::json
{
template<>
struct traits<relay::core::topology::configuration> {
  template<template<typename...> class Traits>
  static auto as(const tao::json::basic_value<Traits>& v) -> relay::core::topology::configuration
  {
    using relay::core::topology::configuration;
    namespace detail = relay::core::topology::detail;

    configuration result;
    result.epoch = v.template optional<std::int64_t>("revEpoch");
    result.rev = v.template optional<std::int64_t>("rev");

    if (const auto* nodes_ext = v.find("nodesExt"); nodes_ext != nullptr) {
      std::size_t index = 0;
      for (const auto& j : nodes_ext->get_array()) {
        configuration::node n;
        n.index = index++;
        const auto& o = j.get_object();
        if (const auto& this_node = o.find("thisNode");
            this_node != o.end() && this_node->second.get_boolean()) {
          n.this_node = true;
        }
        if (const auto& hostname = o.find("hostname"); hostname != o.end()) {
          n.hostname = detail::strip_port(hostname->second.get_string());
        }
        const auto& services = o.at("services");
        n.services_plain = detail::parse_ports(services, false);
        n.services_tls = detail::parse_ports(services, true);
        if (const auto& alt = o.find("alternateAddresses"); alt != o.end()) {
          for (const auto& [name, entry] : alt->second.get_object()) {
            configuration::alternate_address address;
            address.name = name;
            address.hostname = entry.at("hostname").get_string();
            if (const auto* ports = entry.find("ports"); ports != nullptr) {
              address.services_plain = detail::parse_ports(*ports, false);
              address.services_tls = detail::parse_ports(*ports, true);
            }
            n.alt.emplace(name, address);
          }
        }
        result.nodes.emplace_back(std::move(n));
      }
    } else if (const auto* m = v.find("vBucketServerMap"); m != nullptr) {
      std::size_t index = 0;
      if (const auto* servers = m->find("serverList"); servers != nullptr && servers->is_array()) {
        for (const auto& j : servers->get_array()) {
          configuration::node n;
          n.index = index++;
          const auto& address = j.get_string();
          n.hostname = detail::strip_port(address);
          n.services_plain.key_value =
            gsl::narrow_cast<std::uint16_t>(std::stoul(address.substr(address.rfind(':') + 1)));
          result.nodes.emplace_back(std::move(n));
        }
      }
    }

    if (const auto* m = v.find("uuid"); m != nullptr) {
      result.uuid = m->get_string();
    }
    if (const auto* m = v.find("name"); m != nullptr) {
      result.bucket = m->get_string();
    }
    if (const auto* m = v.find("vBucketServerMap"); m != nullptr) {
      const auto& o = m->get_object();
      if (const auto f = o.find("numReplicas"); f != o.end()) {
        result.num_replicas = f->second.template as<std::uint32_t>();
      }
      if (const auto f = o.find("vBucketMap"); f != o.end()) {
        const auto& vb = f->second.get_array();
        configuration::vbucket_map vbmap;
        vbmap.resize(vb.size());
        for (std::size_t i = 0; i < vb.size(); i++) {
          const auto& p = vb[i].get_array();
          vbmap[i].resize(p.size());
          for (std::size_t n = 0; n < p.size(); n++) {
            vbmap[i][n] = p[n].template as<std::int16_t>();
          }
        }
        result.vbmap = vbmap;
      }
    }
    return result;
  }
};
} // namespace tao::json

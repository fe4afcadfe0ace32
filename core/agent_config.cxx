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

#include "agent_config.hxx"

#include "logger/logger.hxx"
#include "utils/connection_string.hxx"
#include "utils/duration_parser.hxx"

#include <relay/error_codes.hxx>

#include <fmt/core.h>
#include <fmt/ranges.h>

#include <cstdint>
#include <optional>
#include <stdexcept>

namespace relay::core
{
namespace
{
auto
option_error(const std::string& name, const std::string& value, const std::string& expected) -> error
{
  error err{ errc::common::configuration_error,
             fmt::format(R"(unable to parse "{}" parameter in connection string (value "{}" {}))",
                         name,
                         value,
                         expected) };
  err.ctx["option"] = name;
  return err;
}

auto
parse_option(bool& receiver, const std::string& name, const std::string& value) -> std::optional<error>
{
  if (value == "true" || value == "yes" || value == "on" || value == "1") {
    receiver = true;
  } else if (value == "false" || value == "no" || value == "off" || value == "0") {
    receiver = false;
  } else {
    return option_error(name, value, "cannot be interpreted as a boolean");
  }
  return {};
}

auto
parse_option(std::size_t& receiver, const std::string& name, const std::string& value) -> std::optional<error>
{
  try {
    std::size_t consumed = 0;
    auto parsed = std::stoull(value, &consumed, 10);
    if (consumed != value.size() || value.front() == '-') {
      return option_error(name, value, "is not a number");
    }
    receiver = static_cast<std::size_t>(parsed);
  } catch (const std::invalid_argument&) {
    return option_error(name, value, "is not a number");
  } catch (const std::out_of_range&) {
    return option_error(name, value, "is out of range");
  }
  return {};
}

auto
parse_option(double& receiver, const std::string& name, const std::string& value) -> std::optional<error>
{
  try {
    std::size_t consumed = 0;
    auto parsed = std::stod(value, &consumed);
    if (consumed != value.size()) {
      return option_error(name, value, "is not a number");
    }
    receiver = parsed;
  } catch (const std::invalid_argument&) {
    return option_error(name, value, "is not a number");
  } catch (const std::out_of_range&) {
    return option_error(name, value, "is out of range");
  }
  return {};
}

auto
parse_option(std::chrono::milliseconds& receiver, const std::string& name, const std::string& value)
  -> std::optional<error>
{
  try {
    receiver = std::chrono::duration_cast<std::chrono::milliseconds>(utils::parse_duration(value));
    if (receiver.count() < 0) {
      return option_error(name, value, "is negative");
    }
    return {};
  } catch (const utils::duration_parse_error&) {
    // plain numbers are milliseconds
  }
  std::size_t millis{};
  if (auto err = parse_option(millis, name, value); err) {
    return err;
  }
  receiver = std::chrono::milliseconds(millis);
  return {};
}

auto
format_address(const utils::connection_string::node& node, std::uint16_t port) -> std::string
{
  if (node.type == utils::connection_string::address_type::ipv6) {
    return fmt::format("[{}]:{}", node.address, port);
  }
  return fmt::format("{}:{}", node.address, port);
}

void
resolve_addresses(const utils::connection_string& connstr,
                  std::vector<std::string>& memd_addresses,
                  std::vector<std::string>& http_addresses)
{
  using mode = utils::connection_string::bootstrap_mode;

  for (const auto& node : connstr.bootstrap_nodes) {
    auto node_mode = node.mode;
    if (node_mode == mode::unspecified && node.port != 0) {
      if (connstr.default_mode == mode::http || node.port == connstr.default_http_port) {
        node_mode = mode::http;
      } else {
        node_mode = mode::gcccp;
      }
    }
    switch (node_mode) {
      case mode::gcccp:
        memd_addresses.emplace_back(format_address(node, node.port == 0 ? connstr.default_port : node.port));
        break;
      case mode::http:
        http_addresses.emplace_back(
          format_address(node, node.port == 0 ? connstr.default_http_port : node.port));
        break;
      case mode::unspecified:
        if (connstr.default_mode != mode::http) {
          memd_addresses.emplace_back(format_address(node, connstr.default_port));
        }
        http_addresses.emplace_back(format_address(node, connstr.default_http_port));
        break;
    }
  }
}

auto
apply_option(agent_config& config, const std::string& name, const std::string& value) -> std::optional<error>
{
  if (name == "network") {
    config.network = (value == "auto") ? std::string{} : value;
  } else if (name == "kv_connect_timeout") {
    /**
     * Time to wait while attempting to connect to the binary protocol endpoint of a node, including
     * authentication and bucket selection.
     */
    return parse_option(config.timeouts.key_value_connect_timeout, name, value);
  } else if (name == "connect_timeout") {
    return parse_option(config.timeouts.connect_timeout, name, value);
  } else if (name == "kv_timeout" || name == "key_value_timeout") {
    return parse_option(config.timeouts.key_value_timeout, name, value);
  } else if (name == "query_timeout") {
    return parse_option(config.timeouts.query_timeout, name, value);
  } else if (name == "analytics_timeout") {
    return parse_option(config.timeouts.analytics_timeout, name, value);
  } else if (name == "search_timeout") {
    return parse_option(config.timeouts.search_timeout, name, value);
  } else if (name == "view_timeout") {
    return parse_option(config.timeouts.view_timeout, name, value);
  } else if (name == "management_timeout") {
    return parse_option(config.timeouts.management_timeout, name, value);
  } else if (name == "config_poll_timeout") {
    return parse_option(config.polling.poll_timeout, name, value);
  } else if (name == "config_poll_interval") {
    return parse_option(config.polling.poll_interval, name, value);
  } else if (name == "config_poll_floor") {
    return parse_option(config.polling.poll_floor, name, value);
  } else if (name == "http_retry_delay") {
    return parse_option(config.polling.http_retry_delay, name, value);
  } else if (name == "enable_mutation_tokens") {
    return parse_option(config.connections.use_mutation_tokens, name, value);
  } else if (name == "compression") {
    return parse_option(config.connections.use_compression, name, value);
  } else if (name == "compression_min_size") {
    return parse_option(config.connections.compression_min_size, name, value);
  } else if (name == "compression_min_ratio") {
    return parse_option(config.connections.compression_min_ratio, name, value);
  } else if (name == "enable_server_durations") {
    return parse_option(config.connections.use_server_durations, name, value);
  } else if (name == "max_idle_http_connections") {
    return parse_option(config.connections.max_idle_http_connections, name, value);
  } else if (name == "max_perhost_idle_http_connections") {
    return parse_option(config.connections.max_perhost_idle_http_connections, name, value);
  } else if (name == "idle_http_connection_timeout") {
    return parse_option(config.connections.idle_http_connection_timeout, name, value);
  } else if (name == "kv_pool_size") {
    if (auto err = parse_option(config.connections.kv_pool_size, name, value); err) {
      return err;
    }
    if (config.connections.kv_pool_size == 0) {
      return option_error(name, value, "must be positive");
    }
  } else if (name == "max_queue_size") {
    return parse_option(config.connections.max_queue_size, name, value);
  } else if (name == "wait_for_config") {
    return parse_option(config.wait_for_config, name, value);
  } else if (name == "user_agent_extra") {
    config.user_agent = fmt::format("{};{}", config.user_agent, value);
  } else if (name == "log_redaction") {
    if (value == "none") {
      config.redaction = log_redaction::none;
    } else if (value == "partial") {
      config.redaction = log_redaction::partial;
    } else if (value == "full") {
      config.redaction = log_redaction::full;
    } else {
      return option_error(name, value, "is not a valid redaction level");
    }
  } else if (name == "bootstrap_on" || name == "ca_cert_path") {
    // handled by from_connection_string()
  } else {
    RELAY_LOG_WARNING(R"(unknown parameter "{}" in connection string (value "{}"))", name, value);
  }
  return {};
}
} // namespace

auto
make_tls_context(const std::string& ca_cert_path) -> tl::expected<std::shared_ptr<asio::ssl::context>, error>
{
  auto tls = std::make_shared<asio::ssl::context>(asio::ssl::context::tls_client);
  std::error_code ec{};
  tls->set_options(asio::ssl::context::default_workarounds | asio::ssl::context::no_sslv2 |
                     asio::ssl::context::no_sslv3,
                   ec);
  if (ec) {
    return tl::unexpected(error{ errc::common::configuration_error,
                                 fmt::format("unable to configure TLS context: {}", ec.message()) });
  }
  if (ca_cert_path.empty()) {
    RELAY_LOG_WARNING("TLS is enabled, but no CA certificate was configured, peer verification is disabled");
    tls->set_verify_mode(asio::ssl::verify_none, ec);
    return tls;
  }
  tls->load_verify_file(ca_cert_path, ec);
  if (ec) {
    error err{ errc::common::configuration_error,
               fmt::format(R"(unable to load CA certificate from "{}": {})", ca_cert_path, ec.message()) };
    err.ctx["option"] = "ca_cert_path";
    return tl::unexpected(std::move(err));
  }
  tls->set_verify_mode(asio::ssl::verify_peer, ec);
  return tls;
}

auto
redact_user_data(log_redaction redaction, const std::string& value) -> std::string
{
  if (redaction == log_redaction::none) {
    return value;
  }
  return fmt::format("<ud>{}</ud>", value);
}

auto
redact_system_data(log_redaction redaction, const std::string& value) -> std::string
{
  if (redaction != log_redaction::full) {
    return value;
  }
  return fmt::format("<sd>{}</sd>", value);
}

auto
timeout_config::for_service(service_type service) const -> std::chrono::milliseconds
{
  switch (service) {
    case service_type::key_value:
      return key_value_timeout;
    case service_type::query:
      return query_timeout;
    case service_type::analytics:
      return analytics_timeout;
    case service_type::search:
      return search_timeout;
    case service_type::view:
      return view_timeout;
    case service_type::management:
    case service_type::eventing:
      break;
  }
  return management_timeout;
}

auto
timeout_config::to_string() const -> std::string
{
  return fmt::format(
    R"(#<timeout_config:{} connect_timeout={}, key_value_connect_timeout={}, key_value_timeout={}, query_timeout={}, analytics_timeout={}, search_timeout={}, view_timeout={}, management_timeout={}>)",
    static_cast<const void*>(this),
    connect_timeout.count(),
    key_value_connect_timeout.count(),
    key_value_timeout.count(),
    query_timeout.count(),
    analytics_timeout.count(),
    search_timeout.count(),
    view_timeout.count(),
    management_timeout.count());
}

auto
polling_config::to_string() const -> std::string
{
  return fmt::format(
    R"(#<polling_config:{} poll_interval={}, poll_floor={}, poll_timeout={}, http_retry_delay={}>)",
    static_cast<const void*>(this),
    poll_interval.count(),
    poll_floor.count(),
    poll_timeout.count(),
    http_retry_delay.count());
}

auto
connection_config::to_string() const -> std::string
{
  return fmt::format(
    R"(#<connection_config:{} kv_pool_size={}, max_queue_size={}, max_idle_http_connections={}, max_perhost_idle_http_connections={}, idle_http_connection_timeout={}, use_compression={}, use_mutation_tokens={}, use_server_durations={}>)",
    static_cast<const void*>(this),
    kv_pool_size,
    max_queue_size,
    max_idle_http_connections,
    max_perhost_idle_http_connections,
    idle_http_connection_timeout.count(),
    use_compression,
    use_mutation_tokens,
    use_server_durations);
}

auto
agent_config::to_string() const -> std::string
{
  std::vector<std::string> memd{};
  memd.reserve(memd_addresses.size());
  for (const auto& address : memd_addresses) {
    memd.emplace_back(redact_system_data(redaction, address));
  }
  std::vector<std::string> http{};
  http.reserve(http_addresses.size());
  for (const auto& address : http_addresses) {
    http.emplace_back(redact_system_data(redaction, address));
  }
  return fmt::format(
    R"(#<agent_config:{} memd_addresses={}, http_addresses={}, use_tls={}, bucket_name="{}", network="{}", user_agent="{}", default_retry_strategy={}, wait_for_config={}, timeouts={}, polling={}, connections={}>)",
    static_cast<const void*>(this),
    memd,
    http,
    use_tls,
    redact_user_data(redaction, bucket_name),
    network,
    user_agent,
    default_retry_strategy ? default_retry_strategy->to_string() : "(none)",
    wait_for_config,
    timeouts.to_string(),
    polling.to_string(),
    connections.to_string());
}

auto
agent_config::from_connection_string(const std::string& input) -> tl::expected<agent_config, error>
{
  auto connstr = utils::parse_connection_string(input);
  if (connstr.error) {
    return tl::unexpected(error{ errc::common::configuration_error, connstr.error.value() });
  }

  agent_config config{};
  resolve_addresses(connstr, config.memd_addresses, config.http_addresses);

  if (auto it = connstr.params.find("bootstrap_on"); it != connstr.params.end()) {
    const auto& value = it->second;
    if (value == "http") {
      config.memd_addresses.clear();
      if (config.http_addresses.empty()) {
        return tl::unexpected(option_error("bootstrap_on", value, "requires HTTP hosts in connection string"));
      }
    } else if (value == "cccp") {
      config.http_addresses.clear();
      if (config.memd_addresses.empty()) {
        return tl::unexpected(option_error("bootstrap_on", value, "requires CCCP hosts in connection string"));
      }
    } else if (value != "both" && !value.empty()) {
      return tl::unexpected(option_error("bootstrap_on", value, "must be one of http, cccp or both"));
    }
  }
  if (config.memd_addresses.empty() && config.http_addresses.empty()) {
    return tl::unexpected(error{ errc::common::configuration_error, "connection string does not contain any hosts" });
  }

  if (connstr.default_bucket_name) {
    config.bucket_name = connstr.default_bucket_name.value();
  }

  for (const auto& [name, value] : connstr.params) {
    if (auto err = apply_option(config, name, value); err) {
      return tl::unexpected(std::move(err.value()));
    }
  }

  if (connstr.tls) {
    std::string ca_cert_path{};
    if (auto it = connstr.params.find("ca_cert_path"); it != connstr.params.end()) {
      ca_cert_path = it->second;
    }
    auto tls = make_tls_context(ca_cert_path);
    if (!tls) {
      return tl::unexpected(std::move(tls.error()));
    }
    config.tls_context = std::move(tls.value());
    config.use_tls = true;
  }
  return config;
}
} // namespace relay::core

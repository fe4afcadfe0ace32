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

#include "core/pending_operation.hxx"
#include "core/utils/movable_function.hxx"

#include <chrono>
#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

namespace asio
{
class io_context;
} // namespace asio

namespace relay::core
{
class dispatcher;
} // namespace relay::core

namespace relay::core::topology
{
/**
 * Largest cluster map accepted from the management service.
 */
constexpr std::size_t max_config_size{ 4 * 1024 * 1024 };

/**
 * Where cluster maps come from. The topology manager polls the sources in order of preference and
 * falls back to the next one when a source cannot deliver.
 */
class config_source
{
public:
  using fetch_handler = utils::movable_function<void(std::error_code ec, std::optional<configuration> config)>;

  config_source() = default;
  config_source(const config_source&) = delete;
  config_source(config_source&&) = delete;
  auto operator=(const config_source&) -> config_source& = delete;
  auto operator=(config_source&&) -> config_source& = delete;
  virtual ~config_source() = default;

  [[nodiscard]] virtual auto name() const -> const char* = 0;

  /**
   * Endpoints to poll: taken from the current map when there is one, otherwise the seeds.
   */
  [[nodiscard]] virtual auto endpoints(const std::shared_ptr<const configuration>& current,
                                       const std::string& network) const -> std::vector<std::string> = 0;

  /**
   * The handler is invoked exactly once, unless the returned fetch is canceled first.
   */
  virtual auto fetch(const std::string& endpoint, fetch_handler&& handler) -> std::shared_ptr<pending_operation> = 0;
};

/**
 * Fetches the map over the binary protocol (GET_CLUSTER_CONFIG).
 */
class cccp_config_source : public config_source
{
public:
  cccp_config_source(asio::io_context& io,
                     std::shared_ptr<dispatcher> dispatcher,
                     std::vector<std::string> seeds,
                     bool use_tls,
                     std::chrono::milliseconds timeout);

  [[nodiscard]] auto name() const -> const char* override;
  [[nodiscard]] auto endpoints(const std::shared_ptr<const configuration>& current,
                               const std::string& network) const -> std::vector<std::string> override;
  auto fetch(const std::string& endpoint, fetch_handler&& handler) -> std::shared_ptr<pending_operation> override;

private:
  asio::io_context& io_;
  std::shared_ptr<dispatcher> dispatcher_;
  std::vector<std::string> seeds_;
  bool use_tls_;
  std::chrono::milliseconds timeout_;
};

/**
 * Fetches the map from the management service. The bucket map is requested when a bucket is
 * configured, the cluster-wide node services otherwise.
 *
 * A node that failed to answer is skipped for retry_delay, unless every node is in that state.
 */
class http_config_source : public config_source
{
public:
  struct backoff_map {
    std::mutex mutex{};
    std::map<std::string, std::chrono::steady_clock::time_point> failed_until{};
  };

  http_config_source(asio::io_context& io,
                     std::shared_ptr<dispatcher> dispatcher,
                     std::vector<std::string> seeds,
                     bool use_tls,
                     std::string bucket_name,
                     std::chrono::milliseconds timeout,
                     std::chrono::milliseconds retry_delay);

  [[nodiscard]] auto name() const -> const char* override;
  [[nodiscard]] auto endpoints(const std::shared_ptr<const configuration>& current,
                               const std::string& network) const -> std::vector<std::string> override;
  auto fetch(const std::string& endpoint, fetch_handler&& handler) -> std::shared_ptr<pending_operation> override;

  [[nodiscard]] auto path() const -> std::string;

private:
  asio::io_context& io_;
  std::shared_ptr<dispatcher> dispatcher_;
  std::vector<std::string> seeds_;
  bool use_tls_;
  std::string bucket_name_;
  std::chrono::milliseconds timeout_;
  std::chrono::milliseconds retry_delay_;
  std::shared_ptr<backoff_map> backoff_;
};
} // namespace relay::core::topology

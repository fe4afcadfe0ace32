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

#include "core/io/streams.hxx"
#include "core/mcbp/packet.hxx"
#include "core/utils/movable_function.hxx"

#include <asio/buffer.hpp>
#include <asio/io_context.hpp>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <system_error>
#include <vector>

namespace test::utils
{
class mock_cluster;

/**
 * In-memory stream. Bytes written by the client are handed to the mock cluster, the cluster pushes
 * its answers back with push().
 */
class scripted_stream
  : public relay::core::io::stream_impl
  , public std::enable_shared_from_this<scripted_stream>
{
public:
  scripted_stream(asio::io_context& io, std::weak_ptr<mock_cluster> cluster);

  [[nodiscard]] auto local_address() const -> std::string override;
  [[nodiscard]] auto is_open() const -> bool override;
  void close(relay::core::utils::movable_function<void(std::error_code)>&& handler) override;
  void async_connect(const std::string& hostname,
                     const std::string& service,
                     relay::core::utils::movable_function<void(std::error_code)>&& handler) override;
  void async_write(std::vector<asio::const_buffer>& buffers,
                   relay::core::utils::movable_function<void(std::error_code, std::size_t)>&& handler) override;
  void async_read_some(asio::mutable_buffer buffer,
                       relay::core::utils::movable_function<void(std::error_code, std::size_t)>&& handler) override;

  void push(const std::string& data);

  /**
   * The peer closed its side: pending and later reads see end of file once the buffered bytes
   * were consumed.
   */
  void push_eof();

  [[nodiscard]] auto endpoint() const -> std::string;

private:
  std::weak_ptr<mock_cluster> cluster_;
  std::string local_address_;

  mutable std::mutex mutex_{};
  std::string endpoint_{};
  std::string inbound_{};
  bool open_{ false };
  bool eof_{ false };
  asio::mutable_buffer read_buffer_{};
  relay::core::utils::movable_function<void(std::error_code, std::size_t)> read_handler_{};
};

struct recorded_http_request {
  std::string endpoint{};
  std::string method{};
  std::string path{};
  std::map<std::string, std::string> headers{};
  std::string body{};
};

struct scripted_http_response {
  std::uint32_t status{ 200 };
  std::map<std::string, std::string> headers{};

  /**
   * More than one chunk switches to chunked transfer encoding, every chunk is pushed separately.
   */
  std::vector<std::string> chunks{};

  /**
   * The connection is closed after the chunks, without the terminating chunk.
   */
  bool truncate{ false };
};

/**
 * Cluster living in memory. Answers the connection handshake and cluster map requests itself,
 * everything else goes to the scripted responders. A responder returning nothing leaves the
 * request unanswered.
 */
class mock_cluster : public std::enable_shared_from_this<mock_cluster>
{
public:
  using kv_responder = std::function<std::optional<relay::core::mcbp::packet>(const std::string& endpoint,
                                                                             const relay::core::mcbp::packet& request)>;
  using http_responder = std::function<std::optional<scripted_http_response>(const recorded_http_request& request)>;

  [[nodiscard]] auto stream_factory() -> relay::core::io::stream_factory;

  void set_config(std::string config);
  void set_reachable(const std::string& endpoint, bool reachable);
  void on_kv(kv_responder responder);
  void on_http(http_responder responder);

  /**
   * When enabled, HELLO is answered with every feature the client asked for. Disabled by default.
   */
  void negotiate_features(bool enabled);

  /**
   * @return features listed by the most recent HELLO request
   */
  [[nodiscard]] auto hello_features() const -> std::vector<std::uint16_t>;

  /**
   * Closes every connection to the endpoint from the server side.
   */
  void drop_connections(const std::string& endpoint);

  [[nodiscard]] auto kv_requests(relay::core::protocol::client_opcode opcode) const -> std::size_t;
  [[nodiscard]] auto http_requests() const -> std::vector<recorded_http_request>;
  [[nodiscard]] auto connects() const -> std::size_t;
  [[nodiscard]] auto open_streams() const -> std::size_t;

  auto accept(const std::string& endpoint, const std::shared_ptr<scripted_stream>& stream) -> std::error_code;
  void on_data(const std::shared_ptr<scripted_stream>& stream, const std::string& data);
  void on_close(const scripted_stream* stream);

private:
  void handle_kv(const std::shared_ptr<scripted_stream>& stream, const std::string& data);
  void handle_http(const std::shared_ptr<scripted_stream>& stream, const std::string& data);

  mutable std::mutex mutex_{};
  std::string config_{};
  std::set<std::string> unreachable_{};
  kv_responder kv_responder_{};
  http_responder http_responder_{};
  std::map<relay::core::protocol::client_opcode, std::size_t> kv_counts_{};
  std::vector<recorded_http_request> http_log_{};
  std::size_t connects_{ 0 };
  bool negotiate_features_{ false };
  std::vector<std::uint16_t> hello_features_{};
  std::vector<std::weak_ptr<scripted_stream>> streams_{};
};

/**
 * Response to the request with the same opcode and opaque.
 */
auto
make_kv_response(const relay::core::mcbp::packet& request,
                 relay::core::protocol::key_value_status_code status,
                 const std::string& value = {}) -> relay::core::mcbp::packet;

struct mock_node {
  std::string hostname{};
  std::uint16_t key_value{ 11210 };
  std::uint16_t management{ 8091 };
  std::optional<std::uint16_t> query{};
  std::optional<std::uint16_t> analytics{};
  std::optional<std::uint16_t> search{};
  std::optional<std::uint16_t> views{};
};

/**
 * Bucket map in the format served by the cluster. vbucket i is owned by node i % nodes.size().
 */
auto
make_cluster_config(std::int64_t rev,
                    const std::vector<mock_node>& nodes,
                    const std::string& bucket_name = "default",
                    std::size_t number_of_vbuckets = 8) -> std::string;
} // namespace test::utils

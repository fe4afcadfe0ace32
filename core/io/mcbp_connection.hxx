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

#include "streams.hxx"

#include "core/mcbp/codec.hxx"
#include "core/utils/movable_function.hxx"

#include <relay/authenticator.hxx>

#include <asio/io_context.hpp>
#include <asio/steady_timer.hpp>

#include <array>
#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <system_error>
#include <vector>

namespace relay::core::io
{
struct mcbp_connection_options {
  std::string hostname{};
  std::string port{};
  std::string bucket{};
  std::string user_agent{};
  std::shared_ptr<relay::authenticator> authenticator{};
  std::chrono::milliseconds connect_timeout{ std::chrono::seconds{ 7 } };
  bool enable_compression{ true };
  std::size_t compression_min_size{ 32 };
  double compression_min_ratio{ 0.83 };
  bool enable_mutation_tokens{ true };
  bool enable_server_durations{ true };
};

/**
 * Connection to the binary port of one storage node. Requests are pipelined: every request gets
 * its own opaque, and responses are matched to their handlers by it, in any order.
 */
class mcbp_connection : public std::enable_shared_from_this<mcbp_connection>
{
public:
  using connect_handler = utils::movable_function<void(std::error_code)>;
  using response_handler = utils::movable_function<void(std::error_code, mcbp::packet)>;

  mcbp_connection(asio::io_context& io, std::shared_ptr<stream_impl> stream, mcbp_connection_options options);
  mcbp_connection(const mcbp_connection&) = delete;
  mcbp_connection(mcbp_connection&&) = delete;
  auto operator=(const mcbp_connection&) -> mcbp_connection& = delete;
  auto operator=(mcbp_connection&&) -> mcbp_connection& = delete;
  ~mcbp_connection();

  /**
   * Connects, negotiates features, authenticates with credentials obtained from the authenticator
   * and selects the bucket.
   */
  void connect(connect_handler&& handler);

  /**
   * Queues the request for writing. The handler is invoked once, with the response carrying the
   * same opaque or with the error that broke the connection.
   *
   * @return the opaque assigned to the request, for cancel()
   */
  auto send(mcbp::packet request, response_handler&& handler) -> std::uint32_t;

  /**
   * Forgets the handler of one request, a response arriving later is ignored. Other requests on
   * the connection are not affected.
   */
  void cancel(std::uint32_t opaque);

  /**
   * Aborts every request in flight (their handlers receive request_canceled) and closes the stream.
   */
  void close();

  /**
   * @return true when the connection finished its handshake, is open and did not fail before
   */
  [[nodiscard]] auto is_usable() const -> bool;

  [[nodiscard]] auto endpoint() const -> std::string;
  [[nodiscard]] auto local_address() const -> std::string;
  [[nodiscard]] auto id() const -> const std::string&;
  [[nodiscard]] auto supports_compression() const -> bool;

private:
  void hello();
  void authenticate();
  void select_bucket();
  void finish_connect(std::error_code ec);

  void do_write();
  void do_read();
  void on_data(std::size_t bytes_transferred);
  void complete(mcbp::packet response);
  void fail(std::error_code ec);

  asio::io_context& io_;
  std::shared_ptr<stream_impl> stream_;
  mcbp_connection_options options_;
  std::string log_prefix_;
  mcbp::codec codec_{};
  asio::steady_timer connect_deadline_;

  std::atomic_bool closed_{ false };
  std::atomic_bool broken_{ false };
  std::atomic_bool snappy_{ false };
  std::atomic_bool reading_{ false };
  std::atomic_uint32_t opaque_{ 0 };

  mutable std::mutex mutex_{};
  connect_handler connect_handler_{};
  std::map<std::uint32_t, response_handler> handlers_{};

  std::mutex output_buffer_mutex_{};
  std::mutex writing_buffer_mutex_{};
  std::vector<std::vector<std::byte>> output_buffer_{};
  std::vector<std::vector<std::byte>> writing_buffer_{};
  std::array<std::byte, 16384> read_chunk_{};
  std::vector<std::byte> input_{};
};
} // namespace relay::core::io

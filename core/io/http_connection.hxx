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

#include "http_message.hxx"
#include "http_streaming_parser.hxx"
#include "streams.hxx"

#include "core/utils/movable_function.hxx"

#include <asio/io_context.hpp>
#include <asio/steady_timer.hpp>

#include <array>
#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <system_error>

namespace relay::core::io
{
struct http_connection_options {
  std::string hostname{};
  std::string port{};
  std::string user_agent{};
  std::chrono::milliseconds connect_timeout{ std::chrono::seconds{ 10 } };
};

/**
 * HTTP/1.1 keep-alive connection to one node. Carries one request at a time.
 */
class http_connection : public std::enable_shared_from_this<http_connection>
{
public:
  using connect_handler = utils::movable_function<void(std::error_code)>;
  using headers_handler = utils::movable_function<void(std::error_code, http_response)>;

  http_connection(asio::io_context& io, std::shared_ptr<stream_impl> stream, http_connection_options options);
  http_connection(const http_connection&) = delete;
  http_connection(http_connection&&) = delete;
  auto operator=(const http_connection&) -> http_connection& = delete;
  auto operator=(http_connection&&) -> http_connection& = delete;
  ~http_connection();

  void connect(connect_handler&& handler);

  /**
   * Writes the request and invokes the handler once the status line and headers were received.
   * The body is pulled afterwards with read_body().
   *
   * @param authorization value of the Authorization header, omitted when empty
   */
  void send(const http_request& request, const std::string& authorization, headers_handler&& handler);

  void read_body(http_body_reader::chunk_handler&& handler);

  void close();

  /**
   * @return true when the connection is open and the previous response was read completely
   */
  [[nodiscard]] auto is_usable() const -> bool;

  [[nodiscard]] auto endpoint() const -> std::string;
  [[nodiscard]] auto local_address() const -> std::string;
  [[nodiscard]] auto id() const -> const std::string&;

private:
  void finish_connect(std::error_code ec);
  void do_read();
  void on_data(std::size_t bytes_transferred);
  void on_eof();
  void deliver();
  void fail(std::error_code ec);

  asio::io_context& io_;
  std::shared_ptr<stream_impl> stream_;
  http_connection_options options_;
  std::string log_prefix_;
  asio::steady_timer connect_deadline_;

  std::atomic_bool closed_{ false };
  std::atomic_bool broken_{ false };
  std::atomic_bool busy_{ false };
  std::atomic_bool must_close_{ false };

  mutable std::mutex mutex_{};
  connect_handler connect_handler_{};
  headers_handler headers_handler_{};
  http_body_reader::chunk_handler chunk_handler_{};
  http_streaming_parser parser_{};

  std::string write_buffer_{};
  std::array<char, 16384> read_chunk_{};
};
} // namespace relay::core::io

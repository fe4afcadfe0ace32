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

#include "core/utils/movable_function.hxx"

#include <asio/buffer.hpp>
#include <asio/io_context.hpp>
#include <asio/ip/tcp.hpp>
#include <asio/ssl/context.hpp>
#include <asio/ssl/stream.hpp>
#include <asio/strand.hpp>

#include <functional>
#include <memory>
#include <string>
#include <system_error>
#include <vector>

namespace relay::core::io
{
/**
 * Byte stream to one node. Every handler runs on the strand of the stream.
 */
class stream_impl
{
protected:
  asio::strand<asio::io_context::executor_type> strand_;
  bool tls_;
  std::string id_{};

public:
  stream_impl(asio::io_context& ctx, bool is_tls);
  stream_impl(const stream_impl&) = delete;
  stream_impl(stream_impl&&) = delete;
  auto operator=(const stream_impl&) -> stream_impl& = delete;
  auto operator=(stream_impl&&) -> stream_impl& = delete;
  virtual ~stream_impl() = default;

  [[nodiscard]] auto log_prefix() const -> std::string_view;

  [[nodiscard]] auto id() const -> const std::string&;

  [[nodiscard]] auto get_executor() const noexcept
  {
    return strand_;
  }

  /**
   * @return "host:port" of the local side, empty when not connected
   */
  [[nodiscard]] virtual auto local_address() const -> std::string = 0;

  [[nodiscard]] virtual auto is_open() const -> bool = 0;

  virtual void close(utils::movable_function<void(std::error_code)>&& handler) = 0;

  /**
   * Resolves the host and connects to the first endpoint that accepts (and completes the TLS
   * handshake when the stream is encrypted).
   */
  virtual void async_connect(const std::string& hostname,
                             const std::string& service,
                             utils::movable_function<void(std::error_code)>&& handler) = 0;

  virtual void async_write(std::vector<asio::const_buffer>& buffers,
                           utils::movable_function<void(std::error_code, std::size_t)>&& handler) = 0;

  virtual void async_read_some(asio::mutable_buffer buffer,
                               utils::movable_function<void(std::error_code, std::size_t)>&& handler) = 0;
};

class plain_stream_impl : public stream_impl
{
private:
  asio::ip::tcp::resolver resolver_;
  std::shared_ptr<asio::ip::tcp::socket> stream_;

public:
  explicit plain_stream_impl(asio::io_context& ctx);

  [[nodiscard]] auto local_address() const -> std::string override;

  [[nodiscard]] auto is_open() const -> bool override;

  void close(utils::movable_function<void(std::error_code)>&& handler) override;

  void async_connect(const std::string& hostname,
                     const std::string& service,
                     utils::movable_function<void(std::error_code)>&& handler) override;

  void async_write(std::vector<asio::const_buffer>& buffers,
                   utils::movable_function<void(std::error_code, std::size_t)>&& handler) override;

  void async_read_some(asio::mutable_buffer buffer,
                       utils::movable_function<void(std::error_code, std::size_t)>&& handler) override;
};

class tls_stream_impl : public stream_impl
{
private:
  std::shared_ptr<asio::ssl::context> tls_context_;
  asio::ip::tcp::resolver resolver_;
  std::shared_ptr<asio::ssl::stream<asio::ip::tcp::socket>> stream_;

public:
  tls_stream_impl(asio::io_context& ctx, std::shared_ptr<asio::ssl::context> tls);

  [[nodiscard]] auto local_address() const -> std::string override;

  [[nodiscard]] auto is_open() const -> bool override;

  void close(utils::movable_function<void(std::error_code)>&& handler) override;

  void async_connect(const std::string& hostname,
                     const std::string& service,
                     utils::movable_function<void(std::error_code)>&& handler) override;

  void async_write(std::vector<asio::const_buffer>& buffers,
                   utils::movable_function<void(std::error_code, std::size_t)>&& handler) override;

  void async_read_some(asio::mutable_buffer buffer,
                       utils::movable_function<void(std::error_code, std::size_t)>&& handler) override;
};

/**
 * Creates the stream for a new connection. Replaced in tests by scripted in-memory streams.
 */
using stream_factory = std::function<std::shared_ptr<stream_impl>(asio::io_context&)>;

/**
 * @param tls when set, streams are encrypted with this context
 */
auto
make_stream_factory(std::shared_ptr<asio::ssl::context> tls) -> stream_factory;
} // namespace relay::core::io

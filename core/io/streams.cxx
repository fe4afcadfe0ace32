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

#include "streams.hxx"

#include <asio/connect.hpp>
#include <asio/error.hpp>
#include <asio/post.hpp>
#include <asio/write.hpp>
#include <fmt/core.h>
#include <openssl/ssl.h>

#include <atomic>

namespace relay::core::io
{
namespace
{
auto
next_stream_id() -> std::string
{
  static std::atomic_uint64_t counter{ 0 };
  return fmt::format("{:016x}", ++counter);
}

auto
format_endpoint(const asio::ip::tcp::endpoint& endpoint) -> std::string
{
  if (endpoint.address().is_v6()) {
    return fmt::format("[{}]:{}", endpoint.address().to_string(), endpoint.port());
  }
  return fmt::format("{}:{}", endpoint.address().to_string(), endpoint.port());
}
} // namespace

stream_impl::stream_impl(asio::io_context& ctx, bool is_tls)
  : strand_(asio::make_strand(ctx))
  , tls_(is_tls)
  , id_(next_stream_id())
{
}

auto
stream_impl::log_prefix() const -> std::string_view
{
  return tls_ ? "tls" : "plain";
}

auto
stream_impl::id() const -> const std::string&
{
  return id_;
}

plain_stream_impl::plain_stream_impl(asio::io_context& ctx)
  : stream_impl(ctx, false)
  , resolver_(strand_)
  , stream_(std::make_shared<asio::ip::tcp::socket>(strand_))
{
}

auto
plain_stream_impl::local_address() const -> std::string
{
  if (!stream_) {
    return {};
  }
  std::error_code ec;
  auto res = stream_->local_endpoint(ec);
  if (ec) {
    return {};
  }
  return format_endpoint(res);
}

auto
plain_stream_impl::is_open() const -> bool
{
  if (stream_) {
    return stream_->is_open();
  }
  return false;
}

void
plain_stream_impl::close(utils::movable_function<void(std::error_code)>&& handler)
{
  resolver_.cancel();
  if (!stream_) {
    return handler(asio::error::bad_descriptor);
  }
  return asio::post(strand_, [stream = std::move(stream_), handler = std::move(handler)]() {
    asio::error_code ec{};
    stream->shutdown(asio::socket_base::shutdown_both, ec);
    stream->close(ec);
    handler(ec);
  });
}

void
plain_stream_impl::async_connect(const std::string& hostname,
                                 const std::string& service,
                                 utils::movable_function<void(std::error_code)>&& handler)
{
  if (!stream_) {
    id_ = next_stream_id();
    stream_ = std::make_shared<asio::ip::tcp::socket>(strand_);
  }
  resolver_.async_resolve(
    hostname,
    service,
    [stream = stream_, handler = std::move(handler)](
      std::error_code ec_resolve, const asio::ip::tcp::resolver::results_type& endpoints) mutable {
      if (ec_resolve) {
        return handler(ec_resolve);
      }
      asio::async_connect(
        *stream,
        endpoints,
        [stream, handler = std::move(handler)](std::error_code ec_connect, const auto& /* endpoint */) mutable {
          if (!ec_connect) {
            std::error_code ignored{};
            stream->set_option(asio::ip::tcp::no_delay{ true }, ignored);
            stream->set_option(asio::socket_base::keep_alive{ true }, ignored);
          }
          handler(ec_connect);
        });
    });
}

void
plain_stream_impl::async_write(std::vector<asio::const_buffer>& buffers,
                               utils::movable_function<void(std::error_code, std::size_t)>&& handler)
{
  if (!is_open()) {
    return handler(asio::error::bad_descriptor, {});
  }
  return asio::async_write(
    *stream_,
    buffers,
    [stream = stream_, handler = std::move(handler)](auto ec, auto bytes_transferred) {
      return handler(ec, bytes_transferred);
    });
}

void
plain_stream_impl::async_read_some(asio::mutable_buffer buffer,
                                   utils::movable_function<void(std::error_code, std::size_t)>&& handler)
{
  if (!is_open()) {
    return handler(asio::error::bad_descriptor, {});
  }
  return stream_->async_read_some(
    buffer, [stream = stream_, handler = std::move(handler)](auto ec, auto bytes_transferred) {
      return handler(ec, bytes_transferred);
    });
}

tls_stream_impl::tls_stream_impl(asio::io_context& ctx, std::shared_ptr<asio::ssl::context> tls)
  : stream_impl(ctx, true)
  , tls_context_(std::move(tls))
  , resolver_(strand_)
  , stream_(std::make_shared<asio::ssl::stream<asio::ip::tcp::socket>>(asio::ip::tcp::socket(strand_),
                                                                         *tls_context_))
{
}

auto
tls_stream_impl::local_address() const -> std::string
{
  if (!stream_) {
    return {};
  }
  std::error_code ec;
  auto res = stream_->lowest_layer().local_endpoint(ec);
  if (ec) {
    return {};
  }
  return format_endpoint(res);
}

auto
tls_stream_impl::is_open() const -> bool
{
  if (stream_) {
    return stream_->lowest_layer().is_open();
  }
  return false;
}

void
tls_stream_impl::close(utils::movable_function<void(std::error_code)>&& handler)
{
  resolver_.cancel();
  if (!stream_) {
    return handler(asio::error::bad_descriptor);
  }
  return asio::post(strand_, [stream = std::move(stream_), handler = std::move(handler)]() {
    asio::error_code ec{};
    stream->lowest_layer().shutdown(asio::socket_base::shutdown_both, ec);
    stream->lowest_layer().close(ec);
    handler(ec);
  });
}

void
tls_stream_impl::async_connect(const std::string& hostname,
                               const std::string& service,
                               utils::movable_function<void(std::error_code)>&& handler)
{
  if (!stream_) {
    id_ = next_stream_id();
    stream_ = std::make_shared<asio::ssl::stream<asio::ip::tcp::socket>>(asio::ip::tcp::socket(strand_),
                                                                           *tls_context_);
  }
  // SNI
  SSL_set_tlsext_host_name(stream_->native_handle(), hostname.c_str());
  resolver_.async_resolve(
    hostname,
    service,
    [stream = stream_, handler = std::move(handler)](
      std::error_code ec_resolve, const asio::ip::tcp::resolver::results_type& endpoints) mutable {
      if (ec_resolve) {
        return handler(ec_resolve);
      }
      asio::async_connect(
        stream->lowest_layer(),
        endpoints,
        [stream, handler = std::move(handler)](std::error_code ec_connect, const auto& /* endpoint */) mutable {
          if (ec_connect) {
            return handler(ec_connect);
          }
          std::error_code ignored{};
          stream->lowest_layer().set_option(asio::ip::tcp::no_delay{ true }, ignored);
          stream->lowest_layer().set_option(asio::socket_base::keep_alive{ true }, ignored);
          stream->async_handshake(asio::ssl::stream_base::client,
                                  [stream, handler = std::move(handler)](std::error_code ec_handshake) mutable {
                                    return handler(ec_handshake);
                                  });
        });
    });
}

void
tls_stream_impl::async_write(std::vector<asio::const_buffer>& buffers,
                             utils::movable_function<void(std::error_code, std::size_t)>&& handler)
{
  if (!is_open()) {
    return handler(asio::error::bad_descriptor, {});
  }
  return asio::async_write(
    *stream_,
    buffers,
    [stream = stream_, handler = std::move(handler)](auto ec, auto bytes_transferred) {
      return handler(ec, bytes_transferred);
    });
}

void
tls_stream_impl::async_read_some(asio::mutable_buffer buffer,
                                 utils::movable_function<void(std::error_code, std::size_t)>&& handler)
{
  if (!is_open()) {
    return handler(asio::error::bad_descriptor, {});
  }
  return stream_->async_read_some(
    buffer, [stream = stream_, handler = std::move(handler)](auto ec, auto bytes_transferred) {
      return handler(ec, bytes_transferred);
    });
}

auto
make_stream_factory(std::shared_ptr<asio::ssl::context> tls) -> stream_factory
{
  if (tls) {
    return [tls](asio::io_context& ctx) -> std::shared_ptr<stream_impl> {
      return std::make_shared<tls_stream_impl>(ctx, tls);
    };
  }
  return [](asio::io_context& ctx) -> std::shared_ptr<stream_impl> {
    return std::make_shared<plain_stream_impl>(ctx);
  };
}
} // namespace relay::core::io

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

#include "http_connection.hxx"

#include "core/logger/logger.hxx"

#include <relay/error_codes.hxx>

#include <asio/buffer.hpp>
#include <asio/error.hpp>
#include <asio/post.hpp>
#include <fmt/core.h>

#include <utility>
#include <vector>

namespace relay::core::io
{
http_connection::http_connection(asio::io_context& io,
                                 std::shared_ptr<stream_impl> stream,
                                 http_connection_options options)
  : io_{ io }
  , stream_{ std::move(stream) }
  , options_{ std::move(options) }
  , log_prefix_{ fmt::format("[http/{}/{}] <{}:{}>",
                             stream_->log_prefix(),
                             stream_->id(),
                             options_.hostname,
                             options_.port) }
  , connect_deadline_{ io_ }
{
}

http_connection::~http_connection()
{
  if (!closed_) {
    close();
  }
}

void
http_connection::connect(connect_handler&& handler)
{
  {
    const std::scoped_lock lock(mutex_);
    connect_handler_ = std::move(handler);
  }
  connect_deadline_.expires_after(options_.connect_timeout);
  connect_deadline_.async_wait([self = shared_from_this()](std::error_code ec) {
    if (ec == asio::error::operation_aborted) {
      return;
    }
    RELAY_LOG_DEBUG("{} unable to connect in time, closing", self->log_prefix_);
    self->finish_connect(errc::common::timeout);
  });
  stream_->async_connect(options_.hostname, options_.port, [self = shared_from_this()](std::error_code ec) {
    if (ec) {
      RELAY_LOG_DEBUG("{} unable to connect: {}", self->log_prefix_, ec.message());
      return self->finish_connect(errc::common::transport_failure);
    }
    self->finish_connect({});
  });
}

void
http_connection::finish_connect(std::error_code ec)
{
  connect_handler handler{};
  {
    const std::scoped_lock lock(mutex_);
    handler = std::move(connect_handler_);
  }
  if (!handler) {
    return;
  }
  connect_deadline_.cancel();
  if (ec) {
    broken_ = true;
    close();
  } else {
    RELAY_LOG_DEBUG("{} connected, local_address={}", log_prefix_, local_address());
  }
  handler(ec);
}

void
http_connection::send(const http_request& request, const std::string& authorization, headers_handler&& handler)
{
  if (closed_ || broken_ || busy_) {
    return asio::post(io_, [handler = std::move(handler)]() mutable {
      handler(errc::common::transport_failure, {});
    });
  }
  busy_ = true;
  {
    const std::scoped_lock lock(mutex_);
    parser_.reset();
    headers_handler_ = std::move(handler);
  }

  write_buffer_ = fmt::format("{} {} HTTP/1.1\r\nHost: {}:{}\r\n", request.method, request.path, options_.hostname, options_.port);
  if (!options_.user_agent.empty()) {
    write_buffer_.append(fmt::format("User-Agent: {}\r\n", options_.user_agent));
  }
  if (!authorization.empty()) {
    write_buffer_.append(fmt::format("Authorization: {}\r\n", authorization));
  }
  for (const auto& [name, value] : request.headers) {
    write_buffer_.append(fmt::format("{}: {}\r\n", name, value));
  }
  write_buffer_.append(fmt::format("Connection: keep-alive\r\nContent-Length: {}\r\n\r\n", request.body.size()));
  write_buffer_.append(request.body);

  RELAY_LOG_TRACE("{} {} {}, body_size={}", log_prefix_, request.method, request.path, request.body.size());
  std::vector<asio::const_buffer> buffers{ asio::buffer(write_buffer_) };
  stream_->async_write(buffers, [self = shared_from_this()](std::error_code ec, std::size_t /* bytes_transferred */) {
    if (ec) {
      if (ec != asio::error::operation_aborted) {
        RELAY_LOG_DEBUG(R"({} IO error while writing to the socket("{}"): {})", self->log_prefix_, self->id(), ec.message());
      }
      return self->fail(errc::common::transport_failure);
    }
    self->do_read();
  });
}

void
http_connection::read_body(http_body_reader::chunk_handler&& handler)
{
  {
    const std::scoped_lock lock(mutex_);
    chunk_handler_ = std::move(handler);
  }
  if (closed_ || broken_) {
    return fail(errc::common::transport_failure);
  }
  asio::post(stream_->get_executor(), [self = shared_from_this()]() {
    self->deliver();
  });
}

void
http_connection::do_read()
{
  stream_->async_read_some(asio::buffer(read_chunk_),
                           [self = shared_from_this()](std::error_code ec, std::size_t bytes_transferred) {
                             if (ec == asio::error::eof) {
                               return self->on_eof();
                             }
                             if (ec) {
                               if (ec != asio::error::operation_aborted) {
                                 RELAY_LOG_DEBUG(R"({} IO error while reading from the socket("{}"): {})",
                                                 self->log_prefix_,
                                                 self->id(),
                                                 ec.message());
                               }
                               return self->fail(errc::common::transport_failure);
                             }
                             self->on_data(bytes_transferred);
                           });
}

void
http_connection::on_data(std::size_t bytes_transferred)
{
  http_streaming_parser::feeding_result result{};
  {
    const std::scoped_lock lock(mutex_);
    result = parser_.feed(read_chunk_.data(), bytes_transferred);
  }
  if (result.failure) {
    RELAY_LOG_WARNING("{} unable to parse response: {}", log_prefix_, result.error);
    return fail(errc::common::protocol_failure);
  }
  deliver();
}

void
http_connection::on_eof()
{
  must_close_ = true;
  http_streaming_parser::feeding_result result{};
  {
    const std::scoped_lock lock(mutex_);
    result = parser_.finish();
  }
  if (result.failure || !result.complete) {
    RELAY_LOG_DEBUG("{} connection closed by peer before the response was complete", log_prefix_);
    return fail(errc::common::transport_failure);
  }
  deliver();
}

void
http_connection::deliver()
{
  std::unique_lock lock(mutex_);
  if (headers_handler_) {
    if (!parser_.headers_complete) {
      lock.unlock();
      return do_read();
    }
    http_response response{};
    response.status_code = parser_.status_code;
    response.status_message = parser_.status_message;
    response.headers = parser_.headers;
    response.endpoint = endpoint();
    if (response.must_close_connection() || !parser_.keep_alive) {
      must_close_ = true;
    }
    auto handler = std::move(headers_handler_);
    lock.unlock();
    return handler({}, std::move(response));
  }
  if (chunk_handler_) {
    if (parser_.body_chunk.empty() && !parser_.complete) {
      lock.unlock();
      return do_read();
    }
    auto chunk = std::move(parser_.body_chunk);
    parser_.body_chunk.clear();
    bool complete = parser_.complete;
    auto handler = std::move(chunk_handler_);
    if (complete) {
      busy_ = false;
    }
    lock.unlock();
    return handler({}, std::move(chunk), complete);
  }
}

void
http_connection::fail(std::error_code ec)
{
  broken_ = true;
  headers_handler headers{};
  http_body_reader::chunk_handler chunk{};
  {
    const std::scoped_lock lock(mutex_);
    headers = std::move(headers_handler_);
    chunk = std::move(chunk_handler_);
  }
  if (headers) {
    headers(ec, {});
  }
  if (chunk) {
    chunk(ec, {}, false);
  }
  close();
}

void
http_connection::close()
{
  if (closed_.exchange(true)) {
    return;
  }
  broken_ = true;
  connect_deadline_.cancel();
  RELAY_LOG_DEBUG("{} closing", log_prefix_);
  stream_->close([](std::error_code /* ec */) {});
  fail(errc::common::request_canceled);
  finish_connect(errc::common::request_canceled);
}

auto
http_connection::is_usable() const -> bool
{
  return !closed_ && !broken_ && !busy_ && !must_close_ && stream_->is_open();
}

auto
http_connection::endpoint() const -> std::string
{
  return fmt::format("{}:{}", options_.hostname, options_.port);
}

auto
http_connection::local_address() const -> std::string
{
  return stream_->local_address();
}

auto
http_connection::id() const -> const std::string&
{
  return stream_->id();
}
} // namespace relay::core::io

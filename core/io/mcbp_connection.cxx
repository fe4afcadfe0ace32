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

#include "mcbp_connection.hxx"

#include "core/logger/logger.hxx"
#include "core/mcbp/big_endian.hxx"

#include <relay/error_codes.hxx>

#include <asio/buffer.hpp>
#include <asio/error.hpp>
#include <asio/post.hpp>
#include <fmt/core.h>

#include <utility>

namespace relay::core::io
{
namespace
{
constexpr std::uint16_t feature_tcp_nodelay{ 0x03 };
constexpr std::uint16_t feature_mutation_seqno{ 0x04 };
constexpr std::uint16_t feature_xerror{ 0x07 };
constexpr std::uint16_t feature_select_bucket{ 0x08 };
constexpr std::uint16_t feature_snappy{ 0x0a };
constexpr std::uint16_t feature_json{ 0x0b };
constexpr std::uint16_t feature_tracing{ 0x0f };

auto
status_to_bootstrap_error(const mcbp::packet& response) -> std::error_code
{
  switch (response.status_code_) {
    case protocol::key_value_status_code::success:
      return {};
    case protocol::key_value_status_code::auth_error:
    case protocol::key_value_status_code::auth_stale:
    case protocol::key_value_status_code::no_access:
      return errc::common::authentication_failure;
    case protocol::key_value_status_code::not_found:
    case protocol::key_value_status_code::no_bucket:
      return errc::network::bucket_closed;
    case protocol::key_value_status_code::busy:
    case protocol::key_value_status_code::temporary_failure:
      return errc::common::temporary_failure;
    default:
      break;
  }
  return errc::network::handshake_failure;
}
} // namespace

mcbp_connection::mcbp_connection(asio::io_context& io,
                                 std::shared_ptr<stream_impl> stream,
                                 mcbp_connection_options options)
  : io_{ io }
  , stream_{ std::move(stream) }
  , options_{ std::move(options) }
  , log_prefix_{ fmt::format("[kv/{}/{}] <{}:{}>",
                             stream_->log_prefix(),
                             stream_->id(),
                             options_.hostname,
                             options_.port) }
  , connect_deadline_{ io_ }
{
}

mcbp_connection::~mcbp_connection()
{
  if (!closed_) {
    close();
  }
}

void
mcbp_connection::connect(connect_handler&& handler)
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
  RELAY_LOG_DEBUG("{} connecting", log_prefix_);
  stream_->async_connect(options_.hostname, options_.port, [self = shared_from_this()](std::error_code ec) {
    if (ec) {
      RELAY_LOG_DEBUG("{} unable to connect: {}", self->log_prefix_, ec.message());
      return self->finish_connect(errc::common::transport_failure);
    }
    self->hello();
  });
}

void
mcbp_connection::hello()
{
  mcbp::packet request{};
  request.command_ = protocol::client_opcode::hello;
  request.key_ = mcbp::to_bytes(options_.user_agent);
  for (auto feature : { feature_tcp_nodelay, feature_xerror, feature_select_bucket, feature_json }) {
    mcbp::big_endian::append_uint16(request.value_, feature);
  }
  if (options_.enable_compression) {
    mcbp::big_endian::append_uint16(request.value_, feature_snappy);
  }
  if (options_.enable_mutation_tokens) {
    mcbp::big_endian::append_uint16(request.value_, feature_mutation_seqno);
  }
  if (options_.enable_server_durations) {
    mcbp::big_endian::append_uint16(request.value_, feature_tracing);
  }
  send(std::move(request), [self = shared_from_this()](std::error_code ec, mcbp::packet response) {
    if (!ec) {
      ec = status_to_bootstrap_error(response);
    }
    if (ec) {
      RELAY_LOG_DEBUG("{} HELLO failed: {}", self->log_prefix_, ec.message());
      return self->finish_connect(ec);
    }
    for (std::size_t offset = 0; offset + 2 <= response.value_.size(); offset += 2) {
      if (mcbp::big_endian::read_uint16(response.value_, offset) == feature_snappy) {
        self->snappy_ = true;
      }
    }
    self->authenticate();
  });
}

void
mcbp_connection::authenticate()
{
  user_pass credentials{};
  if (options_.authenticator) {
    credentials = options_.authenticator->credentials(
      { service_type::key_value, fmt::format("{}:{}", options_.hostname, options_.port) });
  }
  if (credentials.username.empty()) {
    RELAY_LOG_DEBUG("{} skip SASL authentication, no credentials supplied", log_prefix_);
    return select_bucket();
  }

  mcbp::packet request{};
  request.command_ = protocol::client_opcode::sasl_auth;
  request.key_ = mcbp::to_bytes("PLAIN");
  std::string payload;
  payload.reserve(credentials.username.size() + credentials.password.size() + 2);
  payload.push_back('\0');
  payload.append(credentials.username);
  payload.push_back('\0');
  payload.append(credentials.password);
  request.value_ = mcbp::to_bytes(payload);
  send(std::move(request), [self = shared_from_this()](std::error_code ec, mcbp::packet response) {
    if (!ec) {
      ec = status_to_bootstrap_error(response);
    }
    if (ec) {
      RELAY_LOG_WARNING("{} SASL authentication failed: {}", self->log_prefix_, ec.message());
      return self->finish_connect(ec);
    }
    self->select_bucket();
  });
}

void
mcbp_connection::select_bucket()
{
  if (options_.bucket.empty()) {
    return finish_connect({});
  }
  mcbp::packet request{};
  request.command_ = protocol::client_opcode::select_bucket;
  request.key_ = mcbp::to_bytes(options_.bucket);
  send(std::move(request), [self = shared_from_this()](std::error_code ec, mcbp::packet response) {
    if (!ec) {
      ec = status_to_bootstrap_error(response);
    }
    if (ec) {
      RELAY_LOG_WARNING(R"({} unable to select bucket "{}": {})", self->log_prefix_, self->options_.bucket, ec.message());
      return self->finish_connect(ec);
    }
    RELAY_LOG_DEBUG("{} selected bucket: {}", self->log_prefix_, self->options_.bucket);
    self->finish_connect({});
  });
}

void
mcbp_connection::finish_connect(std::error_code ec)
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
    if (snappy_) {
      codec_ = mcbp::codec{ true,
                            mcbp::compression_options{
                              true, options_.compression_min_size, options_.compression_min_ratio } };
    }
    RELAY_LOG_DEBUG("{} connected, local_address={}, compression={}", log_prefix_, local_address(), snappy_.load());
  }
  handler(ec);
}

auto
mcbp_connection::send(mcbp::packet request, response_handler&& handler) -> std::uint32_t
{
  request.opaque_ = ++opaque_;
  const auto opaque = request.opaque_;
  auto encoded = codec_.encode_packet(request);
  if (!encoded) {
    asio::post(io_, [handler = std::move(handler), ec = encoded.error()]() mutable {
      handler(ec, {});
    });
    return opaque;
  }
  {
    const std::scoped_lock lock(mutex_);
    if (closed_ || broken_) {
      asio::post(io_, [handler = std::move(handler)]() mutable {
        handler(errc::common::transport_failure, {});
      });
      return opaque;
    }
    handlers_.emplace(opaque, std::move(handler));
  }
  RELAY_LOG_TRACE("{} sending {}", log_prefix_, request.debug_string());
  {
    const std::scoped_lock lock(output_buffer_mutex_);
    output_buffer_.emplace_back(std::move(encoded.value()));
  }
  asio::post(io_, [self = shared_from_this()]() {
    self->do_write();
  });
  if (!reading_.exchange(true)) {
    do_read();
  }
  return opaque;
}

void
mcbp_connection::cancel(std::uint32_t opaque)
{
  response_handler handler{};
  {
    const std::scoped_lock lock(mutex_);
    if (auto it = handlers_.find(opaque); it != handlers_.end()) {
      handler = std::move(it->second);
      handlers_.erase(it);
    }
  }
  if (handler) {
    RELAY_LOG_TRACE("{} forgetting request opaque={}", log_prefix_, opaque);
  }
}

void
mcbp_connection::do_write()
{
  if (closed_ || !stream_->is_open()) {
    return;
  }
  const std::scoped_lock lock(writing_buffer_mutex_, output_buffer_mutex_);
  if (!writing_buffer_.empty() || output_buffer_.empty()) {
    return;
  }
  std::swap(writing_buffer_, output_buffer_);
  std::vector<asio::const_buffer> buffers;
  buffers.reserve(writing_buffer_.size());
  for (const auto& buf : writing_buffer_) {
    buffers.emplace_back(asio::buffer(buf));
  }
  stream_->async_write(buffers, [self = shared_from_this()](std::error_code ec, std::size_t /* bytes_transferred */) {
    if (ec) {
      if (ec != asio::error::operation_aborted) {
        RELAY_LOG_DEBUG(R"({} IO error while writing to the socket("{}"): {})", self->log_prefix_, self->id(), ec.message());
      }
      return self->fail(errc::common::transport_failure);
    }
    {
      const std::scoped_lock inner_lock(self->writing_buffer_mutex_);
      self->writing_buffer_.clear();
    }
    asio::post(self->io_, [self]() {
      self->do_write();
    });
  });
}

void
mcbp_connection::do_read()
{
  if (closed_) {
    return;
  }
  stream_->async_read_some(asio::buffer(read_chunk_),
                           [self = shared_from_this()](std::error_code ec, std::size_t bytes_transferred) {
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
mcbp_connection::on_data(std::size_t bytes_transferred)
{
  input_.insert(input_.end(), read_chunk_.begin(), read_chunk_.begin() + static_cast<std::ptrdiff_t>(bytes_transferred));
  while (!closed_) {
    auto [packet, consumed, ec] = codec_.decode_packet(input_);
    if (ec == errc::network::need_more_data) {
      return do_read();
    }
    if (ec) {
      RELAY_LOG_WARNING("{} unable to parse frame: {}", log_prefix_, ec.message());
      return fail(errc::common::protocol_failure);
    }
    input_.erase(input_.begin(), input_.begin() + static_cast<std::ptrdiff_t>(consumed));
    if (packet.magic_ != protocol::magic::client_response) {
      RELAY_LOG_DEBUG("{} ignoring unexpected frame: {}", log_prefix_, packet.debug_string());
      continue;
    }
    RELAY_LOG_TRACE("{} received {}", log_prefix_, packet.debug_string());
    complete(std::move(packet));
  }
}

void
mcbp_connection::complete(mcbp::packet response)
{
  response_handler handler{};
  {
    const std::scoped_lock lock(mutex_);
    if (auto it = handlers_.find(response.opaque_); it != handlers_.end()) {
      handler = std::move(it->second);
      handlers_.erase(it);
    }
  }
  if (!handler) {
    RELAY_LOG_DEBUG("{} no request is waiting for the response, ignoring: {}", log_prefix_, response.debug_string());
    return;
  }
  handler({}, std::move(response));
}

void
mcbp_connection::fail(std::error_code ec)
{
  std::map<std::uint32_t, response_handler> handlers{};
  {
    const std::scoped_lock lock(mutex_);
    broken_ = true;
    std::swap(handlers, handlers_);
  }
  for (auto& [opaque, handler] : handlers) {
    handler(ec, {});
  }
  close();
}

void
mcbp_connection::close()
{
  std::map<std::uint32_t, response_handler> handlers{};
  {
    const std::scoped_lock lock(mutex_);
    if (closed_.exchange(true)) {
      return;
    }
    std::swap(handlers, handlers_);
  }
  connect_deadline_.cancel();
  RELAY_LOG_DEBUG("{} closing, in_flight={}", log_prefix_, handlers.size());
  stream_->close([](std::error_code /* ec */) {});
  for (auto& [opaque, handler] : handlers) {
    handler(errc::common::request_canceled, {});
  }
  finish_connect(errc::common::request_canceled);
}

auto
mcbp_connection::is_usable() const -> bool
{
  if (closed_ || broken_ || !stream_->is_open()) {
    return false;
  }
  const std::scoped_lock lock(mutex_);
  return !connect_handler_;
}

auto
mcbp_connection::endpoint() const -> std::string
{
  return fmt::format("{}:{}", options_.hostname, options_.port);
}

auto
mcbp_connection::local_address() const -> std::string
{
  return stream_->local_address();
}

auto
mcbp_connection::id() const -> const std::string&
{
  return stream_->id();
}

auto
mcbp_connection::supports_compression() const -> bool
{
  return snappy_;
}
} // namespace relay::core::io

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

#include <relay/service_type.hxx>

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <system_error>

namespace relay::core::io
{
struct http_request {
  service_type type{ service_type::management };
  std::string method{ "GET" };
  std::string path{};
  std::map<std::string, std::string> headers{};
  std::string body{};

  /**
   * "host:port" of the node the request is sent to
   */
  std::string endpoint{};
};

/**
 * Body of a response, pulled chunk by chunk as it arrives from the network.
 */
class http_body_reader
{
public:
  /**
   * Invoked with the next chunk, with an empty chunk and complete set once the body ended, or with
   * an error.
   */
  using chunk_handler = utils::movable_function<void(std::error_code ec, std::string chunk, bool complete)>;

  http_body_reader() = default;
  http_body_reader(const http_body_reader&) = delete;
  http_body_reader(http_body_reader&&) = delete;
  auto operator=(const http_body_reader&) -> http_body_reader& = delete;
  auto operator=(http_body_reader&&) -> http_body_reader& = delete;
  virtual ~http_body_reader() = default;

  virtual void next(chunk_handler&& handler) = 0;

  /**
   * Aborts the read in flight and releases the connection.
   */
  virtual void cancel() = 0;
};

struct http_response {
  std::uint32_t status_code{ 0 };
  std::string status_message{};
  std::map<std::string, std::string> headers{};
  std::shared_ptr<http_body_reader> body{};
  std::string endpoint{};

  [[nodiscard]] auto must_close_connection() const -> bool
  {
    if (const auto it = headers.find("connection"); it != headers.end()) {
      return it->second == "close";
    }
    return false;
  }
};
} // namespace relay::core::io

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

#include <relay/service_type.hxx>

#include <memory>
#include <string>

namespace relay
{
/**
 * Describes the connection the credentials are requested for.
 */
struct auth_request {
  service_type service{ service_type::key_value };
  std::string endpoint{};
};

struct user_pass {
  std::string username{};
  std::string password{};
};

/**
 * Supplies credentials whenever a connection is established or an HTTP request is authorized. The
 * core does not keep the returned credentials beyond that call.
 */
class authenticator
{
public:
  authenticator() = default;
  authenticator(const authenticator& other) = default;
  authenticator(authenticator&& other) = default;
  auto operator=(const authenticator& other) -> authenticator& = default;
  auto operator=(authenticator&& other) -> authenticator& = default;
  virtual ~authenticator() = default;

  [[nodiscard]] virtual auto supports_tls() const -> bool = 0;
  [[nodiscard]] virtual auto supports_non_tls() const -> bool = 0;

  [[nodiscard]] virtual auto credentials(const auth_request& request) const -> user_pass = 0;

  /**
   * @return path to the client certificate chain (PEM), empty when the authenticator does not use
   * certificates
   */
  [[nodiscard]] virtual auto certificate_path(const auth_request& /* request */) const
    -> std::string
  {
    return {};
  }

  [[nodiscard]] virtual auto key_path(const auth_request& /* request */) const -> std::string
  {
    return {};
  }
};

class password_authenticator : public authenticator
{
public:
  password_authenticator(std::string username, std::string password)
    : username_{ std::move(username) }
    , password_{ std::move(password) }
  {
  }

  [[nodiscard]] auto supports_tls() const -> bool override
  {
    return true;
  }

  [[nodiscard]] auto supports_non_tls() const -> bool override
  {
    return true;
  }

  [[nodiscard]] auto credentials(const auth_request& /* request */) const -> user_pass override
  {
    return { username_, password_ };
  }

private:
  std::string username_;
  std::string password_;
};

/**
 * Authenticates with a client certificate, only usable over TLS.
 */
class certificate_authenticator : public authenticator
{
public:
  certificate_authenticator(std::string certificate_path, std::string key_path)
    : certificate_path_{ std::move(certificate_path) }
    , key_path_{ std::move(key_path) }
  {
  }

  [[nodiscard]] auto supports_tls() const -> bool override
  {
    return true;
  }

  [[nodiscard]] auto supports_non_tls() const -> bool override
  {
    return false;
  }

  [[nodiscard]] auto credentials(const auth_request& /* request */) const -> user_pass override
  {
    return {};
  }

  [[nodiscard]] auto certificate_path(const auth_request& /* request */) const
    -> std::string override
  {
    return certificate_path_;
  }

  [[nodiscard]] auto key_path(const auth_request& /* request */) const -> std::string override
  {
    return key_path_;
  }

private:
  std::string certificate_path_;
  std::string key_path_;
};
} // namespace relay

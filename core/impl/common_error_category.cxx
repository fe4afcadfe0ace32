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

#include <relay/error_codes.hxx>

#include <string>

namespace relay::core::impl
{
struct common_error_category : std::error_category {
  [[nodiscard]] auto name() const noexcept -> const char* override
  {
    return "relay.common";
  }

  [[nodiscard]] auto message(int ev) const noexcept -> std::string override
  {
    switch (static_cast<errc::common>(ev)) {
      case errc::common::request_canceled:
        return "request_canceled (1)";
      case errc::common::timeout:
        return "timeout (2)";
      case errc::common::circuit_open:
        return "circuit_open (3)";
      case errc::common::topology_unavailable:
        return "topology_unavailable (4)";
      case errc::common::transport_failure:
        return "transport_failure (5)";
      case errc::common::protocol_failure:
        return "protocol_failure (6)";
      case errc::common::configuration_error:
        return "configuration_error (7)";
      case errc::common::service_not_available:
        return "service_not_available (8)";
      case errc::common::authentication_failure:
        return "authentication_failure (9)";
      case errc::common::cluster_closed:
        return "cluster_closed (10)";
      case errc::common::temporary_failure:
        return "temporary_failure (11)";
      case errc::common::internal_server_failure:
        return "internal_server_failure (12)";
      case errc::common::invalid_argument:
        return "invalid_argument (13)";
    }
    return "FIXME: unknown error code (recompile with newer library): relay.common." +
           std::to_string(ev);
  }
};

const inline static common_error_category common_category_instance;

auto
common_category() noexcept -> const std::error_category&
{
  return common_category_instance;
}
} // namespace relay::core::impl

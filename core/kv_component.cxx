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
#include "kv_component.hxx"

#include "component_context.hxx"
#include "logger/logger.hxx"
#include "mcbp/codec.hxx"
#include "topology/configuration.hxx"

#include <relay/error_codes.hxx>

#include <fmt/core.h>

namespace relay::core
{
auto
map_key_value_status(protocol::key_value_status_code status) -> std::pair<std::error_code, retry_reason>
{
  using protocol::key_value_status_code;

  switch (status) {
    case key_value_status_code::success:
      return { {}, retry_reason::do_not_retry };
    case key_value_status_code::not_my_vbucket:
      return { errc::network::configuration_not_available, retry_reason::topology_stale };
    case key_value_status_code::temporary_failure:
    case key_value_status_code::busy:
    case key_value_status_code::no_memory:
      return { errc::common::temporary_failure, retry_reason::node_overloaded };
    case key_value_status_code::locked:
      return { errc::key_value::document_locked, retry_reason::key_value_locked };
    case key_value_status_code::sync_write_in_progress:
    case key_value_status_code::sync_write_re_commit_in_progress:
      return { errc::common::temporary_failure, retry_reason::sync_write_in_progress };
    case key_value_status_code::not_found:
      return { errc::key_value::document_not_found, retry_reason::do_not_retry };
    case key_value_status_code::exists:
      return { errc::key_value::document_exists, retry_reason::do_not_retry };
    case key_value_status_code::too_big:
      return { errc::key_value::value_too_large, retry_reason::do_not_retry };
    case key_value_status_code::not_stored:
      return { errc::key_value::document_not_stored, retry_reason::do_not_retry };
    case key_value_status_code::invalid:
    case key_value_status_code::delta_bad_value:
    case key_value_status_code::range_error:
      return { errc::key_value::invalid_arguments, retry_reason::do_not_retry };
    case key_value_status_code::no_access:
      return { errc::key_value::no_access, retry_reason::do_not_retry };
    case key_value_status_code::unknown_collection:
      return { errc::key_value::unknown_collection, retry_reason::do_not_retry };
    case key_value_status_code::auth_error:
    case key_value_status_code::auth_stale:
      return { errc::common::authentication_failure, retry_reason::do_not_retry };
    case key_value_status_code::internal:
      return { errc::common::internal_server_failure, retry_reason::do_not_retry };
    case key_value_status_code::no_bucket:
      return { errc::common::configuration_error, retry_reason::do_not_retry };
    default:
      break;
  }
  return { errc::common::protocol_failure, retry_reason::do_not_retry };
}

auto
is_idempotent(protocol::client_opcode opcode) -> bool
{
  switch (opcode) {
    case protocol::client_opcode::get:
    case protocol::client_opcode::noop:
    case protocol::client_opcode::touch:
    case protocol::client_opcode::get_cluster_config:
      return true;
    default:
      break;
  }
  return false;
}

namespace
{
auto
operation_name(protocol::client_opcode opcode) -> const char*
{
  switch (opcode) {
    case protocol::client_opcode::get:
      return tracing::operation::mcbp_get;
    case protocol::client_opcode::upsert:
      return tracing::operation::mcbp_upsert;
    case protocol::client_opcode::insert:
      return tracing::operation::mcbp_insert;
    case protocol::client_opcode::replace:
      return tracing::operation::mcbp_replace;
    case protocol::client_opcode::remove:
      return tracing::operation::mcbp_remove;
    case protocol::client_opcode::touch:
      return tracing::operation::mcbp_touch;
    case protocol::client_opcode::get_cluster_config:
      return tracing::operation::mcbp_get_cluster_config;
    default:
      break;
  }
  return "kv";
}
} // namespace

class kv_component_impl : public std::enable_shared_from_this<kv_component_impl>
{
public:
  kv_component_impl(const component_context& ctx, std::chrono::milliseconds default_timeout)
    : ctx_{ ctx }
    , default_timeout_{ default_timeout }
  {
  }

  auto execute(kv_request request, kv_callback&& callback) -> tl::expected<std::shared_ptr<pending_operation>, error>
  {
    if (request.opcode == protocol::client_opcode::invalid) {
      return tl::unexpected(error{ errc::common::configuration_error, "opcode is not set" });
    }
    if (request.key.size() > 250) {
      return tl::unexpected(error{ errc::common::configuration_error, "key is longer than 250 bytes" });
    }
    if (auto err = check_admission(ctx_, service_type::key_value); err) {
      return tl::unexpected(std::move(err.value()));
    }

    pending_request<kv_response>::options options{};
    options.name = operation_name(request.opcode);
    options.idempotent = request.idempotent.value_or(is_idempotent(request.opcode));
    options.deadline = resolve_deadline(request.deadline, request.timeout, default_timeout_);
    options.strategy = request.retry_strategy;
    auto parent_span = request.parent_span;

    auto shared_request = std::make_shared<const kv_request>(std::move(request));
    return start_operation<kv_response>(
      ctx_,
      operation_name(shared_request->opcode),
      service_type::key_value,
      std::move(options),
      std::move(parent_span),
      [self = shared_from_this(), request = shared_request](const attempt_context& attempt,
                                                            pending_request<kv_response>::outcome_handler&& handler) {
        return self->attempt(request, attempt, std::move(handler));
      },
      std::move(callback));
  }

private:
  auto attempt(const std::shared_ptr<const kv_request>& request,
               const attempt_context& ctx,
               pending_request<kv_response>::outcome_handler&& handler) -> std::shared_ptr<pending_operation>
  {
    auto selection = ctx_.topology->select_node(service_type::key_value, ctx, request->key);
    if (!selection) {
      attempt_outcome<kv_response> outcome{};
      outcome.err = error{ selection.error(), "unable to select a node for the key" };
      outcome.reason = selection_failure_reason(selection.error());
      handler(std::move(outcome));
      return {};
    }

    mcbp::packet packet{};
    packet.magic_ = protocol::magic::client_request;
    packet.command_ = request->opcode;
    packet.datatype_ = request->datatype;
    packet.vbucket_ = selection->vbucket.value_or(0);
    packet.cas_ = request->cas;
    packet.key_ = mcbp::to_bytes(request->key);
    packet.extras_ = request->extras;
    packet.value_ = request->value;

    return ctx_.transport->send_kv(
      selection->endpoint,
      std::move(packet),
      ctx.parent_span,
      [self = shared_from_this(), handler = std::move(handler)](error err, kv_exchange_result result) mutable {
        attempt_outcome<kv_response> outcome{};
        outcome.dispatched_to = result.info.dispatched_to;
        outcome.dispatched_from = result.info.dispatched_from;
        if (err) {
          outcome.err = std::move(err);
          outcome.reason = result.info.reason;
          return handler(std::move(outcome));
        }

        const auto status = result.response.status_code_;
        if (status == protocol::key_value_status_code::success) {
          outcome.value = kv_response{ std::move(result.response), result.info.dispatched_to };
          return handler(std::move(outcome));
        }
        if (status == protocol::key_value_status_code::not_my_vbucket) {
          self->apply_piggybacked_configuration(result.response, result.info.dispatched_to);
        }
        auto [ec, reason] = map_key_value_status(status);
        outcome.err = error{ ec, fmt::format("server responded with status {:#x}", result.response.status_) };
        outcome.err.ctx["status"] = result.response.status_;
        outcome.err.ctx["opaque"] = result.response.opaque_;
        outcome.reason = reason;
        handler(std::move(outcome));
      });
  }

  /**
   * Nodes that no longer own a vbucket answer with the map they know about.
   */
  void apply_piggybacked_configuration(const mcbp::packet& response, const std::string& endpoint)
  {
    if (response.value_.empty()) {
      return;
    }
    try {
      auto config = topology::parse_configuration(mcbp::to_string(response.value_), split_endpoint(endpoint).first);
      ctx_.topology->update(std::move(config), split_endpoint(endpoint).first);
    } catch (const std::exception& e) {
      RELAY_LOG_DEBUG("unable to parse configuration from not_my_vbucket response of {}: {}", endpoint, e.what());
    }
  }

  component_context ctx_;
  std::chrono::milliseconds default_timeout_;
};

kv_component::kv_component(const component_context& ctx, std::chrono::milliseconds default_timeout)
  : impl_{ std::make_shared<kv_component_impl>(ctx, default_timeout) }
{
}

auto
kv_component::execute(kv_request request, kv_callback&& callback)
  -> tl::expected<std::shared_ptr<pending_operation>, error>
{
  return impl_->execute(std::move(request), std::move(callback));
}
} // namespace relay::core

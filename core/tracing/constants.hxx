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

namespace relay::core::tracing
{
namespace operation
{
constexpr auto step_dispatch = "dispatch_to_server";

constexpr auto query = "query";
constexpr auto analytics = "analytics";
constexpr auto search = "search";
constexpr auto views = "views";
constexpr auto http = "http_request";

constexpr auto mcbp_get = "get";
constexpr auto mcbp_upsert = "upsert";
constexpr auto mcbp_insert = "insert";
constexpr auto mcbp_replace = "replace";
constexpr auto mcbp_remove = "remove";
constexpr auto mcbp_touch = "touch";
constexpr auto mcbp_get_cluster_config = "get_cluster_config";
} // namespace operation

namespace attributes
{
constexpr auto system = "db.system";
constexpr auto operation = "db.operation";
constexpr auto service = "db.relay.service";
constexpr auto operation_id = "db.relay.operation_id";
constexpr auto retries = "db.relay.retries";
constexpr auto outcome = "db.relay.outcome";
constexpr auto remote_socket = "db.relay.remote_socket";
constexpr auto local_socket = "db.relay.local_socket";
} // namespace attributes
} // namespace relay::core::tracing

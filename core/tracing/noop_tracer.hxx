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

#include <relay/tracing/request_tracer.hxx>

namespace relay::core::tracing
{
class noop_span : public relay::tracing::request_span
{
public:
  void add_tag(const std::string& /* name */, std::uint64_t /* value */) override
  {
    /* do nothing */
  }

  void add_tag(const std::string& /* name */, const std::string& /* value */) override
  {
    /* do nothing */
  }

  void end() override
  {
    /* do nothing */
  }

  [[nodiscard]] auto uses_tags() const -> bool override
  {
    return false;
  }
};

class noop_tracer : public relay::tracing::request_tracer
{
public:
  auto start_span(std::string /* name */,
                  std::shared_ptr<relay::tracing::request_span> /* parent */)
    -> std::shared_ptr<relay::tracing::request_span> override
  {
    return instance_;
  }

private:
  std::shared_ptr<noop_span> instance_{ std::make_shared<noop_span>() };
};
} // namespace relay::core::tracing

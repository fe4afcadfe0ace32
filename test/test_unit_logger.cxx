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
#include "test_helper.hxx"

#include "core/logger/configuration.hxx"
#include "core/logger/logger.hxx"

#include <spdlog/sinks/ringbuffer_sink.h>

#include <filesystem>
#include <fstream>
#include <iterator>

namespace
{
auto
capture(relay::core::logger::level lvl) -> std::shared_ptr<spdlog::sinks::ringbuffer_sink_mt>
{
  auto sink = std::make_shared<spdlog::sinks::ringbuffer_sink_mt>(100);
  relay::core::logger::configuration configuration{};
  configuration.unit_test = true;
  configuration.log_level = lvl;
  configuration.sink = sink;
  auto failure = relay::core::logger::create_file_logger(configuration);
  REQUIRE_FALSE(failure.has_value());
  return sink;
}

auto
contains(const std::vector<std::string>& lines, const std::string& needle) -> bool
{
  for (const auto& line : lines) {
    if (line.find(needle) != std::string::npos) {
      return true;
    }
  }
  return false;
}

auto
expensive_argument(int& counter) -> int
{
  return ++counter;
}
} // namespace

TEST_CASE("unit: logger", "[unit]")
{
  SECTION("level names")
  {
    REQUIRE(relay::core::logger::level_from_str("trace") == relay::core::logger::level::trace);
    REQUIRE(relay::core::logger::level_from_str("debug") == relay::core::logger::level::debug);
    REQUIRE(relay::core::logger::level_from_str("info") == relay::core::logger::level::info);
    REQUIRE(relay::core::logger::level_from_str("warning") == relay::core::logger::level::warn);
    REQUIRE(relay::core::logger::level_from_str("error") == relay::core::logger::level::err);
    REQUIRE(relay::core::logger::level_from_str("critical") == relay::core::logger::level::critical);
    REQUIRE(relay::core::logger::level_from_str("off") == relay::core::logger::level::off);
  }

  SECTION("messages below the level are dropped")
  {
    auto sink = capture(relay::core::logger::level::info);
    RELAY_LOG_DEBUG("debug message {}", 1);
    RELAY_LOG_INFO("info message {}", 2);
    RELAY_LOG_WARNING("warning message {}", 3);
    relay::core::logger::flush();

    auto lines = sink->last_formatted();
    REQUIRE(lines.size() == 2);
    REQUIRE(contains(lines, "info message 2"));
    REQUIRE(contains(lines, "warning message 3"));
    REQUIRE_FALSE(contains(lines, "debug message"));
  }

  SECTION("arguments are evaluated only for enabled levels")
  {
    auto sink = capture(relay::core::logger::level::warn);
    int counter{ 0 };
    RELAY_LOG_TRACE("value {}", expensive_argument(counter));
    REQUIRE(counter == 0);
    RELAY_LOG_ERROR("value {}", expensive_argument(counter));
    REQUIRE(counter == 1);
    REQUIRE(contains(sink->last_formatted(), "value 1"));
  }

  SECTION("level can be changed at runtime")
  {
    auto sink = capture(relay::core::logger::level::info);
    REQUIRE_FALSE(relay::core::logger::should_log(relay::core::logger::level::trace));
    relay::core::logger::set_log_levels(relay::core::logger::level::trace);
    REQUIRE(relay::core::logger::should_log(relay::core::logger::level::trace));
    RELAY_LOG_TRACE("now visible");
    REQUIRE(contains(sink->last_formatted(), "now visible"));
  }

  SECTION("blackhole logger")
  {
    relay::core::logger::create_blackhole_logger();
    REQUIRE(relay::core::logger::is_initialized());
    REQUIRE_FALSE(relay::core::logger::should_log(relay::core::logger::level::critical));
  }

  SECTION("nothing is logged without a logger")
  {
    relay::core::logger::reset();
    REQUIRE_FALSE(relay::core::logger::is_initialized());
    REQUIRE(relay::core::logger::get() == nullptr);
    REQUIRE_FALSE(relay::core::logger::should_log(relay::core::logger::level::critical));
    RELAY_LOG_CRITICAL("dropped");
  }

  SECTION("file sink")
  {
    auto path = std::filesystem::temp_directory_path() / "relay_unit_logger.log";
    std::filesystem::remove(path);

    relay::core::logger::configuration configuration{};
    configuration.filename = path.string();
    configuration.unit_test = true;
    configuration.log_level = relay::core::logger::level::debug;
    auto failure = relay::core::logger::create_file_logger(configuration);
    REQUIRE_FALSE(failure.has_value());

    RELAY_LOG_DEBUG("written to {}", "file");
    relay::core::logger::flush();
    relay::core::logger::reset();

    std::ifstream input{ path };
    std::string content{ std::istreambuf_iterator<char>{ input }, std::istreambuf_iterator<char>{} };
    REQUIRE(content.find("written to file") != std::string::npos);
    input.close();
    std::filesystem::remove(path);
  }

  relay::core::logger::reset();
  test::utils::init_logger();
}

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

#include "logger.hxx"

#include "configuration.hxx"

#include <spdlog/async.h>
#include <spdlog/async_logger.h>
#include <spdlog/common.h>
#include <spdlog/logger.h>
#include <spdlog/sinks/dist_sink.h>
#include <spdlog/sinks/null_sink.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace
{
const std::string file_logger_name{ "relay_file_logger" };

/**
 * Custom log pattern which the loggers will use.
 */
const std::string log_pattern{ "[%Y-%m-%d %T.%e] %4oms [%^%4!l%$] [%P,%t] %v" };

std::shared_ptr<spdlog::logger> file_logger{};
std::mutex file_logger_mutex;
std::atomic_int file_logger_version{ 0 };

auto
get_file_logger() -> std::shared_ptr<spdlog::logger>
{
  thread_local std::shared_ptr<spdlog::logger> logger{ nullptr };
  thread_local int version{ -1 };
  if (version != file_logger_version) {
    const std::scoped_lock lock(file_logger_mutex);
    logger = file_logger;
    version = file_logger_version;
  }
  return logger;
}

void
update_file_logger(const std::shared_ptr<spdlog::logger>& new_logger)
{
  const std::scoped_lock lock(file_logger_mutex);
  spdlog::drop(file_logger_name);
  file_logger = new_logger;
  if (new_logger) {
    spdlog::register_logger(new_logger);
  }
  ++file_logger_version;
}
} // namespace

namespace relay::core::logger
{
auto
translate_level(level level) -> spdlog::level::level_enum
{
  switch (level) {
    case level::trace:
      return spdlog::level::level_enum::trace;
    case level::debug:
      return spdlog::level::level_enum::debug;
    case level::info:
      return spdlog::level::level_enum::info;
    case level::warn:
      return spdlog::level::level_enum::warn;
    case level::err:
      return spdlog::level::level_enum::err;
    case level::critical:
      return spdlog::level::level_enum::critical;
    case level::off:
      return spdlog::level::level_enum::off;
  }
  return spdlog::level::level_enum::trace;
}

auto
level_from_str(const std::string& str) -> level
{
  switch (spdlog::level::from_str(str)) {
    case spdlog::level::level_enum::trace:
      return level::trace;
    case spdlog::level::level_enum::debug:
      return level::debug;
    case spdlog::level::level_enum::info:
      return level::info;
    case spdlog::level::level_enum::warn:
      return level::warn;
    case spdlog::level::level_enum::err:
      return level::err;
    case spdlog::level::level_enum::critical:
      return level::critical;
    case spdlog::level::level_enum::off:
      return level::off;
    default:
      break;
  }
  // return highest level if we don't understand
  return level::trace;
}

auto
should_log(level lvl) -> bool
{
  if (auto logger = get_file_logger(); logger) {
    return logger->should_log(translate_level(lvl));
  }
  return false;
}

namespace detail
{
void
log(const char* file, int line, const char* function, level lvl, std::string_view msg)
{
  if (auto logger = get_file_logger(); logger) {
    logger->log(spdlog::source_loc{ file, line, function }, translate_level(lvl), msg);
  }
}
} // namespace detail

void
flush()
{
  if (auto logger = get_file_logger(); logger) {
    logger->flush();
  }
}

void
shutdown()
{
  flush();
  update_file_logger(nullptr);
  spdlog::shutdown();
}

auto
is_initialized() -> bool
{
  return get_file_logger() != nullptr;
}

auto
create_file_logger(const configuration& logger_settings) -> std::optional<std::string>
{
  std::shared_ptr<spdlog::logger> logger{};

  try {
    // logger
    //   |__dist_sink_mt: forwards to every sink, each filters by its own level
    //       |__rotating_file_sink_mt (trace)
    //       |__stderr_color_sink_mt (console_sink_log_level)
    //       |__custom sink
    auto sink = std::make_shared<spdlog::sinks::dist_sink_mt>();
    sink->set_level(spdlog::level::trace);

    if (const auto& fname = logger_settings.filename; !fname.empty()) {
      auto fsink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
        fname, logger_settings.cycle_size, logger_settings.max_files);
      fsink->set_level(spdlog::level::trace);
      sink->add_sink(fsink);
    }

    if (logger_settings.console) {
      auto stderrsink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
      stderrsink->set_level(translate_level(logger_settings.console_sink_log_level));
      sink->add_sink(stderrsink);
    }
    if (nullptr != logger_settings.sink) {
      sink->add_sink(logger_settings.sink);
    }

    spdlog::drop(file_logger_name);

    if (logger_settings.unit_test) {
      logger = std::make_shared<spdlog::logger>(file_logger_name, sink);
    } else {
      spdlog::init_thread_pool(logger_settings.buffer_size, 1);
      logger = std::make_shared<spdlog::async_logger>(
        file_logger_name, sink, spdlog::thread_pool(), spdlog::async_overflow_policy::block);
    }

    logger->set_pattern(log_pattern);
    logger->set_level(translate_level(logger_settings.log_level));

    spdlog::flush_every(std::chrono::seconds(1));
  } catch (const spdlog::spdlog_ex& ex) {
    return std::string{ "Log initialization failed: " } + ex.what();
  }

  update_file_logger(logger);
  return {};
}

auto
get() -> spdlog::logger*
{
  return get_file_logger().get();
}

void
reset()
{
  update_file_logger(nullptr);
}

void
create_blackhole_logger()
{
  auto new_logger = std::make_shared<spdlog::logger>(
    file_logger_name, std::make_shared<spdlog::sinks::null_sink_mt>());
  new_logger->set_level(spdlog::level::off);
  new_logger->set_pattern(log_pattern);

  update_file_logger(new_logger);
}

void
create_console_logger()
{
  auto stderrsink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  auto new_logger = std::make_shared<spdlog::logger>(file_logger_name, stderrsink);
  new_logger->set_level(spdlog::level::info);
  new_logger->set_pattern(log_pattern);
  update_file_logger(new_logger);
}

void
set_log_levels(level lvl)
{
  auto level = translate_level(lvl);
  spdlog::apply_all([level](const std::shared_ptr<spdlog::logger>& l) {
    l->set_level(level);
  });

  flush();
}
} // namespace relay::core::logger

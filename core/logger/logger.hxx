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

/*
 * The logger is a process wide facility. The create_*() functions replace the active logger and
 * may be called at any time, the replacement becomes visible to other threads on their next
 * logging call. Nothing is logged until one of them has been called.
 */

#pragma once

#include "level.hxx"

#include <fmt/core.h>
#include <spdlog/fwd.h>

#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace relay::core::logger
{
struct configuration;

auto
level_from_str(const std::string& str) -> level;

/**
 * Initialize the file logger (and optionally the console sink) from the configuration.
 *
 * @return error message if the logger could not be created
 */
auto
create_file_logger(const configuration& logger_settings) -> std::optional<std::string>;

/**
 * Initialize the logger with a sink that discards everything. Used by tests that do not need any
 * output but exercise code that logs.
 */
void
create_blackhole_logger();

/**
 * Initialize the logger which writes to stderr.
 */
void
create_console_logger();

/**
 * @return the underlying logger or nullptr when none has been created.
 */
auto
get() -> spdlog::logger*;

void
reset();

/**
 * Set the level of every registered logger.
 */
void
set_log_levels(level lvl);

auto
should_log(level lvl) -> bool;

namespace detail
{
void
log(const char* file, int line, const char* function, level lvl, std::string_view msg);
} // namespace detail

template<typename String, typename... Args>
inline void
log(const char* file, int line, const char* function, level lvl, const String& msg, Args&&... args)
{
  detail::log(file, line, function, lvl, fmt::format(msg, std::forward<Args>(args)...));
}

void
flush();

/**
 * Flush and release all loggers. A new logger has to be created afterwards.
 */
void
shutdown();

auto
is_initialized() -> bool;
} // namespace relay::core::logger

#if defined(__GNUC__) || defined(__clang__)
#define RELAY_LOGGER_FUNCTION __PRETTY_FUNCTION__
#else
#define RELAY_LOGGER_FUNCTION __FUNCTION__
#endif

/**
 * Arguments are evaluated only when the severity is enabled.
 */
#define RELAY_LOG(file, line, function, severity, ...)                                             \
  do {                                                                                             \
    if (relay::core::logger::should_log(severity)) {                                               \
      relay::core::logger::log(file, line, function, severity, __VA_ARGS__);                       \
    }                                                                                              \
  } while (false)

#define RELAY_LOG_TRACE(...)                                                                       \
  RELAY_LOG(                                                                                       \
    __FILE__, __LINE__, RELAY_LOGGER_FUNCTION, relay::core::logger::level::trace, __VA_ARGS__)
#define RELAY_LOG_DEBUG(...)                                                                       \
  RELAY_LOG(                                                                                       \
    __FILE__, __LINE__, RELAY_LOGGER_FUNCTION, relay::core::logger::level::debug, __VA_ARGS__)
#define RELAY_LOG_INFO(...)                                                                        \
  RELAY_LOG(                                                                                       \
    __FILE__, __LINE__, RELAY_LOGGER_FUNCTION, relay::core::logger::level::info, __VA_ARGS__)
#define RELAY_LOG_WARNING(...)                                                                     \
  RELAY_LOG(                                                                                       \
    __FILE__, __LINE__, RELAY_LOGGER_FUNCTION, relay::core::logger::level::warn, __VA_ARGS__)
#define RELAY_LOG_ERROR(...)                                                                       \
  RELAY_LOG(__FILE__, __LINE__, RELAY_LOGGER_FUNCTION, relay::core::logger::level::err, __VA_ARGS__)
#define RELAY_LOG_CRITICAL(...)                                                                    \
  RELAY_LOG(                                                                                       \
    __FILE__, __LINE__, RELAY_LOGGER_FUNCTION, relay::core::logger::level::critical, __VA_ARGS__)

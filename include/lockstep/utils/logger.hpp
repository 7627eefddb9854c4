////////////////////////////////////////////////////////////////////////////////
// Copyright 2019-2024 Lawrence Livermore National Security, LLC and other
// DiHydrogen Project Developers. See the top-level LICENSE file for details.
//
// SPDX-License-Identifier: Apache-2.0
////////////////////////////////////////////////////////////////////////////////

#pragma once

#include "lockstep_config.hpp"

#include <spdlog/spdlog.h>

#include <memory>
#include <string>

// We can ignore the SPDLOG level and manage it here.

#define LOCKSTEP_LOG_LEVEL_TRACE SPDLOG_LEVEL_TRACE
#define LOCKSTEP_LOG_LEVEL_DEBUG SPDLOG_LEVEL_DEBUG
#define LOCKSTEP_LOG_LEVEL_INFO SPDLOG_LEVEL_INFO
#define LOCKSTEP_LOG_LEVEL_WARN SPDLOG_LEVEL_WARN
#define LOCKSTEP_LOG_LEVEL_ERROR SPDLOG_LEVEL_ERROR
#define LOCKSTEP_LOG_LEVEL_CRITICAL SPDLOG_LEVEL_CRITICAL
#define LOCKSTEP_LOG_LEVEL_OFF SPDLOG_LEVEL_OFF

#ifndef LOCKSTEP_LOG_ACTIVE_LEVEL
#define LOCKSTEP_LOG_ACTIVE_LEVEL LOCKSTEP_LOG_LEVEL_TRACE
#endif

// The arguments are only evaluated when the logger accepts the level.
#define LOCKSTEP_LOG(level, ...)                                               \
    do                                                                         \
    {                                                                          \
        auto& lockstep_logger_ = ::lockstep::logger();                         \
        if (lockstep_logger_.should_log(level))                                \
        {                                                                      \
            lockstep_logger_.log(                                              \
                ::spdlog::source_loc{                                          \
                    __FILE__, __LINE__, LOCKSTEP_PRETTY_FUNCTION},             \
                level,                                                         \
                __VA_ARGS__);                                                  \
        }                                                                      \
    } while (0)

#if LOCKSTEP_LOG_ACTIVE_LEVEL <= LOCKSTEP_LOG_LEVEL_TRACE
#define LOCKSTEP_TRACE(...) LOCKSTEP_LOG(::spdlog::level::trace, __VA_ARGS__)
#else
#define LOCKSTEP_TRACE(...) (void) 0
#endif // LOCKSTEP_LOG_ACTIVE_LEVEL <= LOCKSTEP_LOG_LEVEL_TRACE

#if LOCKSTEP_LOG_ACTIVE_LEVEL <= LOCKSTEP_LOG_LEVEL_DEBUG
#define LOCKSTEP_DEBUG(...) LOCKSTEP_LOG(::spdlog::level::debug, __VA_ARGS__)
#else
#define LOCKSTEP_DEBUG(...) (void) 0
#endif // LOCKSTEP_LOG_ACTIVE_LEVEL <= LOCKSTEP_LOG_LEVEL_DEBUG

#if LOCKSTEP_LOG_ACTIVE_LEVEL <= LOCKSTEP_LOG_LEVEL_INFO
#define LOCKSTEP_INFO(...) LOCKSTEP_LOG(::spdlog::level::info, __VA_ARGS__)
#else
#define LOCKSTEP_INFO(...) (void) 0
#endif // LOCKSTEP_LOG_ACTIVE_LEVEL <= LOCKSTEP_LOG_LEVEL_INFO

#if LOCKSTEP_LOG_ACTIVE_LEVEL <= LOCKSTEP_LOG_LEVEL_WARN
#define LOCKSTEP_WARN(...) LOCKSTEP_LOG(::spdlog::level::warn, __VA_ARGS__)
#else
#define LOCKSTEP_WARN(...) (void) 0
#endif // LOCKSTEP_LOG_ACTIVE_LEVEL <= LOCKSTEP_LOG_LEVEL_WARN

#if LOCKSTEP_LOG_ACTIVE_LEVEL <= LOCKSTEP_LOG_LEVEL_ERROR
#define LOCKSTEP_ERROR(...) LOCKSTEP_LOG(::spdlog::level::err, __VA_ARGS__)
#else
#define LOCKSTEP_ERROR(...) (void) 0
#endif // LOCKSTEP_LOG_ACTIVE_LEVEL <= LOCKSTEP_LOG_LEVEL_ERROR

#if LOCKSTEP_LOG_ACTIVE_LEVEL <= LOCKSTEP_LOG_LEVEL_CRITICAL
#define LOCKSTEP_CRITICAL(...)                                                 \
  LOCKSTEP_LOG(::spdlog::level::critical, __VA_ARGS__)
#else
#define LOCKSTEP_CRITICAL(...) (void) 0
#endif // LOCKSTEP_LOG_ACTIVE_LEVEL <= LOCKSTEP_LOG_LEVEL_CRITICAL

namespace lockstep
{

/** @brief Get the spdlog::logger used for all Lockstep logs.
 *
 *  The logger is created on first use. Its initial level is read from
 *  LOCKSTEP_LOG_LEVEL; SPDLOG_LEVEL takes precedence when set. An
 *  unknown level name is reported through the logger and replaced by
 *  warn.
 */
spdlog::logger& logger();

namespace internal
{

/** @brief Return the logger registered as `name`, creating it if needed.
 *
 *  A new logger starts at `level_name`, or at warn if the name is not
 *  a known level. Never throws on configuration.
 */
std::shared_ptr<spdlog::logger> get_or_make_logger(std::string const& name,
                                                   std::string const& level_name);

} // namespace internal

/** @brief Convert a level name to an spdlog level.
 *
 *  Accepts trace, debug, info, warn/warning, err/error, critical and
 *  off in any case.
 *
 *  @throws InvalidArgumentException on any other name.
 */
spdlog::level::level_enum log_level_from_string(std::string const& level);

} // namespace lockstep

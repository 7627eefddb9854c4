////////////////////////////////////////////////////////////////////////////////
// Copyright 2019-2024 Lawrence Livermore National Security, LLC and other
// DiHydrogen Project Developers. See the top-level LICENSE file for details.
//
// SPDX-License-Identifier: Apache-2.0
////////////////////////////////////////////////////////////////////////////////

#include "lockstep/utils/logger.hpp"

#include "lockstep/utils/Error.hpp"
#include "lockstep/utils/environment_vars.hpp"
#include "lockstep/utils/strings.hpp"

#include <memory>
#include <mutex>
#include <optional>
#include <unordered_map>

#include <spdlog/cfg/env.h>
#include <spdlog/pattern_formatter.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace
{

std::optional<spdlog::level::level_enum> parse_level(std::string const& level)
{
    static std::unordered_map<std::string, spdlog::level::level_enum> const
        levels = {{"TRACE", spdlog::level::trace},
                  {"DEBUG", spdlog::level::debug},
                  {"INFO", spdlog::level::info},
                  {"WARN", spdlog::level::warn},
                  {"WARNING", spdlog::level::warn},
                  {"ERR", spdlog::level::err},
                  {"ERROR", spdlog::level::err},
                  {"CRITICAL", spdlog::level::critical},
                  {"OFF", spdlog::level::off}};

    auto it = levels.find(lockstep::str_toupper(level));
    if (it == levels.end())
    {
        return std::nullopt;
    }
    return it->second;
}

std::shared_ptr<spdlog::logger> make_logger(std::string const& name,
                                            std::string const& level_name)
{
    spdlog::sink_ptr console_sink =
        std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console_sink->set_level(spdlog::level::trace);
    console_sink->set_formatter(
        std::make_unique<spdlog::pattern_formatter>("[%P] [%n:%^%l%$] %v"));

    auto logger = std::make_shared<spdlog::logger>(
        name, spdlog::sinks_init_list{console_sink});
    auto const level = parse_level(level_name);
    logger->set_level(level.value_or(spdlog::level::warn));
    logger->flush_on(spdlog::level::warn);
    if (!level)
    {
        logger->warn("Invalid log level \"{}\", using warn", level_name);
    }
    return logger;
}

} // namespace

std::shared_ptr<spdlog::logger>
lockstep::internal::get_or_make_logger(std::string const& name,
                                       std::string const& level_name)
{
    static std::mutex registry_mutex;
    std::lock_guard<std::mutex> lock(registry_mutex);

    if (auto existing = spdlog::get(name))
    {
        return existing;
    }
    auto logger = make_logger(name, level_name);
    spdlog::register_logger(logger);
    return logger;
}

spdlog::logger& lockstep::logger()
{
    static auto logger = [] {
        auto l = internal::get_or_make_logger("lockstep",
                                              env::get_raw("LOG_LEVEL"));
        // SPDLOG_LEVEL=info,lockstep=trace overrides LOCKSTEP_LOG_LEVEL.
        spdlog::cfg::load_env_levels();
        return l;
    }();
    return *logger;
}

spdlog::level::level_enum
lockstep::log_level_from_string(std::string const& level)
{
    auto const parsed = parse_level(level);
    LOCKSTEP_ASSERT(parsed.has_value(),
                    InvalidArgumentException,
                    "Invalid log level: ",
                    level);
    return *parsed;
}

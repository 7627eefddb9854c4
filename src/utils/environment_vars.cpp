////////////////////////////////////////////////////////////////////////////////
// Copyright 2019-2024 Lawrence Livermore National Security, LLC and other
// DiHydrogen Project Developers. See the top-level LICENSE file for details.
//
// SPDX-License-Identifier: Apache-2.0
////////////////////////////////////////////////////////////////////////////////

#include "lockstep/utils/environment_vars.hpp"

#include <stdlib.h>
#include <map>
#include <mutex>
#include <optional>

#include "lockstep/utils/Error.hpp"

namespace
{

std::optional<std::string> lookup(std::string const& name)
{
#ifdef _GNU_SOURCE
  char const* value = secure_getenv(name.c_str());
#else
  char const* value = getenv(name.c_str());
#endif
  if (value == nullptr)
  {
    return std::nullopt;
  }
  return std::string(value);
}

/** A registered variable, read from the environment at most once. */
class Setting
{
public:
  Setting(char const* name, char const* fallback)
    : full_name_(std::string("LOCKSTEP_") + name), fallback_(fallback)
  {}

  std::optional<std::string> const& from_env() const
  {
    std::call_once(read_, [this] { from_env_ = lookup(full_name_); });
    return from_env_;
  }

  std::string value() const { return from_env().value_or(fallback_); }

private:
  std::string full_name_;
  std::string fallback_;
  mutable std::once_flag read_;
  mutable std::optional<std::string> from_env_;
};

Setting const& setting(std::string const& name)
{
  // Every LOCKSTEP_ variable and its default.
  static std::map<std::string, Setting> const settings = [] {
    std::map<std::string, Setting> m;
    // Print a backtrace in every exception message.
    m.try_emplace("DEBUG_BACKTRACE", "DEBUG_BACKTRACE", "false");
    // Initial level of the "lockstep" logger.
    m.try_emplace("LOG_LEVEL", "LOG_LEVEL", "warn");
    return m;
  }();
  auto const it = settings.find(name);
  LOCKSTEP_ASSERT(it != settings.end(),
                  InvalidArgumentException,
                  "Environment variable LOCKSTEP_",
                  name,
                  " is not registered");
  return it->second;
}

}  // namespace

bool lockstep::env::exists(const std::string& name)
{
  return setting(name).from_env().has_value();
}

std::string lockstep::env::get_raw(const std::string& name)
{
  return setting(name).value();
}

bool lockstep::env::raw::exists(const std::string& name)
{
  return lookup(name).has_value();
}

std::string lockstep::env::raw::get_raw(const std::string& name)
{
  return lookup(name).value_or("");
}

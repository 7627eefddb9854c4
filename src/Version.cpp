////////////////////////////////////////////////////////////////////////////////
// Copyright 2019-2024 Lawrence Livermore National Security, LLC and other
// DiHydrogen Project Developers. See the top-level LICENSE file for details.
//
// SPDX-License-Identifier: Apache-2.0
////////////////////////////////////////////////////////////////////////////////

#include <lockstep_config.hpp>

#include <lockstep/Version.hpp>

#define LOCKSTEP_STRINGIFY(thing) LOCKSTEP_STRINGIFY_IMPL(thing)
#define LOCKSTEP_STRINGIFY_IMPL(thing) #thing

namespace lockstep
{
std::string Version() noexcept
{
  return LOCKSTEP_STRINGIFY(LOCKSTEP_VERSION_MAJOR) "." LOCKSTEP_STRINGIFY(
    LOCKSTEP_VERSION_MINOR) "." LOCKSTEP_STRINGIFY(LOCKSTEP_VERSION_PATCH);
}

}  // namespace lockstep

////////////////////////////////////////////////////////////////////////////////
// Copyright 2019-2024 Lawrence Livermore National Security, LLC and other
// DiHydrogen Project Developers. See the top-level LICENSE file for details.
//
// SPDX-License-Identifier: Apache-2.0
////////////////////////////////////////////////////////////////////////////////

#pragma once

/** @file
 *
 * Utilities to interface with environment variables.
 */

#include "lockstep/utils/strings.hpp"

#include <string>

namespace lockstep
{

/**
 * A note on environment variables:
 *
 * This provides an interface for getting environment variables and
 * coercing their value to a given type.
 *
 * The main operations are in the `env` namespace, and are meant for
 * accessing Lockstep-specific environment variables. The names of
 * these variables are always in uppercase and are prefixed with
 * "LOCKSTEP_" (this is done automatically). The value of these
 * variables is read once, on first access.
 *
 * These variables must be registered in `environment_vars.cpp`, which
 * keeps every variable and its default documented in one place.
 * Accessing an unregistered variable throws InvalidArgumentException.
 *
 * The "raw" interface (in the `env::raw` namespace) wraps the standard
 * calls directly. Names are not modified and values are not cached.
 */

namespace env
{

/**
 * Return true if the Lockstep environment variable name is set in the
 * environment.
 *
 * @note If the variable is not set, it will still have its default
 * value.
 */
bool exists(const std::string& name);

/**
 * Return the raw value (i.e., the exact string value of the variable)
 * of the Lockstep environment variable name.
 *
 * @note This may be the default value.
 */
std::string get_raw(const std::string& name);

/**
 * Return the value of the Lockstep environment variable name coerced
 * to the given type T via `from_string`.
 */
template <typename T>
inline T get(const std::string& name)
{
  return from_string<T>(get_raw(name));
}

namespace raw
{

/**
 * Return true if the environment variable name is set in the
 * environment.
 */
bool exists(const std::string& name);

/** Return the raw value of the environment variable name. */
std::string get_raw(const std::string& name);

/**
 * Return the environment variable name coerced to the given type T
 * via `from_string`.
 */
template <typename T>
inline T get(const std::string& name)
{
  return from_string<T>(get_raw(name));
}

}  // namespace raw

}  // namespace env

}  // namespace lockstep

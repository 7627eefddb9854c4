////////////////////////////////////////////////////////////////////////////////
// Copyright 2019-2024 Lawrence Livermore National Security, LLC and other
// DiHydrogen Project Developers. See the top-level LICENSE file for details.
//
// SPDX-License-Identifier: Apache-2.0
////////////////////////////////////////////////////////////////////////////////

#pragma once

#include <string>

/** @namespace lockstep
 *  @brief The main namespace for Lockstep.
 */

namespace lockstep
{
/** @brief Get the version string for Lockstep
 *  @returns A string of the format "MAJOR.MINOR.PATCH".
 */
std::string Version() noexcept;

} // namespace lockstep

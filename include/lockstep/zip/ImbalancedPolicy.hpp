////////////////////////////////////////////////////////////////////////////////
// Copyright 2019-2024 Lawrence Livermore National Security, LLC and other
// DiHydrogen Project Developers. See the top-level LICENSE file for details.
//
// SPDX-License-Identifier: Apache-2.0
////////////////////////////////////////////////////////////////////////////////

#pragma once

#include <ostream>
#include <string>

namespace lockstep
{

/**
 * How a zip handles inputs of unequal lengths.
 */
enum class ImbalancedPolicy
{
  /** The result ends when either input is exhausted. */
  Truncate = 0,
  /**
   * The result ends when both inputs are exhausted. The shorter input
   * is padded with value-initialized elements.
   */
  Pad = 1,
  /**
   * SequenceLengthMismatchException is thrown when one input is
   * exhausted but not the other.
   */
  Fail = 2
};

/** Which input of a zip ran out of elements first. */
enum class ExhaustedSide
{
  First,
  Second
};

std::string to_string(ImbalancedPolicy policy);
std::string to_string(ExhaustedSide side);

/**
 * Parse a policy name ("Truncate", "Pad", "Fail"), ignoring case.
 *
 * @throws InvalidArgumentException for any other name.
 */
ImbalancedPolicy policy_from_string(std::string const& name);

inline std::ostream& operator<<(std::ostream& os, ImbalancedPolicy policy)
{
  return os << to_string(policy);
}

inline std::ostream& operator<<(std::ostream& os, ExhaustedSide side)
{
  return os << to_string(side);
}

}  // namespace lockstep

////////////////////////////////////////////////////////////////////////////////
// Copyright 2019-2024 Lawrence Livermore National Security, LLC and other
// DiHydrogen Project Developers. See the top-level LICENSE file for details.
//
// SPDX-License-Identifier: Apache-2.0
////////////////////////////////////////////////////////////////////////////////

#include "lockstep/zip/ImbalancedPolicy.hpp"

#include "lockstep/utils/Error.hpp"
#include "lockstep/utils/strings.hpp"

namespace lockstep
{

std::string to_string(ImbalancedPolicy policy)
{
  switch (policy)
  {
  case ImbalancedPolicy::Truncate:
    return "Truncate";
  case ImbalancedPolicy::Pad:
    return "Pad";
  case ImbalancedPolicy::Fail:
    return "Fail";
  }
  throw LockstepFatalException("Unknown ImbalancedPolicy ",
                               static_cast<int>(policy));
}

std::string to_string(ExhaustedSide side)
{
  switch (side)
  {
  case ExhaustedSide::First:
    return "First";
  case ExhaustedSide::Second:
    return "Second";
  }
  throw LockstepFatalException("Unknown ExhaustedSide ",
                               static_cast<int>(side));
}

ImbalancedPolicy policy_from_string(std::string const& name)
{
  std::string const lower = str_tolower(name);
  if (lower == "truncate")
  {
    return ImbalancedPolicy::Truncate;
  }
  else if (lower == "pad")
  {
    return ImbalancedPolicy::Pad;
  }
  else if (lower == "fail")
  {
    return ImbalancedPolicy::Fail;
  }
  throw InvalidArgumentException("Unknown imbalanced policy: ", name);
}

}  // namespace lockstep

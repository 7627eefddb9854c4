////////////////////////////////////////////////////////////////////////////////
// Copyright 2019-2024 Lawrence Livermore National Security, LLC and other
// DiHydrogen Project Developers. See the top-level LICENSE file for details.
//
// SPDX-License-Identifier: Apache-2.0
////////////////////////////////////////////////////////////////////////////////

#include <catch2/catch_test_macros.hpp>

#include "lockstep_config.hpp"
#include "lockstep/Version.hpp"

using namespace lockstep;

// gotta get that coverage
TEST_CASE("Version", "[version][core]")
{
    REQUIRE(Version() == LOCKSTEP_VERSION);
}

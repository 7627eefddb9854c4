////////////////////////////////////////////////////////////////////////////////
// Copyright 2019-2024 Lawrence Livermore National Security, LLC and other
// DiHydrogen Project Developers. See the top-level LICENSE file for details.
//
// SPDX-License-Identifier: Apache-2.0
////////////////////////////////////////////////////////////////////////////////

#include <catch2/catch_test_macros.hpp>

#include "lockstep/utils/strings.hpp"
#include "lockstep/zip/ImbalancedPolicy.hpp"

#include <string>

using namespace lockstep;

TEST_CASE("build_string concatenates its arguments", "[utilities][strings]")
{
  CHECK(build_string() == "");
  CHECK(build_string("", "") == "");
  CHECK(build_string("Argument '", std::string("first"), "'")
        == "Argument 'first'");
  CHECK(build_string("after ", 3, " elements") == "after 3 elements");
  CHECK(build_string("(", ImbalancedPolicy::Pad, ")") == "(Pad)");
}

TEST_CASE("Case conversion", "[utilities][strings]")
{
  CHECK(str_toupper("Warning") == "WARNING");
  CHECK(str_toupper("") == "");
  CHECK(str_tolower("TrUnCaTe") == "truncate");
  CHECK(str_tolower("log_level 2") == "log_level 2");
}

TEST_CASE("from_string parses flags", "[utilities][strings]")
{
  CHECK(from_string<bool>("true"));
  CHECK(from_string<bool>("TRUE"));
  CHECK(from_string<bool>("1"));
  CHECK(from_string<bool>("-3"));
  CHECK_FALSE(from_string<bool>("False"));
  CHECK_FALSE(from_string<bool>("0"));
  CHECK_THROWS(from_string<bool>(""));
  CHECK_THROWS(from_string<bool>("yes"));
}

////////////////////////////////////////////////////////////////////////////////
// Copyright 2019-2024 Lawrence Livermore National Security, LLC and other
// DiHydrogen Project Developers. See the top-level LICENSE file for details.
//
// SPDX-License-Identifier: Apache-2.0
////////////////////////////////////////////////////////////////////////////////

#include <catch2/catch_test_macros.hpp>

#include "lockstep/sequence/GeneratorSequence.hpp"
#include "lockstep/sequence/RangeSequence.hpp"
#include "lockstep/utils/Describable.hpp"
#include "lockstep/utils/strings.hpp"

#include <optional>
#include <sstream>
#include <string>
#include <vector>

TEST_CASE("Sequences describe themselves", "[utilities][describe]")
{
    auto vec = lockstep::from_vector(std::vector<int>{1, 2, 3});
    CHECK(vec->short_description() == "Vector<int>[3]");

    std::vector<std::string> const names = {"a"};
    CHECK(lockstep::from_container(names)->short_description()
          == "Range<std::string>");

    auto gen = lockstep::from_generator(lockstep::GeneratorFunction<double>(
        []() -> std::optional<double> { return std::nullopt; }));
    CHECK(gen->short_description() == "Generator<double>");
}

TEST_CASE("Descriptions can be streamed", "[utilities][describe]")
{
    auto seq = lockstep::from_values({1.5, 2.5});
    std::ostringstream oss;
    oss << *seq << "|" << *seq;
    CHECK(oss.str() == "Vector<double>[2]|Vector<double>[2]");
    CHECK(lockstep::build_string("in ", *seq) == "in Vector<double>[2]");
}

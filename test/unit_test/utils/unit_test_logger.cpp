////////////////////////////////////////////////////////////////////////////////
// Copyright 2019-2024 Lawrence Livermore National Security, LLC and other
// DiHydrogen Project Developers. See the top-level LICENSE file for details.
//
// SPDX-License-Identifier: Apache-2.0
////////////////////////////////////////////////////////////////////////////////

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include "lockstep/sequence/RangeSequence.hpp"
#include "lockstep/sequence/iteration.hpp"
#include "lockstep/utils/Error.hpp"
#include "lockstep/utils/environment_vars.hpp"
#include "lockstep/utils/logger.hpp"
#include "lockstep/zip/Zip.hpp"

#include <spdlog/sinks/ostream_sink.h>

#include <algorithm>
#include <functional>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

using namespace lockstep;

namespace
{

// Route the Lockstep logger into a string for the lifetime of the
// object, at the given level.
struct CaptureLog
{
  CaptureLog(spdlog::level::level_enum level)
    : sink(std::make_shared<spdlog::sinks::ostream_sink_mt>(out)),
      saved_level(logger().level())
  {
    sink->set_pattern("%l|%v");
    logger().sinks().push_back(sink);
    logger().set_level(level);
  }

  ~CaptureLog()
  {
    auto& sinks = logger().sinks();
    sinks.erase(std::remove(sinks.begin(), sinks.end(), sink), sinks.end());
    logger().set_level(saved_level);
  }

  std::string str()
  {
    logger().flush();
    return out.str();
  }

  std::ostringstream out;
  spdlog::sink_ptr sink;
  spdlog::level::level_enum saved_level;
};

}  // namespace

TEST_CASE("Level names are parsed", "[logging][utilities]")
{
  CHECK(log_level_from_string("TRACE") == spdlog::level::trace);
  CHECK(log_level_from_string("DEBUG") == spdlog::level::debug);
  CHECK(log_level_from_string("INFO") == spdlog::level::info);
  CHECK(log_level_from_string("WARN") == spdlog::level::warn);
  CHECK(log_level_from_string("WARNING") == spdlog::level::warn);
  CHECK(log_level_from_string("ERR") == spdlog::level::err);
  CHECK(log_level_from_string("ERROR") == spdlog::level::err);
  CHECK(log_level_from_string("CRITICAL") == spdlog::level::critical);
  CHECK(log_level_from_string("OFF") == spdlog::level::off);

  SECTION("Case is ignored")
  {
    CHECK(log_level_from_string("trace") == spdlog::level::trace);
    CHECK(log_level_from_string("Warn") == spdlog::level::warn);
    CHECK(log_level_from_string("off") == spdlog::level::off);
  }

  SECTION("Unknown names throw")
  {
    CHECK_THROWS_AS(log_level_from_string("TRSCE"), InvalidArgumentException);
    CHECK_THROWS_AS(log_level_from_string(""), InvalidArgumentException);
    try
    {
      log_level_from_string("verbose");
      FAIL("Expected InvalidArgumentException");
    }
    catch (InvalidArgumentException const& e)
    {
      CHECK_THAT(e.what(),
                 Catch::Matchers::StartsWith("Invalid log level: verbose"));
    }
  }
}

TEST_CASE("The logger is shared and registered", "[logging][utilities]")
{
  spdlog::logger& lg = logger();
  CHECK(lg.name() == "lockstep");
  CHECK(&logger() == &lg);
  CHECK(spdlog::get("lockstep").get() == &lg);
}

TEST_CASE("Zip traversals are logged", "[logging][utilities]")
{
  auto a = from_values({1, 2, 3});
  auto b = from_values({1});

  SECTION("Truncation is logged at debug level")
  {
    CaptureLog capture(spdlog::level::debug);
    REQUIRE(to_vector(zip(a, b, std::plus<int>())).size() == 1);
    auto const log = capture.str();
    CHECK_THAT(log, Catch::Matchers::ContainsSubstring("debug|"));
    CHECK_THAT(log, Catch::Matchers::ContainsSubstring("truncating"));
    CHECK_THAT(log, !Catch::Matchers::ContainsSubstring("trace|"));
  }

  SECTION("Cursor lifecycle is logged at trace level")
  {
    CaptureLog capture(spdlog::level::trace);
    REQUIRE(to_vector(zip_longest(a, b, std::plus<int>())).size() == 3);
    auto const log = capture.str();
    CHECK_THAT(log,
               Catch::Matchers::ContainsSubstring("acquired input cursors"));
    CHECK_THAT(log, Catch::Matchers::ContainsSubstring("padding"));
    CHECK_THAT(log, Catch::Matchers::ContainsSubstring("Exhausted after 3"));
  }

  SECTION("Nothing is logged above debug level")
  {
    CaptureLog capture(spdlog::level::info);
    REQUIRE(to_vector(zip(a, b, std::plus<int>())).size() == 1);
    CHECK(capture.str().empty());
  }
}

TEST_CASE("Log arguments are only built for enabled levels",
          "[logging][utilities]")
{
  int evaluated = 0;
  auto count = [&evaluated]() { return ++evaluated; };

  CaptureLog capture(spdlog::level::warn);
  LOCKSTEP_TRACE("trace {}", count());
  LOCKSTEP_DEBUG("debug {}", count());
  CHECK(evaluated == 0);
  LOCKSTEP_WARN("warn {}", count());
  CHECK(evaluated == 1);
  CHECK_THAT(capture.str(), Catch::Matchers::ContainsSubstring("warn|warn 1"));
}

TEST_CASE("Loggers are built without throwing on bad configuration",
          "[logging][utilities]")
{
  SECTION("Unknown level names fall back to warn")
  {
    auto lg = internal::get_or_make_logger("lockstep_bad_level", "verbose");
    CHECK(lg->level() == spdlog::level::warn);
    spdlog::drop("lockstep_bad_level");
  }

  SECTION("Known level names are applied")
  {
    auto lg = internal::get_or_make_logger("lockstep_debug_level", "Debug");
    CHECK(lg->level() == spdlog::level::debug);
    spdlog::drop("lockstep_debug_level");
  }

  SECTION("An already registered logger is reused")
  {
    auto first = internal::get_or_make_logger("lockstep_reused", "info");
    std::shared_ptr<spdlog::logger> second;
    REQUIRE_NOTHROW(
      second = internal::get_or_make_logger("lockstep_reused", "trace"));
    CHECK(second == first);
    CHECK(second->level() == spdlog::level::info);
    spdlog::drop("lockstep_reused");
  }
}

// Also run by CTest with LOCKSTEP_LOG_LEVEL set to an unknown name.
TEST_CASE("Any LOCKSTEP_LOG_LEVEL leaves traversal working",
          "[logging][log_level]")
{
  auto zipped = zip(from_values({1, 2}), from_values({3, 4}), std::plus<int>());
  REQUIRE(to_vector(zipped) == std::vector<int>{4, 6});
  REQUIRE(to_vector(equi_zip(from_values({1}), from_values({2}),
                             std::plus<int>()))
          == std::vector<int>{3});

  std::string const level = env::get_raw("LOG_LEVEL");
  bool known = true;
  try
  {
    (void) log_level_from_string(level);
  }
  catch (InvalidArgumentException const&)
  {
    known = false;
  }
  if (!known && !env::raw::exists("SPDLOG_LEVEL"))
  {
    CHECK(logger().level() == spdlog::level::warn);
  }
}

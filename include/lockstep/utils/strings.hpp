////////////////////////////////////////////////////////////////////////////////
// Copyright 2019-2024 Lawrence Livermore National Security, LLC and other
// DiHydrogen Project Developers. See the top-level LICENSE file for details.
//
// SPDX-License-Identifier: Apache-2.0
////////////////////////////////////////////////////////////////////////////////

#pragma once

/** @file
 *
 * String helpers for messages and configuration values.
 */

#include <algorithm>
#include <cctype>
#include <sstream>
#include <string>
#include <utility>

namespace lockstep
{

/**
 * Concatenate the stream output of every argument.
 *
 * Used to build exception messages and descriptions.
 */
template <typename... Args>
inline std::string build_string(Args&&... args)
{
  std::ostringstream ss;
  (ss << ... << std::forward<Args>(args));
  return ss.str();
}

namespace internal
{

template <typename CharMap>
inline std::string map_chars(std::string str, CharMap map)
{
  std::transform(str.begin(), str.end(), str.begin(), [&](unsigned char c) {
    return static_cast<char>(map(c));
  });
  return str;
}

}  // namespace internal

inline std::string str_toupper(std::string str)
{
  return internal::map_chars(std::move(str),
                             [](unsigned char c) { return std::toupper(c); });
}

inline std::string str_tolower(std::string str)
{
  return internal::map_chars(std::move(str),
                             [](unsigned char c) { return std::tolower(c); });
}

/**
 * Convert a configuration value to type T.
 *
 * Only the types Lockstep reads from its environment are provided.
 */
template <typename T>
T from_string(const std::string& str);

/**
 * "true" and "false" in any case, or an integer (non-zero is true).
 *
 * @throws std::invalid_argument for anything else, including "".
 */
template <>
inline bool from_string<bool>(const std::string& str)
{
  std::string const lower = str_tolower(str);
  if (lower == "true")
  {
    return true;
  }
  if (lower == "false")
  {
    return false;
  }
  return std::stoll(str) != 0;
}

} // namespace lockstep

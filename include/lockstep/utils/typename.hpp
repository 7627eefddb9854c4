////////////////////////////////////////////////////////////////////////////////
// Copyright 2019-2024 Lawrence Livermore National Security, LLC and other
// DiHydrogen Project Developers. See the top-level LICENSE file for details.
//
// SPDX-License-Identifier: Apache-2.0
////////////////////////////////////////////////////////////////////////////////

#pragma once

/** @file
 *
 * Readable type names for sequence descriptions and log messages.
 */

#include <string>
#include <string_view>
#include <typeinfo>

namespace lockstep
{

namespace internal
{
/** Demangle an ABI symbol name, or return it unchanged on failure. */
std::string demangle(char const* symbol);

/** Demangled name of a type, or the raw name if demangling fails. */
inline std::string get_type_name(std::type_info const& tinfo)
{
  return demangle(tinfo.name());
}
}  // namespace internal

template <typename T>
inline std::string TypeName()
{
  return internal::get_type_name(typeid(T));
}

// The demangled library names expose ABI details
// (std::__cxx11::basic_string<char, ...>).
template <>
inline std::string TypeName<std::string>()
{
  return "std::string";
}

template <>
inline std::string TypeName<std::string_view>()
{
  return "std::string_view";
}

}  // namespace lockstep

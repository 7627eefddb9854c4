////////////////////////////////////////////////////////////////////////////////
// Copyright 2019-2024 Lawrence Livermore National Security, LLC and other
// DiHydrogen Project Developers. See the top-level LICENSE file for details.
//
// SPDX-License-Identifier: Apache-2.0
////////////////////////////////////////////////////////////////////////////////

#include "lockstep/utils/typename.hpp"

#include <cstdlib>
#include <memory>

#if __has_include(<cxxabi.h>)
#include <cxxabi.h>
#define LOCKSTEP_HAS_CXXABI_H
#endif

std::string lockstep::internal::demangle(char const* symbol)
{
#ifdef LOCKSTEP_HAS_CXXABI_H
  int status = 0;
  std::unique_ptr<char, void (*)(void*)> demangled{
    abi::__cxa_demangle(symbol, nullptr, nullptr, &status), std::free};
  if (status == 0 && demangled)
  {
    return demangled.get();
  }
#endif
  return symbol;
}

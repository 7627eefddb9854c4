////////////////////////////////////////////////////////////////////////////////
// Copyright 2019-2024 Lawrence Livermore National Security, LLC and other
// DiHydrogen Project Developers. See the top-level LICENSE file for details.
//
// SPDX-License-Identifier: Apache-2.0
////////////////////////////////////////////////////////////////////////////////

#include <lockstep_config.hpp>
#include <lockstep/utils/Error.hpp>

#include <lockstep/utils/typename.hpp>

#include <dlfcn.h>
#include <execinfo.h>

#include <cstdlib>
#include <iomanip>
#include <memory>
#include <sstream>

#ifndef LOCKSTEP_DEBUG
#include "lockstep/utils/environment_vars.hpp"
#endif

namespace
{

// One line per frame: "  3: lockstep::Foo::bar()".
std::string collect_backtrace(const std::string& what_arg)
{
  constexpr int max_frames = 128;
  void* frames[max_frames];
  int const num_frames = backtrace(frames, max_frames);
  std::unique_ptr<char*, void (*)(void*)> symbols{
    backtrace_symbols(frames, num_frames), std::free};

  std::ostringstream ss;
  ss << what_arg << "\nStack trace:\n";
  for (int i = 0; i < num_frames; ++i)
  {
    ss << std::setw(4) << i << ": ";
    // backtrace_symbols gives "binary(symbol+off)", so ask dladdr for
    // the bare symbol instead.
    Dl_info info;
    if (dladdr(frames[i], &info) != 0 && info.dli_sname != nullptr)
    {
      ss << lockstep::internal::demangle(info.dli_sname);
    }
    else if (symbols)
    {
      ss << symbols.get()[i];
    }
    else
    {
      ss << "??";
    }
    ss << "\n";
  }
  return ss.str();
}

}  // namespace

bool LockstepExceptionBase::should_save_backtrace() const
{
#ifdef LOCKSTEP_DEBUG
  return true;  // Always save backtraces in debug mode.
#else
  return lockstep::env::get<bool>("DEBUG_BACKTRACE");
#endif
}

void LockstepExceptionBase::set_what_and_maybe_collect_backtrace(
  const std::string& what_arg, bool collect_bt)
{
  if (collect_bt)
  {
    what_ = std::make_shared<std::string>(collect_backtrace(what_arg));
  }
  else
  {
    what_ = std::make_shared<std::string>(what_arg);
  }
}

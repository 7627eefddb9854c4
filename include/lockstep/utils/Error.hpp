////////////////////////////////////////////////////////////////////////////////
// Copyright 2019-2024 Lawrence Livermore National Security, LLC and other
// DiHydrogen Project Developers. See the top-level LICENSE file for details.
//
// SPDX-License-Identifier: Apache-2.0
////////////////////////////////////////////////////////////////////////////////

#ifndef LOCKSTEP_UTILS_ERROR_HPP_
#define LOCKSTEP_UTILS_ERROR_HPP_

#include <lockstep_config.hpp>

#include <exception>
#include <memory>
#include <string>

#include "lockstep/utils/strings.hpp"

/** @file Error.hpp
 *
 *  A collection of macros and other simple constructs for reporting
 *  and handling errors.
 */

/** @def LOCKSTEP_DEFINE_FORWARDING_EXCEPTION(name, parent)
 *  @brief Define a class that forwards all arguments to its parent.
 *
 *  The arguments are concatenated with `build_string` before being
 *  handed to the parent.
 *
 *  @param name The name of the new class.
 *  @param parent The name of the parent class.
 */
#define LOCKSTEP_DEFINE_FORWARDING_EXCEPTION(name, parent)                     \
  class name : public parent                                                   \
  {                                                                            \
  public:                                                                      \
    /* @brief Constructor */                                                   \
    template <typename... Ts>                                                  \
    name(Ts&&... args)                                                         \
      : parent(lockstep::build_string(std::forward<Ts>(args)...))              \
    {}                                                                         \
  }

/** Save a backtrace when constructing an exception. */
static constexpr struct save_backtrace_t {} SaveBacktrace;
/** Do not save a backtrace when constructing an exception. */
static constexpr struct no_save_backtrace_t {} NoSaveBacktrace;

/**
 * Base class for Lockstep exceptions.
 *
 * A stack trace may optionally be recorded.
 *
 * @warning Do not attempt to use this in a signal handler.
 */
class LockstepExceptionBase : public std::exception
{
public:
  LockstepExceptionBase(const std::string& what_arg)
  {
    set_what_and_maybe_collect_backtrace(what_arg, should_save_backtrace());
  }

  LockstepExceptionBase(const char* what_arg)
    : LockstepExceptionBase(std::string(what_arg))
  {}

  LockstepExceptionBase(const std::string& what_arg, save_backtrace_t)
  {
    set_what_and_maybe_collect_backtrace(what_arg, true);
  }

  LockstepExceptionBase(const std::string& what_arg, no_save_backtrace_t)
  {
    set_what_and_maybe_collect_backtrace(what_arg, false);
  }

  LockstepExceptionBase(const LockstepExceptionBase& other) noexcept
    : what_(other.what_)
  {}

  LockstepExceptionBase& operator=(const LockstepExceptionBase& other) noexcept
  {
    what_ = other.what_;
    return *this;
  }

  virtual ~LockstepExceptionBase() {}

  virtual const char* what() const noexcept { return what_->c_str(); }

private:
  /**
   * Error message, possibly with a backtrace.
   *
   * This is wrapped in a shared_ptr so copying the exception never
   * copies the string.
   */
  std::shared_ptr<std::string> what_;

  /** Whether to save a backtrace if not explicitly requested. */
  bool should_save_backtrace() const;

  /** Set up what_ and maybe collect a backtrace. */
  void set_what_and_maybe_collect_backtrace(const std::string& what_arg,
                                            bool collect_bt);
};

/** Any non-recoverable error. */
class LockstepFatalException : public LockstepExceptionBase
{
public:
  template <typename... Args>
  LockstepFatalException(Args&&... args)
    : LockstepExceptionBase(lockstep::build_string(std::forward<Args>(args)...),
                            SaveBacktrace)
  {}
};

/**
 * A potentially recoverable error.
 *
 * Collects a backtrace in debug mode or when the
 * LOCKSTEP_DEBUG_BACKTRACE env var is set.
 */
LOCKSTEP_DEFINE_FORWARDING_EXCEPTION(LockstepNonfatalException,
                                     LockstepExceptionBase);

/** An argument passed to a function was not acceptable. */
LOCKSTEP_DEFINE_FORWARDING_EXCEPTION(InvalidArgumentException,
                                     LockstepNonfatalException);

/** An operation is not valid in the object's current state. */
LOCKSTEP_DEFINE_FORWARDING_EXCEPTION(InvalidOperationException,
                                     LockstepNonfatalException);

/**
 * A required argument was absent (a null pointer or an empty
 * callable).
 */
class NullArgumentException : public InvalidArgumentException
{
public:
  explicit NullArgumentException(std::string param_name)
    : InvalidArgumentException("Argument '", param_name, "' must not be null"),
      param_name_(std::move(param_name))
  {}

  /** Name of the offending parameter. */
  const std::string& param_name() const noexcept { return param_name_; }

private:
  std::string param_name_;
};

/** @def LOCKSTEP_ASSERT(cond, excptn, msg)
 *  @brief Check that the condition is true and throw an exception if
 *         not.
 *
 *  @param cond The condition to test. Must be a boolean value.
 *  @param excptn The exception to throw if `cond` evaluates to
 *                `false`.
 *  @param ... The arguments to pass to the exception.
 */
#define LOCKSTEP_ASSERT(cond, excptn, ...)                                     \
    do                                                                         \
    {                                                                          \
        if (!(cond))                                                           \
        {                                                                      \
            throw excptn(__VA_ARGS__);                                         \
        }                                                                      \
    } while (0)

#endif // LOCKSTEP_UTILS_ERROR_HPP_

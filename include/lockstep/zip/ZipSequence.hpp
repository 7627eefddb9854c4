////////////////////////////////////////////////////////////////////////////////
// Copyright 2019-2024 Lawrence Livermore National Security, LLC and other
// DiHydrogen Project Developers. See the top-level LICENSE file for details.
//
// SPDX-License-Identifier: Apache-2.0
////////////////////////////////////////////////////////////////////////////////

#pragma once

/** @file
 *
 * The lockstep traversal shared by all zip variants.
 */

#include "lockstep/sequence/Sequence.hpp"
#include "lockstep/utils/Error.hpp"
#include "lockstep/utils/logger.hpp"
#include "lockstep/utils/typename.hpp"
#include "lockstep/zip/ImbalancedPolicy.hpp"

#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <type_traits>
#include <utility>

namespace lockstep
{

/**
 * Raised by a Fail-policy zip when one input runs out before the
 * other.
 */
class SequenceLengthMismatchException : public InvalidOperationException
{
public:
  explicit SequenceLengthMismatchException(ExhaustedSide exhausted)
    : InvalidOperationException(exhausted == ExhaustedSide::First
                                  ? "First sequence ran out before second"
                                  : "Second sequence ran out before first"),
      exhausted_side_(exhausted)
  {}

  /** The input that was exhausted while the other still had elements. */
  ExhaustedSide exhausted_side() const noexcept { return exhausted_side_; }

private:
  ExhaustedSide exhausted_side_;
};

/** Lifecycle of one zip traversal. */
enum class ZipState
{
  NotStarted,
  Running,
  Exhausted,
  Failed
};

inline std::string to_string(ZipState state)
{
  switch (state)
  {
  case ZipState::NotStarted:
    return "NotStarted";
  case ZipState::Running:
    return "Running";
  case ZipState::Exhausted:
    return "Exhausted";
  case ZipState::Failed:
    return "Failed";
  }
  return build_string("ZipState(", static_cast<int>(state), ")");
}

inline std::ostream& operator<<(std::ostream& os, ZipState state)
{
  return os << to_string(state);
}

/** Function combining one element of each input into a result. */
template <typename TFirst, typename TSecond, typename TResult>
using Combiner = std::function<TResult(TFirst const&, TSecond const&)>;

namespace internal
{

template <typename TFirst, typename TSecond, typename TResult>
std::string zip_description(ImbalancedPolicy policy)
{
  return build_string("Zip<",
                      TypeName<TFirst>(),
                      ", ",
                      TypeName<TSecond>(),
                      " -> ",
                      TypeName<TResult>(),
                      ">(",
                      policy,
                      ")");
}

/** Placeholder for the missing side of a padded pair. */
template <typename T>
T padding_value()
{
  if constexpr (std::is_default_constructible_v<T>)
  {
    return T{};
  }
  else
  {
    throw LockstepFatalException("Cannot pad a sequence of ",
                                 TypeName<T>(),
                                 ": the type is not default constructible");
  }
}

}  // namespace internal

/**
 * Cursor over the combined elements of two sequences.
 *
 * The input cursors are acquired on the first call to `move_next` and
 * released as soon as the traversal reaches a terminal state, whether
 * by exhaustion, by an imbalance under the Fail policy, or by an
 * exception from an input or the combiner. Destroying the cursor
 * releases them as well.
 */
template <typename TFirst, typename TSecond, typename TResult>
class ZipCursor final : public Cursor<TResult>
{
public:
  using combiner_type = Combiner<TFirst, TSecond, TResult>;

  ZipCursor(SequencePtr<TFirst> first,
            SequencePtr<TSecond> second,
            combiner_type combine,
            ImbalancedPolicy policy)
    : first_seq_(std::move(first)),
      second_seq_(std::move(second)),
      combine_(std::move(combine)),
      policy_(policy)
  {}

  bool move_next() override
  {
    if (state_ == ZipState::Exhausted || state_ == ZipState::Failed)
    {
      return false;
    }

    try
    {
      if (state_ == ZipState::NotStarted)
      {
        start();
      }
      return step();
    }
    catch (...)
    {
      release(ZipState::Failed);
      throw;
    }
  }

  TResult const& current() const override
  {
    LOCKSTEP_ASSERT(current_.has_value(),
                    InvalidOperationException,
                    "Cursor is not positioned on an element (state ",
                    state_,
                    ")");
    return *current_;
  }

  ZipState state() const noexcept { return state_; }
  ImbalancedPolicy policy() const noexcept { return policy_; }

  /** Number of elements produced so far. */
  std::size_t position() const noexcept { return position_; }

private:
  SequencePtr<TFirst> first_seq_;
  SequencePtr<TSecond> second_seq_;
  combiner_type combine_;
  ImbalancedPolicy policy_;

  std::unique_ptr<Cursor<TFirst>> first_;
  std::unique_ptr<Cursor<TSecond>> second_;
  std::optional<TResult> current_;
  /** Set once one input ran out under Pad; that side is padded. */
  std::optional<ExhaustedSide> padded_side_;
  ZipState state_ = ZipState::NotStarted;
  std::size_t position_ = 0;

  std::string description() const
  {
    return internal::zip_description<TFirst, TSecond, TResult>(policy_);
  }

  void start()
  {
    first_ = first_seq_->cursor();
    second_ = second_seq_->cursor();
    state_ = ZipState::Running;
    LOCKSTEP_TRACE("{}: acquired input cursors", description());
  }

  bool step()
  {
    if (padded_side_ == ExhaustedSide::Second)
    {
      if (first_->move_next())
      {
        return produce(first_->current(),
                       internal::padding_value<TSecond>());
      }
      return finish();
    }
    if (padded_side_ == ExhaustedSide::First)
    {
      if (second_->move_next())
      {
        return produce(internal::padding_value<TFirst>(),
                       second_->current());
      }
      return finish();
    }

    if (first_->move_next())
    {
      if (second_->move_next())
      {
        return produce(first_->current(), second_->current());
      }
      return imbalance(ExhaustedSide::Second);
    }
    if (!second_->move_next())
    {
      return finish();
    }
    return imbalance(ExhaustedSide::First);
  }

  /**
   * Handle one input running out while the other is positioned on an
   * element.
   */
  bool imbalance(ExhaustedSide exhausted)
  {
    switch (policy_)
    {
    case ImbalancedPolicy::Truncate:
      LOCKSTEP_DEBUG("{}: {} sequence ran out after {} elements, truncating",
                     description(),
                     to_string(exhausted),
                     position_);
      return finish();
    case ImbalancedPolicy::Fail:
      LOCKSTEP_DEBUG("{}: {} sequence ran out after {} elements",
                     description(),
                     to_string(exhausted),
                     position_);
      throw SequenceLengthMismatchException(exhausted);
    case ImbalancedPolicy::Pad:
      LOCKSTEP_DEBUG("{}: {} sequence ran out after {} elements, padding",
                     description(),
                     to_string(exhausted),
                     position_);
      padded_side_ = exhausted;
      if (exhausted == ExhaustedSide::Second)
      {
        return produce(first_->current(),
                       internal::padding_value<TSecond>());
      }
      return produce(internal::padding_value<TFirst>(), second_->current());
    }
    throw LockstepFatalException("Unknown ImbalancedPolicy ",
                                 static_cast<int>(policy_));
  }

  bool produce(TFirst const& a, TSecond const& b)
  {
    current_.emplace(combine_(a, b));
    ++position_;
    return true;
  }

  bool finish()
  {
    release(ZipState::Exhausted);
    return false;
  }

  void release(ZipState terminal)
  {
    first_.reset();
    second_.reset();
    current_.reset();
    state_ = terminal;
    LOCKSTEP_TRACE("{}: {} after {} elements, released input cursors",
                   description(),
                   to_string(terminal),
                   position_);
  }
};

/**
 * Lazy sequence combining two inputs element by element.
 *
 * Constructing the sequence only validates its arguments; each cursor
 * runs an independent traversal of both inputs.
 */
template <typename TFirst, typename TSecond, typename TResult>
class ZipSequence final : public Sequence<TResult>
{
public:
  using combiner_type = Combiner<TFirst, TSecond, TResult>;
  using cursor_type = ZipCursor<TFirst, TSecond, TResult>;

  /**
   * @throws NullArgumentException naming the first of `first`,
   * `second` and `combine` that is absent.
   * @throws InvalidArgumentException if `policy` is Pad and either
   * element type is not default constructible.
   */
  ZipSequence(SequencePtr<TFirst> first,
              SequencePtr<TSecond> second,
              combiner_type combine,
              ImbalancedPolicy policy)
    : first_(std::move(first)),
      second_(std::move(second)),
      combine_(std::move(combine)),
      policy_(policy)
  {
    LOCKSTEP_ASSERT(first_, NullArgumentException, "first");
    LOCKSTEP_ASSERT(second_, NullArgumentException, "second");
    LOCKSTEP_ASSERT(combine_, NullArgumentException, "combine");
    LOCKSTEP_ASSERT(policy_ != ImbalancedPolicy::Pad
                      || (std::is_default_constructible_v<TFirst>
                          && std::is_default_constructible_v<TSecond>),
                    InvalidArgumentException,
                    "Cannot pad ",
                    TypeName<TFirst>(),
                    " and ",
                    TypeName<TSecond>(),
                    ": both element types must be default constructible");
  }

  std::unique_ptr<Cursor<TResult>> cursor() const override
  {
    return zip_cursor();
  }

  /** Start a traversal, keeping access to its state. */
  std::unique_ptr<cursor_type> zip_cursor() const
  {
    return std::make_unique<cursor_type>(first_, second_, combine_, policy_);
  }

  void short_describe(std::ostream& os) const override
  {
    os << internal::zip_description<TFirst, TSecond, TResult>(policy_);
  }

  ImbalancedPolicy policy() const noexcept { return policy_; }

private:
  SequencePtr<TFirst> first_;
  SequencePtr<TSecond> second_;
  combiner_type combine_;
  ImbalancedPolicy policy_;
};

}  // namespace lockstep

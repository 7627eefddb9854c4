////////////////////////////////////////////////////////////////////////////////
// Copyright 2019-2024 Lawrence Livermore National Security, LLC and other
// DiHydrogen Project Developers. See the top-level LICENSE file for details.
//
// SPDX-License-Identifier: Apache-2.0
////////////////////////////////////////////////////////////////////////////////

#pragma once

/** @file
 *
 * Pull-based sequences and the cursors that traverse them.
 */

#include "lockstep/utils/Describable.hpp"

#include <memory>

namespace lockstep
{

/**
 * A forward-only position in a sequence.
 *
 * A freshly created cursor sits before the first element. Each call to
 * `move_next` advances by one element and reports whether there is one;
 * `current` is only valid after `move_next` returned true.
 *
 * Destroying the cursor releases whatever it holds on the underlying
 * sequence.
 */
template <typename T>
class Cursor
{
public:
  using value_type = T;

  virtual ~Cursor() = default;

  /** Advance to the next element. Returns false once exhausted. */
  virtual bool move_next() = 0;

  /**
   * The element the cursor is positioned on.
   *
   * @throws InvalidOperationException if the cursor is not positioned
   * on an element.
   */
  virtual T const& current() const = 0;
};

/**
 * An ordered sequence of elements of type T.
 *
 * Each call to `cursor` starts a new traversal. Whether more than one
 * traversal is supported depends on the concrete sequence.
 */
template <typename T>
class Sequence : public Describable
{
public:
  using value_type = T;
  using cursor_type = Cursor<T>;

  virtual ~Sequence() = default;

  /** Start a traversal of the sequence. */
  virtual std::unique_ptr<Cursor<T>> cursor() const = 0;
};

/** Shared handle to a sequence. A null handle is an absent sequence. */
template <typename T>
using SequencePtr = std::shared_ptr<Sequence<T> const>;

}  // namespace lockstep

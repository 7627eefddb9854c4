////////////////////////////////////////////////////////////////////////////////
// Copyright 2019-2024 Lawrence Livermore National Security, LLC and other
// DiHydrogen Project Developers. See the top-level LICENSE file for details.
//
// SPDX-License-Identifier: Apache-2.0
////////////////////////////////////////////////////////////////////////////////

#pragma once

/** @file
 *
 * Consuming sequences from ordinary C++ code.
 */

#include "lockstep/sequence/Sequence.hpp"
#include "lockstep/utils/Error.hpp"

#include <cstddef>
#include <iterator>
#include <memory>
#include <utility>
#include <vector>

namespace lockstep
{

/**
 * Input iterator driving a single cursor.
 *
 * Copies share the cursor, as with any input iterator only one of them
 * may be advanced. A default-constructed iterator is the end.
 */
template <typename T>
class CursorIterator
{
public:
  using iterator_category = std::input_iterator_tag;
  using value_type = T;
  using difference_type = std::ptrdiff_t;
  using pointer = T const*;
  using reference = T const&;

  CursorIterator() = default;

  explicit CursorIterator(std::unique_ptr<Cursor<T>> cursor)
    : m_cursor{std::move(cursor)}
  {
    advance();
  }

  reference operator*() const { return m_cursor->current(); }
  pointer operator->() const { return &m_cursor->current(); }

  CursorIterator& operator++()
  {
    advance();
    return *this;
  }

  void operator++(int) { advance(); }

  bool operator==(CursorIterator const& other) const noexcept
  {
    return m_cursor == other.m_cursor;
  }
  bool operator!=(CursorIterator const& other) const noexcept
  {
    return !(*this == other);
  }

private:
  std::shared_ptr<Cursor<T>> m_cursor;

  void advance()
  {
    // Drop the cursor as soon as it is exhausted so this compares equal
    // to the end iterator.
    if (m_cursor && !m_cursor->move_next())
    {
      m_cursor.reset();
    }
  }
};

/** A sequence viewed as a range for range-based for. */
template <typename T>
class CursorRange
{
public:
  explicit CursorRange(SequencePtr<T> seq) : m_seq{std::move(seq)}
  {
    LOCKSTEP_ASSERT(m_seq, NullArgumentException, "sequence");
  }

  /** Start a new traversal. */
  CursorIterator<T> begin() const { return CursorIterator<T>{m_seq->cursor()}; }
  CursorIterator<T> end() const { return CursorIterator<T>{}; }

private:
  SequencePtr<T> m_seq;
};

/**
 * Iterate over a sequence with range-based for.
 *
 * Leaving the loop early releases the underlying cursor.
 */
template <typename T>
CursorRange<T> each(SequencePtr<T> seq)
{
  return CursorRange<T>{std::move(seq)};
}

/** Run one full traversal of a sequence and collect its elements. */
template <typename T>
std::vector<T> to_vector(SequencePtr<T> const& seq)
{
  LOCKSTEP_ASSERT(seq, NullArgumentException, "sequence");
  std::vector<T> values;
  auto cursor = seq->cursor();
  while (cursor->move_next())
  {
    values.push_back(cursor->current());
  }
  return values;
}

}  // namespace lockstep

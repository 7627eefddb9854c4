////////////////////////////////////////////////////////////////////////////////
// Copyright 2019-2024 Lawrence Livermore National Security, LLC and other
// DiHydrogen Project Developers. See the top-level LICENSE file for details.
//
// SPDX-License-Identifier: Apache-2.0
////////////////////////////////////////////////////////////////////////////////

#pragma once

#include "lockstep/sequence/Sequence.hpp"
#include "lockstep/sequence/iteration.hpp"
#include "lockstep/utils/Error.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

// Counters shared by every cursor of a TrackingSequence.
struct CursorStats
{
  std::size_t acquired = 0;
  std::size_t released = 0;
  std::size_t advances = 0;

  std::size_t live() const { return acquired - released; }
};

template <typename T>
class TrackingCursor final : public lockstep::Cursor<T>
{
public:
  TrackingCursor(std::vector<T> const& values_,
                 std::shared_ptr<CursorStats> stats_)
    : values(values_), stats(std::move(stats_))
  {
    ++stats->acquired;
  }

  ~TrackingCursor() { ++stats->released; }

  bool move_next() override
  {
    ++stats->advances;
    if (next == values.size())
    {
      has_current = false;
      return false;
    }
    current_index = next++;
    has_current = true;
    return true;
  }

  T const& current() const override
  {
    LOCKSTEP_ASSERT(has_current,
                    InvalidOperationException,
                    "TrackingCursor is not positioned on an element");
    return values[current_index];
  }

private:
  std::vector<T> const& values;
  std::shared_ptr<CursorStats> stats;
  std::size_t next = 0;
  std::size_t current_index = 0;
  bool has_current = false;
};

// A multi-pass sequence that records how its cursors are used.
template <typename T>
class TrackingSequence final : public lockstep::Sequence<T>
{
public:
  explicit TrackingSequence(std::vector<T> values_)
    : values(std::move(values_)), stats(std::make_shared<CursorStats>())
  {}

  std::unique_ptr<lockstep::Cursor<T>> cursor() const override
  {
    return std::make_unique<TrackingCursor<T>>(values, stats);
  }

  void short_describe(std::ostream& os) const override
  {
    os << "Tracking[" << values.size() << "]";
  }

  std::vector<T> values;
  std::shared_ptr<CursorStats> stats;
};

template <typename T>
std::shared_ptr<TrackingSequence<T>> make_tracking(std::vector<T> values)
{
  return std::make_shared<TrackingSequence<T>>(std::move(values));
}

template <typename T>
lockstep::SequencePtr<T> as_seq(std::shared_ptr<TrackingSequence<T>> const& seq)
{
  return seq;
}

// Pull at most n elements through a fresh cursor.
template <typename T>
std::vector<T> take(lockstep::SequencePtr<T> const& seq, std::size_t n)
{
  std::vector<T> values;
  auto cursor = seq->cursor();
  while (values.size() < n && cursor->move_next())
  {
    values.push_back(cursor->current());
  }
  return values;
}

inline std::string concat(int n, std::string const& s)
{
  return std::to_string(n) + s;
}

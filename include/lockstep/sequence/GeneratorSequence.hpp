////////////////////////////////////////////////////////////////////////////////
// Copyright 2019-2024 Lawrence Livermore National Security, LLC and other
// DiHydrogen Project Developers. See the top-level LICENSE file for details.
//
// SPDX-License-Identifier: Apache-2.0
////////////////////////////////////////////////////////////////////////////////

#pragma once

/** @file
 *
 * Single-pass sequences produced by a generator function.
 */

#include "lockstep/sequence/Sequence.hpp"
#include "lockstep/utils/Error.hpp"
#include "lockstep/utils/typename.hpp"

#include <functional>
#include <memory>
#include <optional>
#include <utility>

namespace lockstep
{

/** Function producing the next element, or nullopt when done. */
template <typename T>
using GeneratorFunction = std::function<std::optional<T>()>;

template <typename T>
class GeneratorCursor final : public Cursor<T>
{
public:
  explicit GeneratorCursor(GeneratorFunction<T> generator)
    : m_generator{std::move(generator)}
  {}

  bool move_next() override
  {
    if (!m_generator)
    {
      return false;
    }
    m_current = m_generator();
    if (!m_current)
    {
      // Never call the generator again once it reported the end.
      m_generator = nullptr;
      return false;
    }
    return true;
  }

  T const& current() const override
  {
    LOCKSTEP_ASSERT(m_current.has_value(),
                    InvalidOperationException,
                    "Cursor is not positioned on an element");
    return *m_current;
  }

private:
  GeneratorFunction<T> m_generator;
  std::optional<T> m_current;
};

/**
 * A stream that can be traversed exactly once.
 *
 * The generator is handed to the first cursor; asking for a second
 * cursor throws InvalidOperationException.
 */
template <typename T>
class GeneratorSequence final : public Sequence<T>
{
public:
  explicit GeneratorSequence(GeneratorFunction<T> generator)
    : m_generator{std::move(generator)}
  {
    LOCKSTEP_ASSERT(m_generator, NullArgumentException, "generator");
  }

  std::unique_ptr<Cursor<T>> cursor() const override
  {
    LOCKSTEP_ASSERT(!m_traversed,
                    InvalidOperationException,
                    "Single-pass sequence ",
                    this->short_description(),
                    " has already been traversed");
    m_traversed = true;
    return std::make_unique<GeneratorCursor<T>>(std::move(m_generator));
  }

  void short_describe(std::ostream& os) const override
  {
    os << "Generator<" << TypeName<T>() << ">";
  }

  /** Whether the single traversal has been started. */
  bool traversed() const noexcept { return m_traversed; }

private:
  mutable GeneratorFunction<T> m_generator;
  mutable bool m_traversed = false;
};

/** Make a single-pass sequence from a generator function. */
template <typename T>
SequencePtr<T> from_generator(GeneratorFunction<T> generator)
{
  return std::make_shared<GeneratorSequence<T>>(std::move(generator));
}

}  // namespace lockstep

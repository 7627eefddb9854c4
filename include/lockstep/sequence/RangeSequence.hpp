////////////////////////////////////////////////////////////////////////////////
// Copyright 2019-2024 Lawrence Livermore National Security, LLC and other
// DiHydrogen Project Developers. See the top-level LICENSE file for details.
//
// SPDX-License-Identifier: Apache-2.0
////////////////////////////////////////////////////////////////////////////////

#pragma once

/** @file
 *
 * Multi-pass sequences over standard containers and iterator ranges.
 */

#include "lockstep/sequence/Sequence.hpp"
#include "lockstep/utils/Error.hpp"
#include "lockstep/utils/typename.hpp"

#include <initializer_list>
#include <iterator>
#include <memory>
#include <type_traits>
#include <utility>
#include <vector>

namespace lockstep
{

/**
 * Cursor over a half-open range of forward iterators.
 *
 * The cursor may share ownership of the storage behind the iterators
 * so it stays valid after the sequence that created it is gone.
 */
template <typename IteratorT>
class IteratorCursor final
  : public Cursor<typename std::iterator_traits<IteratorT>::value_type>
{
public:
  using value_type = typename std::iterator_traits<IteratorT>::value_type;

  static_assert(
    std::is_base_of_v<std::forward_iterator_tag,
                      typename std::iterator_traits<IteratorT>::iterator_category>,
    "IteratorCursor requires forward iterators");

  IteratorCursor(IteratorT begin,
                 IteratorT end,
                 std::shared_ptr<void const> storage = nullptr)
    : m_next{std::move(begin)},
      m_current{m_next},
      m_end{std::move(end)},
      m_storage{std::move(storage)}
  {}

  bool move_next() override
  {
    if (m_next == m_end)
    {
      m_has_current = false;
      return false;
    }
    m_current = m_next;
    ++m_next;
    m_has_current = true;
    return true;
  }

  value_type const& current() const override
  {
    LOCKSTEP_ASSERT(m_has_current,
                    InvalidOperationException,
                    "Cursor is not positioned on an element");
    return *m_current;
  }

private:
  IteratorT m_next;
  IteratorT m_current;
  IteratorT m_end;
  std::shared_ptr<void const> m_storage;
  bool m_has_current = false;
};

/**
 * Non-owning view over an iterator range.
 *
 * The range must outlive the sequence and every cursor over it.
 */
template <typename IteratorT>
class IteratorSequence final
  : public Sequence<typename std::iterator_traits<IteratorT>::value_type>
{
public:
  using value_type = typename std::iterator_traits<IteratorT>::value_type;

  IteratorSequence(IteratorT begin, IteratorT end)
    : m_begin{std::move(begin)}, m_end{std::move(end)}
  {}

  std::unique_ptr<Cursor<value_type>> cursor() const override
  {
    return std::make_unique<IteratorCursor<IteratorT>>(m_begin, m_end);
  }

  void short_describe(std::ostream& os) const override
  {
    os << "Range<" << TypeName<value_type>() << ">";
  }

private:
  IteratorT m_begin;
  IteratorT m_end;
};

/** Sequence that owns its elements. */
template <typename T>
class VectorSequence final : public Sequence<T>
{
public:
  explicit VectorSequence(std::vector<T> values)
    : m_values{std::make_shared<std::vector<T> const>(std::move(values))}
  {}

  std::unique_ptr<Cursor<T>> cursor() const override
  {
    using iterator = typename std::vector<T>::const_iterator;
    return std::make_unique<IteratorCursor<iterator>>(
      m_values->cbegin(), m_values->cend(), m_values);
  }

  void short_describe(std::ostream& os) const override
  {
    os << "Vector<" << TypeName<T>() << ">[" << m_values->size() << "]";
  }

  std::size_t size() const noexcept { return m_values->size(); }

private:
  std::shared_ptr<std::vector<T> const> m_values;
};

/** Make an owning sequence from a vector of values. */
template <typename T>
SequencePtr<T> from_vector(std::vector<T> values)
{
  return std::make_shared<VectorSequence<T>>(std::move(values));
}

/** Make an owning sequence from a list of values. */
template <typename T>
SequencePtr<T> from_values(std::initializer_list<T> values)
{
  return from_vector(std::vector<T>(values));
}

/**
 * Make a non-owning sequence over [begin, end).
 *
 * The caller keeps the underlying range alive.
 */
template <typename IteratorT>
SequencePtr<typename std::iterator_traits<IteratorT>::value_type>
from_iterators(IteratorT begin, IteratorT end)
{
  return std::make_shared<IteratorSequence<IteratorT>>(std::move(begin),
                                                       std::move(end));
}

/** Make a non-owning sequence over a container. */
template <typename ContainerT>
auto from_container(ContainerT const& container)
{
  return from_iterators(std::cbegin(container), std::cend(container));
}

}  // namespace lockstep

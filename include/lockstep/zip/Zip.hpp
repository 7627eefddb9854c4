////////////////////////////////////////////////////////////////////////////////
// Copyright 2019-2024 Lawrence Livermore National Security, LLC and other
// DiHydrogen Project Developers. See the top-level LICENSE file for details.
//
// SPDX-License-Identifier: Apache-2.0
////////////////////////////////////////////////////////////////////////////////

#pragma once

/** @file
 *
 * Combine two sequences element by element.
 *
 * All variants return a lazy sequence: nothing is read from either
 * input until the result is traversed, and each traversal reads only
 * as far as the consumer asks. They differ only in what happens when
 * one input is shorter than the other:
 *
 * | Function      | Policy   | Unequal lengths                        |
 * |---------------|----------|----------------------------------------|
 * | `zip`         | Truncate | Stops at the end of the shorter input  |
 * | `equi_zip`    | Fail     | Throws SequenceLengthMismatchException |
 * | `zip_longest` | Pad      | Pads the shorter input with `T{}`      |
 *
 * Example:
 * @code
 * auto numbers = lockstep::from_values({1, 2, 3});
 * auto letters = lockstep::from_values<std::string>({"A", "B", "C", "D"});
 * auto zipped = lockstep::zip_longest(
 *   numbers, letters, [](int n, std::string const& l) {
 *     return std::to_string(n) + l;
 *   });
 * // Yields "1A", "2B", "3C", "0D".
 * @endcode
 */

#include "lockstep/sequence/Sequence.hpp"
#include "lockstep/zip/ImbalancedPolicy.hpp"
#include "lockstep/zip/ZipSequence.hpp"

#include <memory>
#include <type_traits>
#include <utility>

namespace lockstep
{

namespace internal
{

/** Element type produced by zipping with FuncT. */
template <typename TFirst, typename TSecond, typename FuncT>
using ZipResultT = std::decay_t<
  std::invoke_result_t<FuncT&, TFirst const&, TSecond const&>>;

}  // namespace internal

/**
 * Zip two sequences with an explicit imbalance policy.
 *
 * @param first First sequence.
 * @param second Second sequence.
 * @param combine Function applied to each pair of elements, called
 * with the element of `first` then the element of `second`.
 * @param policy What to do when the inputs have different lengths.
 *
 * @throws NullArgumentException if `first`, `second` or `combine` is
 * absent. This happens immediately, before either input is read.
 * @throws InvalidArgumentException if `policy` is Pad and either
 * element type is not default constructible. `zip_longest` rejects
 * such types at compile time instead.
 */
template <typename TFirst, typename TSecond, typename FuncT>
SequencePtr<internal::ZipResultT<TFirst, TSecond, FuncT>>
zip_with_policy(SequencePtr<TFirst> first,
                SequencePtr<TSecond> second,
                FuncT combine,
                ImbalancedPolicy policy)
{
  using TResult = internal::ZipResultT<TFirst, TSecond, FuncT>;
  static_assert(!std::is_void_v<TResult>, "combine must return a value");
  return std::make_shared<ZipSequence<TFirst, TSecond, TResult>>(
    std::move(first),
    std::move(second),
    Combiner<TFirst, TSecond, TResult>(std::move(combine)),
    policy);
}

/**
 * Zip two sequences, stopping as soon as either is exhausted.
 */
template <typename TFirst, typename TSecond, typename FuncT>
SequencePtr<internal::ZipResultT<TFirst, TSecond, FuncT>>
zip(SequencePtr<TFirst> first, SequencePtr<TSecond> second, FuncT combine)
{
  return zip_with_policy(std::move(first),
                         std::move(second),
                         std::move(combine),
                         ImbalancedPolicy::Truncate);
}

/**
 * Zip two sequences that must have the same length.
 *
 * Traversal throws SequenceLengthMismatchException at the point where
 * one input turns out to be shorter, after every complete pair has
 * been produced.
 */
template <typename TFirst, typename TSecond, typename FuncT>
SequencePtr<internal::ZipResultT<TFirst, TSecond, FuncT>>
equi_zip(SequencePtr<TFirst> first, SequencePtr<TSecond> second, FuncT combine)
{
  return zip_with_policy(std::move(first),
                         std::move(second),
                         std::move(combine),
                         ImbalancedPolicy::Fail);
}

/**
 * Zip two sequences up to the end of the longer one.
 *
 * Once the shorter input is exhausted, `combine` receives a
 * value-initialized element in its place.
 */
template <typename TFirst, typename TSecond, typename FuncT>
SequencePtr<internal::ZipResultT<TFirst, TSecond, FuncT>>
zip_longest(SequencePtr<TFirst> first,
            SequencePtr<TSecond> second,
            FuncT combine)
{
  static_assert(std::is_default_constructible_v<TFirst>
                  && std::is_default_constructible_v<TSecond>,
                "zip_longest pads with default-constructed elements");
  return zip_with_policy(std::move(first),
                         std::move(second),
                         std::move(combine),
                         ImbalancedPolicy::Pad);
}

}  // namespace lockstep

/** \file
 *
 * \brief Definition of miscellaneous utilities
 */

#ifndef UTILITY_HH_
#define UTILITY_HH_

#include <algorithm>
#include <concepts>
#include <cstddef>
#include <iterator>
#include <optional>
#include <ranges>
#include <stdexcept>
#include <type_traits>

namespace Wizard {

/** \brief Check that an index is within range
 *
 * \param i the index to check
 * \param n the size of the range
 *
 * \return \p i
 *
 * \throw std::out_of_range unless 0 <= i < n
 */
template<typename Integer1, typename Integer2>
constexpr auto checkIndex(Integer1 i, Integer2 n)
{
    if (i < 0 || i >= n) {
        throw std::out_of_range("Index out of range");
    }
    return i;
}

/** \brief Dereference a pointer-like object, checking it first
 *
 * \param p the pointer, smart pointer or optional to dereference
 *
 * \return the value \p p refers to
 *
 * \throw std::invalid_argument if \p p is empty
 */
template<typename T>
constexpr decltype(auto) dereference(const T& p)
{
    if (!p) {
        throw std::invalid_argument("Trying to dereference nullptr");
    }
    return *p;
}

/** \brief Half-open range of integers
 *
 * \throw std::invalid_argument if \p m > \p n
 */
template<std::integral Integer>
constexpr auto from_to(std::type_identity_t<Integer> m, Integer n)
{
    if (m > n) {
        throw std::invalid_argument {"Invalid integer range"};
    }
    return std::ranges::views::iota(m, n);
}

/** \brief Range of integers from zero to \p n (exclusive)
 */
template<std::integral Integer>
constexpr auto to(Integer n)
{
    return from_to(Integer {}, n);
}

/** \brief Index of the element following \p i in a circular sequence
 *
 * \param i the current index
 * \param n the size of the sequence
 *
 * \throw std::out_of_range if \p i is not a valid index
 */
template<std::integral Integer1, std::integral Integer2>
constexpr Integer1 nextCircular(Integer1 i, Integer2 n)
{
    return (checkIndex(i, n) + 1) % static_cast<Integer1>(n);
}

/** \brief Find the position of an element satisfying a predicate
 *
 * \return the index of the first element of \p range for which \p pred
 * holds, or none
 */
template<std::ranges::random_access_range Range, typename Pred>
std::optional<std::ptrdiff_t> findIndexIf(Range&& range, Pred pred)
{
    const auto iter = std::ranges::find_if(range, pred);
    if (iter == std::ranges::end(range)) {
        return std::nullopt;
    }
    return std::distance(std::ranges::begin(range), iter);
}

}

#endif // UTILITY_HH_

/** \file
 *
 * \brief Definition of small general purpose utilities
 */

#ifndef UTILITY_HH_
#define UTILITY_HH_

#include <concepts>
#include <ranges>
#include <stdexcept>

namespace Uno {

/** \brief Validate a seat or array index
 *
 * \param i the index
 * \param n the number of elements
 *
 * \return \p i
 *
 * \throw std::out_of_range unless 0 <= \p i < \p n
 */
template<std::integral Integer>
constexpr Integer checkIndex(const Integer i, const Integer n)
{
    if (i < 0 || i >= n) {
        throw std::out_of_range {"Index out of range"};
    }
    return i;
}

/** \brief Dereference an optional or a pointer that must not be empty
 *
 * \throw std::invalid_argument if \p p is empty
 */
template<typename T>
constexpr decltype(auto) dereference(const T& p)
{
    if (!p) {
        throw std::invalid_argument {"Dereferencing an empty value"};
    }
    return *p;
}

/** \brief Integers 0, 1, ..., n-1 for use in ranged for
 *
 * \code{.cc}
 * for (const auto n : to(state.seats.size())) {
 *     state.seats[n].turnOrder = static_cast<int>(n);
 * }
 * \endcode
 *
 * \throw std::invalid_argument if \p n is negative
 */
template<std::integral Integer>
constexpr auto to(const Integer n)
{
    if (n < Integer {}) {
        throw std::invalid_argument {"Negative range length"};
    }
    return std::views::iota(Integer {}, n);
}

}

#endif // UTILITY_HH_

/** \file
 *
 * \brief Stream utilities
 */

#ifndef IOUTILITY_HH_
#define IOUTILITY_HH_

#include <fstream>
#include <functional>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace Uno {

/** \brief Output an optional value, or “-” if it is empty
 */
template<typename T>
std::ostream& operator<<(std::ostream& os, const std::optional<T>& t)
{
    return t ? (os << *t) : (os << '-');
}

/** \brief Output the elements of a vector separated by commas
 *
 * This is used to log hands and piles. An empty vector is output as “(empty)”.
 */
template<typename T>
std::ostream& operator<<(std::ostream& os, const std::vector<T>& ts)
{
    if (ts.empty()) {
        return os << "(empty)";
    }
    auto iter = ts.begin();
    os << *iter;
    while (++iter != ts.end()) {
        os << ", " << *iter;
    }
    return os;
}

/** \brief Invoke \p callback with the stream named by \p path
 *
 * The hyphen (“-”) names \c std::cin. Any other \p path is opened as a file
 * that stays open until \p callback returns. Errors opening the file are left
 * for \p callback to detect from the state of the stream.
 *
 * \return whatever \p callback returns
 */
template<typename Callable>
decltype(auto) processStreamFromPath(std::string_view path, Callable&& callback)
{
    if (path == "-") {
        return std::invoke(std::forward<Callable>(callback), std::cin);
    }
    auto in = std::ifstream {std::string {path}};
    return std::invoke(std::forward<Callable>(callback), in);
}

}

#endif // IOUTILITY_HH_

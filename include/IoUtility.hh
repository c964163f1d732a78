/** \file
 *
 * \brief Definition of input and output stream related utilities
 */

#ifndef IOUTILITY_HH_
#define IOUTILITY_HH_

#include <fstream>
#include <functional>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <variant>

namespace Wizard {

/** \brief Output optional value
 *
 * Outputs the wrapped value, or “(none)” if \p t is empty.
 *
 * \param os the output stream
 * \param t the value to be written to \p os
 */
template<typename T>
std::ostream& operator<<(std::ostream& os, const std::optional<T>& t)
{
    if (t) {
        return os << *t;
    }
    return os << "(none)";
}

/** \brief Output the alternative held by a variant
 *
 * \param os the output stream
 * \param t the value to be written to \p os
 */
template<typename T, typename... Ts>
std::ostream& operator<<(std::ostream& os, const std::variant<T, Ts...>& t)
{
    std::visit([&os](const auto& v) { os << v; }, t);
    return os;
}

/** \brief Process file stream or stdin based on \p path
 *
 * If \p path is a hyphen (“-”), calls \p callback with \c std::cin.
 * Otherwise opens the file at \p path and calls \p callback with the file
 * stream, which is closed after the callback returns.
 *
 * \param path a filesystem path or hyphen
 * \param callback a callable that accepts reference to \c std::istream
 *
 * \return the result of invoking \p callback
 *
 * \throw std::runtime_error if the file cannot be opened
 */
template<typename Callable>
decltype(auto) processStreamFromPath(std::string_view path, Callable&& callback)
{
    if (path == "-") {
        return std::invoke(std::forward<Callable>(callback), std::cin);
    }
    auto in = std::ifstream {std::string {path}};
    if (!in.is_open()) {
        throw std::runtime_error {"Could not open " + std::string {path}};
    }
    return std::invoke(std::forward<Callable>(callback), in);
}

}

#endif // IOUTILITY_HH_

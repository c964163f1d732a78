/** \file
 *
 * \brief Definition of JSON serialization utilities
 */

#ifndef MESSAGING_JSONSERIALIZERUTILITY_HH_
#define MESSAGING_JSONSERIALIZERUTILITY_HH_

#include "messaging/SerializationFailureException.hh"

#include <nlohmann/json.hpp>

#include <functional>
#include <optional>
#include <string>
#include <utility>

namespace nlohmann {

/** \brief JSON converter for optional types
 *
 * An empty optional is represented by null.
 */
template<typename T>
struct adl_serializer<std::optional<T>>
{
    /** \brief Convert optional type to JSON
     */
    static void to_json(json&, const std::optional<T>&);

    /** \brief Convert JSON to optional type
     */
    static void from_json(const json&, std::optional<T>&);
};

template<typename T>
void adl_serializer<std::optional<T>>::to_json(
    json& j, const std::optional<T>& t)
{
    if (t) {
        j = *t;
    } else {
        j = nullptr;
    }
}

template<typename T>
void adl_serializer<std::optional<T>>::from_json(
    const json& j, std::optional<T>& t)
{
    if (j.is_null()) {
        t = std::nullopt;
    } else {
        t = j.get<T>();
    }
}

}

namespace Wizard {
namespace Messaging {

/** \brief Validate a deserialized value
 *
 * \tparam Preds Predicates that can be invoked with \p t and whose return value
 * is convertible to bool.
 *
 * \param t the object to validate
 * \param preds the predicates used to validate \p t
 *
 * \return the object \p t if all predicates evaluate to true
 *
 * \throw SerializationFailureException if any predicate evaluates to false
 */
template<typename T, typename... Preds>
T validate(T&& t, Preds&&... preds)
{
    if ( ( ... && std::invoke(std::forward<Preds>(preds), t) ) ) {
        return t;
    }
    throw SerializationFailureException {};
}

/** \brief Get a required member of a JSON object
 *
 * \param j the JSON object
 * \param key the key of the member
 *
 * \return the member converted to \c T
 *
 * \throw SerializationFailureException if \p j is not an object, the member
 * is missing or it cannot be converted to \c T
 */
template<typename T>
T checkedGet(const nlohmann::json& j, const std::string& key)
{
    if (!j.is_object()) {
        throw SerializationFailureException {"Expected JSON object"};
    }
    const auto iter = j.find(key);
    if (iter == j.end()) {
        throw SerializationFailureException {"Missing key"};
    }
    try {
        return iter->template get<T>();
    } catch (const nlohmann::json::exception& e) {
        throw SerializationFailureException {e.what()};
    }
}

}
}

#endif // MESSAGING_JSONSERIALIZERUTILITY_HH_

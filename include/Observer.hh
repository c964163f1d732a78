/** \file
 *
 * \brief Definition of an implementation of the observer pattern
 *
 * The engine publishes what happens in a match (bids, played cards,
 * completed tricks) through Observable objects, and the session room reacts
 * to them through Observer objects.
 *
 * The classes are not meant for inter-thread communication and are not
 * thread safe.
 */

#ifndef OBSERVER_HH_
#define OBSERVER_HH_

#include "FunctionQueue.hh"

#include <algorithm>
#include <memory>
#include <tuple>
#include <utility>
#include <vector>

namespace Wizard {

/** \brief Observer part of the observer pattern
 *
 * \sa Observable
 */
template<typename... T>
class Observer {
public:

    virtual ~Observer() = default;

    /** \brief Notify observer
     *
     * \param args parameters from Observable::notifyAll()
     */
    void notify(const T&... args);

private:

    /** \brief Handle for notify()
     */
    virtual void handleNotify(const T&... args) = 0;
};

template<typename... T>
void Observer<T...>::notify(const T&... args)
{
    handleNotify(args...);
}

/** \brief Observable part of the observer pattern
 *
 * An observable holds weak references to its observers. An observer whose
 * lifetime has ended is dropped the next time the observable notifies.
 *
 * Notifications are serialized. If an observer causes another notification
 * while handling one, the new notification is delivered after every
 * observer has received the current one.
 */
template<typename... T>
class Observable {
public:

    /** \brief Subscribe observer
     *
     * \param observer the observer to be registered
     */
    void subscribe(std::weak_ptr<Observer<T...>> observer);

    /** \brief Notify all observers
     *
     * \param args arguments for Observer::notify()
     */
    template<typename... U>
    void notifyAll(U&&... args);

private:

    void internalNotify(const std::tuple<T...>& args);

    std::vector<std::weak_ptr<Observer<T...>>> observers;
    FunctionQueue functionQueue;
};

template<typename... T>
void Observable<T...>::subscribe(std::weak_ptr<Observer<T...>> observer)
{
    observers.push_back(std::move(observer));
}

template<typename... T>
template<typename... U>
void Observable<T...>::notifyAll(U&&... args)
{
    functionQueue(
        [this, args = std::tuple<T...> {std::forward<U>(args)...}]()
        {
            internalNotify(args);
        });
}

template<typename... T>
void Observable<T...>::internalNotify(const std::tuple<T...>& args)
{
    std::erase_if(
        observers, [](const auto& observer) { return observer.expired(); });
    // Observers subscribing during the notification get the next one
    const auto n = observers.size();
    for (auto i = std::size_t {}; i < n; ++i) {
        if (const auto observer = observers[i].lock()) {
            std::apply(
                [&observer](const auto&... ts) { observer->notify(ts...); },
                args);
        }
    }
}

}

#endif // OBSERVER_HH_

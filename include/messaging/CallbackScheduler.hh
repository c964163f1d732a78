/** \file
 *
 * \brief Definition of Wizard::Messaging::CallbackScheduler
 */

#ifndef MESSAGING_CALLBACKSCHEDULER_HH_
#define MESSAGING_CALLBACKSCHEDULER_HH_

#include <chrono>
#include <functional>
#include <tuple>
#include <utility>

namespace Wizard {
namespace Messaging {

/** \brief Interface for deferring calls
 *
 * The session room defers its pacing steps (bot moves, trick evaluation,
 * end of round) and the periodic inactivity check to a callback
 * scheduler. The server executes the callbacks in the message loop, and tests
 * use a scheduler driven by virtual time.
 *
 * A callback is never executed in the call stack that schedules it.
 */
class CallbackScheduler {
public:

    /** \brief Type erased callback
     */
    using Callback = std::function<void()>;

    virtual ~CallbackScheduler();

    /** \brief Schedule \p callable to be invoked with \p args as soon as
     * possible
     *
     * \p callable and \p args are copied or moved into the scheduler.
     */
    template<typename Callable, typename... Args>
    void callSoon(Callable&& callable, Args&&... args)
    {
        callLater(
            std::chrono::milliseconds::zero(),
            std::forward<Callable>(callable), std::forward<Args>(args)...);
    }

    /** \brief Schedule \p callable to be invoked with \p args once \p timeout
     * has passed
     *
     * Callbacks with the same deadline are invoked in the order they were
     * scheduled.
     */
    template<typename Callable, typename... Args>
    void callLater(
        std::chrono::milliseconds timeout, Callable&& callable, Args&&... args)
    {
        handleCallLater(
            timeout,
            [callable = std::forward<Callable>(callable),
             bound_args = std::tuple {std::forward<Args>(args)...}]() mutable
            {
                std::apply(std::move(callable), std::move(bound_args));
            });
    }

private:

    /** \brief Handle for callLater()
     *
     * The implementation must invoke \p callback at most once.
     */
    virtual void handleCallLater(
        std::chrono::milliseconds timeout, Callback callback) = 0;
};

}
}

#endif // MESSAGING_CALLBACKSCHEDULER_HH_

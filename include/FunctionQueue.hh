/** \file
 *
 * \brief Definition of Wizard::FunctionQueue class
 */

#ifndef FUNCTIONQUEUE_HH_
#define FUNCTIONQUEUE_HH_

#include <deque>
#include <functional>

namespace Wizard {

/** \brief Queue serializing calls that must not overlap
 *
 * A function given to an empty queue is called immediately. A function given
 * while another one is executing (for instance from an observer reacting to
 * a notification) is queued and called once every earlier function has
 * returned. The engine uses the queue to keep its state machine events from
 * nesting.
 */
class FunctionQueue {
public:

    /** \brief Enqueue function for execution
     *
     * If any function throws, the queue is cleared before the exception is
     * rethrown.
     *
     * \note A function capturing automatic variables by reference must only
     * be given to an idle queue.
     *
     * \param function a function invocable without arguments
     */
    template<typename Function>
    void operator()(Function&& function);

    /** \brief Determine if a function is currently executing
     */
    bool isBusy() const { return !functions.empty(); }

private:

    void internalRunAll();

    std::deque<std::function<void()>> functions;
};

template<typename Function>
void FunctionQueue::operator()(Function&& function)
{
    const auto was_idle = functions.empty();
    functions.emplace_back(std::forward<Function>(function));
    if (was_idle) {
        internalRunAll();
    }
}

inline void FunctionQueue::internalRunAll()
{
    try {
        while (!functions.empty()) {
            functions.front()();
            functions.pop_front();
        }
    } catch (...) {
        functions.clear();
        throw;
    }
}

}

#endif // FUNCTIONQUEUE_HH_

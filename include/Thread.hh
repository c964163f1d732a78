/** \file
 *
 * \brief Definition of Wizard::Thread class
 */

#ifndef THREAD_HH_
#define THREAD_HH_

#include <thread>
#include <utility>

namespace Wizard {

/** \brief Thread that is joined on destruction
 *
 * Worker threads of the server (the callback scheduler timer thread) are
 * owned by a Thread object. The owner must make the worker exit before the
 * Thread is destructed, because the destructor blocks until it does.
 */
class Thread {
public:

    /** \brief Create thread object without thread of execution
     */
    Thread() noexcept;

    /** \brief Start a thread calling \p f with \p args
     */
    template<typename Function, typename... Args>
    explicit Thread(Function&& f, Args&&... args);

    Thread(Thread&& other) noexcept;

    /** \brief Join the thread, if joinable
     */
    ~Thread();

    /** \brief Move assignment
     *
     * Joins the current thread, if any, before taking over \p other.
     */
    Thread& operator=(Thread&& other) noexcept;

private:

    void internalJoin() noexcept;

    std::thread thread;
};

template<typename Function, typename... Args>
Thread::Thread(Function&& f, Args&&... args) :
    thread {std::forward<Function>(f), std::forward<Args>(args)...}
{
}

}

#endif // THREAD_HH_

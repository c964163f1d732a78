#include "Thread.hh"

namespace Wizard {

Thread::Thread() noexcept = default;

Thread::Thread(Thread&& other) noexcept = default;

Thread::~Thread()
{
    internalJoin();
}

Thread& Thread::operator=(Thread&& other) noexcept
{
    if (this != &other) {
        internalJoin();
        thread = std::move(other.thread);
    }
    return *this;
}

void Thread::internalJoin() noexcept
{
    if (thread.joinable()) {
        thread.join();
    }
}

}

#ifndef VIGIL_UTILITIES_CONCURRENCY_TESTING_H
#define VIGIL_UTILITIES_CONCURRENCY_TESTING_H

#include <chrono>
#include <thread>

namespace vigil {

// Wait (on the real clock) for :condition to become true, checking it once
// per millisecond for up to :patience. Return whether or not it happened.
template<class Condition>
bool
occurs_soon(
    Condition&& condition,
    std::chrono::milliseconds patience = std::chrono::milliseconds(1000))
{
    auto const give_up = std::chrono::steady_clock::now() + patience;
    while (!condition())
    {
        if (std::chrono::steady_clock::now() >= give_up)
            return false;
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    return true;
}

} // namespace vigil

#endif

#ifndef VIGIL_ASYNC_CLOCK_HPP
#define VIGIL_ASYNC_CLOCK_HPP

#include <chrono>
#include <condition_variable>
#include <mutex>

#include <vigil/core/type_definitions.hpp>

namespace vigil {

// All scheduling in vigil is anchored to a monotonic clock. Time points are
// always expressed as steady_clock time points, even for virtual clocks.
typedef std::chrono::steady_clock::time_point time_point;

// A clock_interface provides the current time and the ability to wait for a
// later time.
struct clock_interface
{
    virtual ~clock_interface()
    {
    }

    virtual time_point
    now() const = 0;

    // Wait (with :lock held on entry and exit) until either :wakeup is
    // notified or :deadline arrives. Spurious returns are allowed; callers
    // recheck their conditions.
    virtual void
    wait_until(
        std::unique_lock<std::mutex>& lock,
        std::condition_variable& wakeup,
        time_point deadline)
        = 0;
};

// the real, monotonic clock
struct steady_clock_source : clock_interface
{
    time_point
    now() const override
    {
        return std::chrono::steady_clock::now();
    }

    void
    wait_until(
        std::unique_lock<std::mutex>& lock,
        std::condition_variable& wakeup,
        time_point deadline) override
    {
        wakeup.wait_until(lock, deadline);
    }
};

// A manual_clock is a virtual clock. Time only moves when someone waits
// (in which case it jumps straight to the deadline) or when advance() is
// called. This makes timing behavior deterministic and instantaneous in tests.
struct manual_clock : clock_interface
{
    manual_clock() : start_(time_point()), now_(time_point())
    {
    }

    explicit manual_clock(time_point start) : start_(start), now_(start)
    {
    }

    time_point
    now() const override;

    void
    wait_until(
        std::unique_lock<std::mutex>& lock,
        std::condition_variable& wakeup,
        time_point deadline) override;

    void
    advance(std::chrono::milliseconds amount);

    // the amount of virtual time that has passed since the clock started
    std::chrono::milliseconds
    elapsed() const;

 private:
    mutable std::mutex mutex_;
    time_point start_;
    time_point now_;
};

} // namespace vigil

#endif

#ifndef VIGIL_ASYNC_EVENT_LOOP_H
#define VIGIL_ASYNC_EVENT_LOOP_H

#include <condition_variable>
#include <coroutine>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <unordered_map>

#include <vigil/async/clock.hpp>

// This file provides the cooperative scheduler that drives all of vigil's
// timers, probes and message deliveries.
//
// Work is posted to an event_loop as discrete units. The loop runs them one at
// a time on the thread that runs the loop, in order of their due times. Units
// that are due at the same time run in the order in which they were posted,
// and no unit ever runs inside the call that posted it (so posting for 'now'
// means 'on the next tick').

namespace vigil {

typedef uint64_t timer_id;

struct event_loop : noncopyable
{
    // Create a loop that runs on the real (steady) clock.
    event_loop();

    // Create a loop that runs on the given clock.
    // The clock must outlive the loop.
    explicit event_loop(clock_interface& clock);

    clock_interface&
    clock()
    {
        return *clock_;
    }

    time_point
    now() const
    {
        return clock_->now();
    }

    // Post a unit of work to run on the next tick.
    timer_id
    post(std::function<void()> work);

    // Post a unit of work to run once :when has arrived.
    timer_id
    post_at(time_point when, std::function<void()> work);

    // Post a unit of work to run once :delay has passed.
    timer_id
    post_after(std::chrono::milliseconds delay, std::function<void()> work);

    // Cancel a unit of work that hasn't run yet.
    // The return value indicates whether or not it was still pending.
    bool
    cancel(timer_id id);

    // the number of units of work that are waiting to run
    std::size_t
    pending_count() const;

    // Awaiting one of these suspends the awaiting coroutine and resumes it
    // from within the loop once the given time has arrived.
    struct time_awaiter
    {
        event_loop& loop;
        time_point when;

        bool
        await_ready() const noexcept
        {
            return false;
        }

        void
        await_suspend(std::coroutine_handle<> awaiting)
        {
            loop.post_at(when, [awaiting] { awaiting.resume(); });
        }

        void
        await_resume() const noexcept
        {
        }
    };

    // Resume on the next tick.
    time_awaiter
    schedule()
    {
        return time_awaiter{*this, now()};
    }

    time_awaiter
    schedule_at(time_point when)
    {
        return time_awaiter{*this, when};
    }

    time_awaiter
    schedule_after(std::chrono::milliseconds delay)
    {
        return time_awaiter{*this, now() + delay};
    }

    // Run work until stop() is called. If there's no work to do, this waits
    // for some to be posted.
    //
    // If a unit of work throws, the exception propagates out of run(). The
    // loop remains usable and can be run again.
    //
    void
    run();

    // Run work until there's none left (or stop() is called).
    // Exceptions propagate as with run().
    void
    run_until_idle();

    // Stop the loop. The current unit of work (if any) finishes, and run()
    // then returns. The loop stays stopped until restart() is called.
    // This can be called from any thread.
    void
    stop();

    void
    restart();

    bool
    is_stopped() const;

 private:
    // Run the next unit of work. If the queue is empty, this either waits
    // for more work or returns false, depending on :return_when_idle.
    // It also returns false when the loop has been stopped.
    bool
    run_next(bool return_when_idle);

    std::unique_ptr<steady_clock_source> owned_clock_;
    clock_interface* clock_;

    mutable std::mutex mutex_;
    std::condition_variable wakeup_;
    // pending work, ordered by due time and then by posting order
    std::map<std::pair<time_point, timer_id>, std::function<void()>> queue_;
    // due times of pending work, so that it can be found by ID
    std::unordered_map<timer_id, time_point> due_times_;
    timer_id next_id_ = 1;
    bool stopped_ = false;
};

} // namespace vigil

#endif

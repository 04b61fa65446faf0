#ifndef VIGIL_CORE_MONITORING_HPP
#define VIGIL_CORE_MONITORING_HPP

#include <atomic>

#include <vigil/core/exception.hpp>

namespace vigil {

// Long-running observations check in with their callers between units of
// work. A check-in can abort the observation by throwing an exception.
struct check_in_interface
{
    virtual void
    operator()()
        = 0;
};
// If you don't need the observation to check in, pass one of these.
struct null_check_in : check_in_interface
{
    void
    operator()()
    {
    }
};

// This is thrown (by cancellation_check_in) when an observation is canceled
// by its caller. It is the 'canceled' outcome of an observation and is
// distinct from timeouts and probe failures.
VIGIL_DEFINE_EXCEPTION(observation_canceled)

// A check-in that cancels the observation once cancel() has been called.
// cancel() may be called from any thread. The observation notices it the
// next time it checks in.
struct cancellation_check_in : check_in_interface
{
    void
    cancel()
    {
        canceled_ = true;
    }

    bool
    is_canceled() const
    {
        return canceled_;
    }

    void
    operator()()
    {
        if (canceled_)
            VIGIL_THROW(observation_canceled());
    }

 private:
    std::atomic<bool> canceled_ = false;
};

} // namespace vigil

#endif

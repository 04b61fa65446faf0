#ifndef VIGIL_STATUS_POLLING_H
#define VIGIL_STATUS_POLLING_H

#include <memory>

#include <vigil/async/event_loop.h>
#include <vigil/core/monitoring.hpp>
#include <vigil/status/cadence.hpp>
#include <vigil/status/types.hpp>

namespace vigil {

struct polling_options
{
    // the probe that reports the status of the monitored operation
    status_probe probe;
    // the time between the scheduled starts of consecutive probes
    duration frequency;
    // the total time allowed for the operation to complete
    duration timeout;
    // If this is omitted, the engine uses a fixed_cadence.
    std::shared_ptr<cadence_policy_interface> cadence;
};

enum class polling_state
{
    READY,
    RUNNING,
    COMPLETED,
    TIMED_OUT,
    FAILED,
    CANCELED
};

// This is thrown when the timeout elapses before the monitored operation
// reports completion.
VIGIL_DEFINE_DERIVED_EXCEPTION(polling_timeout, observation_timeout)
// This exception provides timeout_info and the following.
VIGIL_DEFINE_ERROR_INFO(unsigned, probe_count)

// A polling_engine watches a remote operation by repeatedly invoking a probe
// until the probe reports completion, the probe fails or the timeout
// elapses.
//
// The first probe is issued immediately. After each probe that reports the
// operation as still running, the engine schedules the next probe one
// cadence interval after the scheduled start of the previous one (so slow
// probes don't make the schedule drift). The deadline is only checked between
// probes: if the time already spent has reached the timeout, or if the next
// scheduled start would fall on or after the deadline, the observation ends
// with polling_timeout instead. In-flight probes are never interrupted.
//
// All waiting is done on the engine's event_loop. Each engine supports exactly
// one observation.
//
struct polling_engine : noncopyable
{
    // This validates the options and throws configuration_error if they
    // aren't usable (missing probe, non-positive frequency or timeout).
    polling_engine(event_loop& loop, polling_options options);

    // Observe the operation until it completes. The result is the payload of
    // the completed status (or null if the completed status had none).
    //
    // Errors thrown by the probe are passed through unchanged.
    //
    cppcoro::task<nlohmann::json>
    observe();

    // Same as above, but :check_in is called before each probe (and thus
    // after each wait). Canceling the observation through the check-in
    // throws observation_canceled. :check_in must outlive the observation.
    cppcoro::task<nlohmann::json>
    observe(check_in_interface& check_in);

    polling_state
    state() const
    {
        return state_;
    }

    // the number of times the probe has been invoked so far
    unsigned
    probe_count() const
    {
        return probe_count_;
    }

    polling_options const&
    options() const
    {
        return options_;
    }

 private:
    event_loop& loop_;
    polling_options options_;
    polling_state state_ = polling_state::READY;
    unsigned probe_count_ = 0;
};

// Create a polling engine.
// This is equivalent to the constructor, but the engine is heap-allocated so
// that it can easily outlive the scope that creates it.
std::unique_ptr<polling_engine>
make_polling_engine(event_loop& loop, polling_options options);

} // namespace vigil

#endif

#ifndef VIGIL_STATUS_TYPES_HPP
#define VIGIL_STATUS_TYPES_HPP

#include <functional>

#include <cppcoro/task.hpp>
#include <nlohmann/json.hpp>

#include <vigil/core/exception.hpp>
#include <vigil/time/duration.hpp>

namespace vigil {

// a snapshot of a monitored operation at one observation instant
struct status_result
{
    bool completed = false;
    // the final value of the operation - only meaningful when :completed is
    // true
    optional<nlohmann::json> payload;
};

inline status_result
make_pending_status()
{
    return status_result{false, none};
}

inline status_result
make_completed_status(nlohmann::json payload)
{
    return status_result{true, some(std::move(payload))};
}

inline bool
operator==(status_result const& a, status_result const& b)
{
    return a.completed == b.completed && a.payload == b.payload;
}
inline bool
operator!=(status_result const& a, status_result const& b)
{
    return !(a == b);
}

// A status probe reports the current status of a monitored operation.
// It may fail (by throwing). Failures are passed through to whoever is
// observing the operation, unchanged.
typedef std::function<cppcoro::task<status_result>()> status_probe;

// This is the common base of the errors for observations that run out of
// time. It provides the configured limit that was reached.
VIGIL_DEFINE_EXCEPTION(observation_timeout)
VIGIL_DEFINE_ERROR_INFO(duration, timeout)

} // namespace vigil

#endif

#ifndef VIGIL_TIME_DURATION_HPP
#define VIGIL_TIME_DURATION_HPP

#include <chrono>
#include <ostream>

#include <nlohmann/json.hpp>

#include <vigil/core/exception.hpp>

namespace vigil {

enum class time_unit
{
    MILLISECONDS,
    SECONDS,
    MINUTES,
    HOURS,
    DAYS,
    WEEKS
};

// the number of milliseconds in one of the given unit
integer
milliseconds_per(time_unit unit);

// the lowercase plural name of a unit (e.g., "seconds")
string
to_string(time_unit unit);

// Parse the name of a unit. This accepts the plural form, the singular form
// and the usual abbreviations ("ms", "s", "m"/"min", "h", "d", "w").
// Throws parsing_error if the text isn't recognized.
time_unit
parse_time_unit(string const& text);

// An amount of time, expressed in some unit.
//
// Durations are compared and combined by their millisecond value, so
// seconds(1) == milliseconds(1000).
//
struct duration
{
    integer amount = 0;
    time_unit unit = time_unit::MILLISECONDS;

    // This throws duration_overflow if the value doesn't fit in an integer
    // number of milliseconds.
    integer
    to_milliseconds() const;

    std::chrono::milliseconds
    to_chrono() const
    {
        return std::chrono::milliseconds(to_milliseconds());
    }
};

VIGIL_DEFINE_EXCEPTION(duration_overflow)
VIGIL_DEFINE_ERROR_INFO(duration, overflowing_duration)

// the longest delay (in milliseconds) that can be added to a clock reading
// without overflowing the clock's representation
integer
max_schedulable_milliseconds();

// Can :d be used as a delay or as the distance to a deadline?
// Unlike to_milliseconds(), this never throws.
bool
is_schedulable(duration const& d);

inline duration
make_duration(integer amount, time_unit unit)
{
    return duration{amount, unit};
}

inline duration
milliseconds(integer amount)
{
    return duration{amount, time_unit::MILLISECONDS};
}
inline duration
seconds(integer amount)
{
    return duration{amount, time_unit::SECONDS};
}
inline duration
minutes(integer amount)
{
    return duration{amount, time_unit::MINUTES};
}
inline duration
hours(integer amount)
{
    return duration{amount, time_unit::HOURS};
}
inline duration
days(integer amount)
{
    return duration{amount, time_unit::DAYS};
}
inline duration
weeks(integer amount)
{
    return duration{amount, time_unit::WEEKS};
}

inline bool
operator==(duration const& a, duration const& b)
{
    return a.to_milliseconds() == b.to_milliseconds();
}
inline bool
operator!=(duration const& a, duration const& b)
{
    return !(a == b);
}
inline bool
operator<(duration const& a, duration const& b)
{
    return a.to_milliseconds() < b.to_milliseconds();
}
inline bool
operator<=(duration const& a, duration const& b)
{
    return !(b < a);
}
inline bool
operator>(duration const& a, duration const& b)
{
    return b < a;
}
inline bool
operator>=(duration const& a, duration const& b)
{
    return !(a < b);
}

// Arithmetic results are expressed in milliseconds.
inline duration
operator+(duration const& a, duration const& b)
{
    return milliseconds(a.to_milliseconds() + b.to_milliseconds());
}
inline duration
operator-(duration const& a, duration const& b)
{
    return milliseconds(a.to_milliseconds() - b.to_milliseconds());
}

// Is this a strictly positive amount of time?
inline bool
is_positive(duration const& d)
{
    return d.to_milliseconds() > 0;
}

std::ostream&
operator<<(std::ostream& s, duration const& d);

// JSON form: either a plain integer (milliseconds) or an object of the form
// { "amount": 90, "unit": "seconds" }.
// Reading throws parsing_error if the JSON has neither form.
void
to_json(nlohmann::json& j, duration const& d);
void
from_json(nlohmann::json const& j, duration& d);

} // namespace vigil

#endif

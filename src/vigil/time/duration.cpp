#include <vigil/time/duration.hpp>

#include <chrono>
#include <cstdint>
#include <limits>

#include <boost/algorithm/string.hpp>

#include <vigil/utilities/errors.h>

namespace vigil {

namespace {

// Does :j hold an integer that fits in an integer? (Unsigned JSON values
// above the signed range count as integers to nlohmann::json.)
bool
is_integer_value(nlohmann::json const& j)
{
    if (!j.is_number_integer())
        return false;
    return !j.is_number_unsigned()
           || j.get<std::uint64_t>()
                  <= std::uint64_t(std::numeric_limits<integer>::max());
}

} // namespace

integer
milliseconds_per(time_unit unit)
{
    switch (unit)
    {
        case time_unit::MILLISECONDS:
            return 1;
        case time_unit::SECONDS:
            return 1000;
        case time_unit::MINUTES:
            return 60 * 1000;
        case time_unit::HOURS:
            return 60 * 60 * 1000;
        case time_unit::DAYS:
            return 24 * 60 * 60 * 1000;
        case time_unit::WEEKS:
            return integer(7) * 24 * 60 * 60 * 1000;
    }
    VIGIL_THROW(
        internal_check_failed()
        << internal_error_message_info("invalid time_unit value"));
}

integer
duration::to_milliseconds() const
{
    integer const per = milliseconds_per(unit);
    integer const limit = std::numeric_limits<integer>::max() / per;
    if (amount > limit || amount < -limit)
        VIGIL_THROW(duration_overflow() << overflowing_duration_info(*this));
    return amount * per;
}

integer
max_schedulable_milliseconds()
{
    // Leave half of the clock's range for the clock reading itself.
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::steady_clock::duration::max())
               .count()
           / 2;
}

bool
is_schedulable(duration const& d)
{
    integer const limit
        = max_schedulable_milliseconds() / milliseconds_per(d.unit);
    return d.amount <= limit && d.amount >= -limit;
}

string
to_string(time_unit unit)
{
    switch (unit)
    {
        case time_unit::MILLISECONDS:
            return "milliseconds";
        case time_unit::SECONDS:
            return "seconds";
        case time_unit::MINUTES:
            return "minutes";
        case time_unit::HOURS:
            return "hours";
        case time_unit::DAYS:
            return "days";
        case time_unit::WEEKS:
            return "weeks";
    }
    VIGIL_THROW(
        internal_check_failed()
        << internal_error_message_info("invalid time_unit value"));
}

time_unit
parse_time_unit(string const& text)
{
    auto name = boost::algorithm::to_lower_copy(boost::algorithm::trim_copy(text));
    if (name == "milliseconds" || name == "millisecond" || name == "ms")
        return time_unit::MILLISECONDS;
    if (name == "seconds" || name == "second" || name == "s")
        return time_unit::SECONDS;
    if (name == "minutes" || name == "minute" || name == "min" || name == "m")
        return time_unit::MINUTES;
    if (name == "hours" || name == "hour" || name == "h")
        return time_unit::HOURS;
    if (name == "days" || name == "day" || name == "d")
        return time_unit::DAYS;
    if (name == "weeks" || name == "week" || name == "w")
        return time_unit::WEEKS;
    VIGIL_THROW(
        parsing_error() << expected_format_info("time unit")
                        << parsed_text_info(text));
}

std::ostream&
operator<<(std::ostream& s, duration const& d)
{
    s << d.amount << " " << to_string(d.unit);
    return s;
}

void
to_json(nlohmann::json& j, duration const& d)
{
    j = nlohmann::json{{"amount", d.amount}, {"unit", to_string(d.unit)}};
}

void
from_json(nlohmann::json const& j, duration& d)
{
    if (is_integer_value(j))
    {
        d = milliseconds(j.get<integer>());
        return;
    }
    if (j.is_object() && j.contains("amount")
        && is_integer_value(j.at("amount")) && j.contains("unit")
        && j.at("unit").is_string())
    {
        d = make_duration(
            j.at("amount").get<integer>(),
            parse_time_unit(j.at("unit").get<string>()));
        return;
    }
    VIGIL_THROW(
        parsing_error() << expected_format_info("duration")
                        << parsed_text_info(j.dump()));
}

} // namespace vigil

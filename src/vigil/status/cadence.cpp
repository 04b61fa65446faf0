#include <vigil/status/cadence.hpp>

#include <algorithm>
#include <cmath>

#include <vigil/utilities/errors.h>

namespace vigil {

std::chrono::milliseconds
fixed_cadence::interval(unsigned, std::chrono::milliseconds frequency)
{
    return frequency;
}

exponential_backoff_cadence::exponential_backoff_cadence(
    double factor, std::chrono::milliseconds max_interval)
    : factor_(factor), max_interval_(max_interval)
{
    if (!(factor_ >= 1))
    {
        VIGIL_THROW(
            configuration_error()
            << invalid_option_info("backoff factor")
            << internal_error_message_info(
                   "backoff factor must be at least 1"));
    }
    if (max_interval_.count() <= 0)
    {
        VIGIL_THROW(
            configuration_error()
            << invalid_option_info("max interval")
            << internal_error_message_info("max interval must be positive"));
    }
}

std::chrono::milliseconds
exponential_backoff_cadence::interval(
    unsigned attempt, std::chrono::milliseconds frequency)
{
    // Do the math in floating point so that large attempt counts saturate
    // at the cap instead of overflowing.
    double scaled = double(frequency.count()) * std::pow(factor_, attempt);
    if (!(scaled < double(max_interval_.count())))
        return max_interval_;
    return std::chrono::milliseconds(
        std::max<std::chrono::milliseconds::rep>(1, std::llround(scaled)));
}

jittered_cadence::jittered_cadence(
    std::shared_ptr<cadence_policy_interface> base,
    std::chrono::milliseconds max_jitter,
    unsigned seed)
    : base_(std::move(base)), max_jitter_(max_jitter), engine_(seed)
{
    if (!base_)
    {
        VIGIL_THROW(
            configuration_error() << invalid_option_info("base cadence"));
    }
    if (max_jitter_.count() < 0)
    {
        VIGIL_THROW(
            configuration_error()
            << invalid_option_info("max jitter")
            << internal_error_message_info("max jitter can't be negative"));
    }
}

std::chrono::milliseconds
jittered_cadence::interval(
    unsigned attempt, std::chrono::milliseconds frequency)
{
    std::uniform_int_distribution<std::chrono::milliseconds::rep> jitter(
        0, max_jitter_.count());
    return base_->interval(attempt, frequency)
           + std::chrono::milliseconds(jitter(engine_));
}

} // namespace vigil

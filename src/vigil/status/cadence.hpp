#ifndef VIGIL_STATUS_CADENCE_HPP
#define VIGIL_STATUS_CADENCE_HPP

#include <chrono>
#include <memory>
#include <random>

#include <vigil/core/type_definitions.hpp>

namespace vigil {

// A cadence policy decides how long the polling engine waits between the
// scheduled starts of consecutive probe attempts.
struct cadence_policy_interface
{
    virtual ~cadence_policy_interface()
    {
    }

    // Get the interval between the scheduled start of attempt :attempt
    // (counting from 0) and the scheduled start of the attempt after it.
    // :frequency is the frequency configured for the engine.
    virtual std::chrono::milliseconds
    interval(unsigned attempt, std::chrono::milliseconds frequency)
        = 0;
};

// the default policy - every interval is exactly the configured frequency
struct fixed_cadence : cadence_policy_interface
{
    std::chrono::milliseconds
    interval(unsigned attempt, std::chrono::milliseconds frequency) override;
};

// Each interval is :factor times longer than the one before it, starting at
// the configured frequency, up to :max_interval.
struct exponential_backoff_cadence : cadence_policy_interface
{
    // :factor must be at least 1 and :max_interval must be positive.
    // (Otherwise, this throws configuration_error.)
    exponential_backoff_cadence(
        double factor, std::chrono::milliseconds max_interval);

    std::chrono::milliseconds
    interval(unsigned attempt, std::chrono::milliseconds frequency) override;

 private:
    double factor_;
    std::chrono::milliseconds max_interval_;
};

// This adds a random offset in the range [0, max_jitter] to the intervals
// produced by another policy. The generator is seeded explicitly so that
// behavior can be reproduced.
struct jittered_cadence : cadence_policy_interface
{
    jittered_cadence(
        std::shared_ptr<cadence_policy_interface> base,
        std::chrono::milliseconds max_jitter,
        unsigned seed = 0);

    std::chrono::milliseconds
    interval(unsigned attempt, std::chrono::milliseconds frequency) override;

 private:
    std::shared_ptr<cadence_policy_interface> base_;
    std::chrono::milliseconds max_jitter_;
    std::minstd_rand engine_;
};

} // namespace vigil

#endif

#include <vigil/status/polling.h>

#include <vigil/core/logging.hpp>
#include <vigil/utilities/errors.h>

namespace vigil {

namespace {

void
validate_polling_options(polling_options const& options)
{
    if (!options.probe)
    {
        VIGIL_THROW(
            configuration_error()
            << invalid_option_info("probe")
            << internal_error_message_info("a status probe is required"));
    }
    if (!is_schedulable(options.frequency) || !is_positive(options.frequency))
    {
        VIGIL_THROW(
            configuration_error()
            << invalid_option_info("frequency")
            << internal_error_message_info(
                   "frequency must be positive and schedulable"));
    }
    if (!is_schedulable(options.timeout) || !is_positive(options.timeout))
    {
        VIGIL_THROW(
            configuration_error()
            << invalid_option_info("timeout")
            << internal_error_message_info(
                   "timeout must be positive and schedulable"));
    }
}

} // namespace

polling_engine::polling_engine(event_loop& loop, polling_options options)
    : loop_(loop), options_(std::move(options))
{
    validate_polling_options(options_);
    if (!options_.cadence)
        options_.cadence = std::make_shared<fixed_cadence>();
}

cppcoro::task<nlohmann::json>
polling_engine::observe()
{
    null_check_in check_in;
    co_return co_await observe(check_in);
}

cppcoro::task<nlohmann::json>
polling_engine::observe(check_in_interface& check_in)
{
    if (state_ != polling_state::READY)
    {
        VIGIL_THROW(
            internal_check_failed() << internal_error_message_info(
                "a polling engine can only be observed once"));
    }
    state_ = polling_state::RUNNING;

    auto logger = get_logger();
    auto const frequency = options_.frequency.to_chrono();
    auto const timeout = options_.timeout.to_chrono();
    auto const started = loop_.now();
    auto const deadline = started + timeout;
    logger->debug(
        "polling started (frequency: {}ms, timeout: {}ms)",
        frequency.count(),
        timeout.count());

    // Only errors raised by the engine itself count as a timeout or a
    // cancellation. Anything else, including those same error types coming
    // out of a probe, is a probe failure.
    polling_state ending = polling_state::FAILED;
    try
    {
        auto scheduled_start = started;
        for (unsigned attempt = 0;; ++attempt)
        {
            try
            {
                check_in();
            }
            catch (observation_canceled&)
            {
                ending = polling_state::CANCELED;
                throw;
            }

            ++probe_count_;
            logger->debug("issuing probe {}", probe_count_);
            status_result status = co_await options_.probe();

            if (status.completed)
            {
                state_ = polling_state::COMPLETED;
                logger->info(
                    "polled operation completed after {} probe(s)",
                    probe_count_);
                co_return status.payload ? std::move(*status.payload)
                                         : nlohmann::json();
            }

            auto const now = loop_.now();
            scheduled_start += options_.cadence->interval(attempt, frequency);
            if (now - started >= timeout || scheduled_start >= deadline)
            {
                ending = polling_state::TIMED_OUT;
                VIGIL_THROW(
                    polling_timeout() << timeout_info(options_.timeout)
                                      << probe_count_info(probe_count_));
            }
            // If the probe ran past its slot, start the next one right away
            // and anchor the rest of the schedule there.
            if (scheduled_start < now)
                scheduled_start = now;

            co_await loop_.schedule_at(scheduled_start);
        }
    }
    catch (...)
    {
        state_ = ending;
        switch (ending)
        {
            case polling_state::TIMED_OUT:
                logger->info(
                    "polling timed out after {}ms and {} probe(s)",
                    timeout.count(),
                    probe_count_);
                break;
            case polling_state::CANCELED:
                logger->info(
                    "polling canceled after {} probe(s)", probe_count_);
                break;
            default:
                logger->warn("probe {} failed", probe_count_);
                break;
        }
        throw;
    }
}

std::unique_ptr<polling_engine>
make_polling_engine(event_loop& loop, polling_options options)
{
    return std::make_unique<polling_engine>(loop, std::move(options));
}

} // namespace vigil

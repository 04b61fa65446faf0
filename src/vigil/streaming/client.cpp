#include <vigil/streaming/client.h>

#include <vigil/async/settlement.hpp>
#include <vigil/core/logging.hpp>
#include <vigil/utilities/errors.h>

namespace vigil {

namespace {

void
validate_streaming_options(streaming_options const& options)
{
    if (options.channel.empty())
    {
        VIGIL_THROW(
            configuration_error()
            << invalid_option_info("channel")
            << internal_error_message_info("a channel is required"));
    }
    if (!options.processor)
    {
        VIGIL_THROW(
            configuration_error()
            << invalid_option_info("processor")
            << internal_error_message_info("a stream processor is required"));
    }
    if (!is_schedulable(options.handshake_timeout)
        || !is_positive(options.handshake_timeout))
    {
        VIGIL_THROW(
            configuration_error()
            << invalid_option_info("handshake timeout")
            << internal_error_message_info(
                   "handshake timeout must be positive and schedulable"));
    }
    if (!is_schedulable(options.subscribe_timeout)
        || !is_positive(options.subscribe_timeout))
    {
        VIGIL_THROW(
            configuration_error()
            << invalid_option_info("subscribe timeout")
            << internal_error_message_info(
                   "subscribe timeout must be positive and schedulable"));
    }
}

} // namespace

streaming_client::streaming_client(
    event_loop& loop,
    std::shared_ptr<streaming_transport_interface> transport,
    streaming_options options)
    : loop_(loop), transport_(std::move(transport)), options_(std::move(options))
{
    if (!transport_)
    {
        VIGIL_THROW(
            configuration_error() << invalid_option_info("transport"));
    }
    validate_streaming_options(options_);

    for (auto const& header : options_.headers)
        transport_->set_header(header.first, header.second);
    for (auto const& label : options_.disabled)
        transport_->disable(label);
    for (auto const& extension : options_.extensions)
        transport_->add_extension(extension);
}

cppcoro::task<>
streaming_client::handshake()
{
    if (state_ != streaming_state::READY)
    {
        VIGIL_THROW(
            internal_check_failed() << internal_error_message_info(
                "streaming client has already handshaken"));
    }
    state_ = streaming_state::HANDSHAKING;

    auto logger = get_logger();
    auto connected = std::make_shared<settlement<bool>>();
    auto timer = loop_.post_after(
        options_.handshake_timeout.to_chrono(),
        [connected, timeout = options_.handshake_timeout] {
            connected->reject(std::make_exception_ptr(
                streaming_handshake_timeout() << timeout_info(timeout)));
        });
    transport_->handshake([connected] { connected->resolve(true); });

    try
    {
        co_await connected->result();
    }
    catch (streaming_handshake_timeout&)
    {
        state_ = streaming_state::TIMED_OUT;
        logger->warn(
            "streaming handshake timed out after {}ms",
            options_.handshake_timeout.to_milliseconds());
        throw;
    }
    loop_.cancel(timer);
    state_ = streaming_state::CONNECTED;
    logger->debug("streaming handshake complete");
}

cppcoro::task<nlohmann::json>
streaming_client::subscribe(std::function<cppcoro::task<>()> stream_init)
{
    if (state_ == streaming_state::READY)
        co_await handshake();
    if (state_ != streaming_state::CONNECTED)
    {
        VIGIL_THROW(
            internal_check_failed() << internal_error_message_info(
                "streaming client isn't ready to subscribe"));
    }
    state_ = streaming_state::SUBSCRIBED;

    auto logger = get_logger();
    logger->info("subscribing to {}", options_.channel);

    // :established settles with the subscription's own outcome, :outcome
    // with the outcome of the whole observation.
    auto established = std::make_shared<settlement<bool>>();
    auto outcome = std::make_shared<settlement<nlohmann::json>>();

    auto timer = loop_.post_after(
        options_.subscribe_timeout.to_chrono(),
        [established, outcome, timeout = options_.subscribe_timeout] {
            auto error = std::make_exception_ptr(
                streaming_subscribe_timeout() << timeout_info(timeout));
            established->reject(error);
            outcome->reject(error);
        });

    // Coroutines can't suspend inside exception handlers, so the failure is
    // captured here and rethrown once the transport has been disconnected.
    std::exception_ptr failure;
    nlohmann::json payload;
    std::shared_ptr<subscription_interface> subscription;
    try
    {
        subscription = transport_->subscribe(
            options_.channel,
            [outcome, processor = options_.processor](
                nlohmann::json const& message) {
                if (outcome->is_settled())
                    return;
                try
                {
                    auto status = processor(message);
                    if (status.completed)
                    {
                        outcome->resolve(
                            status.payload ? std::move(*status.payload)
                                           : nlohmann::json());
                    }
                }
                catch (...)
                {
                    outcome->reject(std::current_exception());
                }
            });
        subscription->callback(
            [established] { established->resolve(true); });
        subscription->errback(
            [established, outcome](std::exception_ptr error) {
                established->reject(error);
                outcome->reject(error);
            });
        co_await established->result();
        logger->debug("subscription to {} complete", options_.channel);
        if (stream_init)
            co_await stream_init();
        payload = co_await outcome->result();
        state_ = streaming_state::COMPLETED;
    }
    catch (streaming_subscribe_timeout&)
    {
        state_ = streaming_state::TIMED_OUT;
        failure = std::current_exception();
    }
    catch (...)
    {
        state_ = streaming_state::FAILED;
        failure = std::current_exception();
    }

    loop_.cancel(timer);
    // Messages that are still on their way must not reach the processor.
    if (failure)
        outcome->reject(failure);
    co_await transport_->disconnect();

    if (failure)
    {
        logger->warn("subscription to {} failed", options_.channel);
        std::rethrow_exception(failure);
    }
    logger->info("streamed operation on {} completed", options_.channel);
    co_return payload;
}

} // namespace vigil

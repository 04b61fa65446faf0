#include <vigil/streaming/mock_transport.h>

#include <vigil/core/logging.hpp>
#include <vigil/utilities/errors.h>

namespace vigil {

namespace {

subscription_result
make_mock_outcome(mock_subscription_options const& options)
{
    if (options.outcome == subscription_outcome::CALLBACK)
        return subscription_delivered();
    if (options.error)
        return subscription_failed{options.error};
    return subscription_failed{std::make_exception_ptr(
        subscription_failure() << channel_url_info(options.url)
                               << subscriber_id_info(options.id))};
}

} // namespace

mock_subscription::mock_subscription(
    event_loop& loop, mock_subscription_options const& options)
    : loop_(loop), outcome_(make_mock_outcome(options))
{
}

void
mock_subscription::callback(std::function<void()> on_complete)
{
    if (!settled_)
    {
        callbacks_.push_back(std::move(on_complete));
        return;
    }
    // It's already settled, so this is only invoked if it matches the
    // outcome, and still asynchronously.
    if (is_delivered(outcome_))
        loop_.post(std::move(on_complete));
}

void
mock_subscription::errback(
    std::function<void(std::exception_ptr error)> on_error)
{
    if (!settled_)
    {
        errbacks_.push_back(std::move(on_error));
        return;
    }
    if (!is_delivered(outcome_))
    {
        auto error = std::get<subscription_failed>(outcome_).error;
        loop_.post([on_error = std::move(on_error), error] { on_error(error); });
    }
}

void
mock_subscription::on_settled(
    std::function<void(subscription_result const& result)> observer)
{
    if (!settled_)
    {
        observers_.push_back(std::move(observer));
        return;
    }
    loop_.post([observer = std::move(observer), self = shared_from_this()] {
        observer(self->outcome_);
    });
}

void
mock_subscription::start()
{
    if (started_)
    {
        VIGIL_THROW(
            internal_check_failed() << internal_error_message_info(
                "mock subscription started twice"));
    }
    started_ = true;
    loop_.post([self = shared_from_this()] { self->settle(); });
}

void
mock_subscription::settle()
{
    settled_ = true;
    // Move the registrations out first so that callbacks that register more
    // callbacks see a settled subscription.
    auto callbacks = std::move(callbacks_);
    auto errbacks = std::move(errbacks_);
    auto observers = std::move(observers_);
    callbacks_.clear();
    errbacks_.clear();
    observers_.clear();
    notify(callbacks, errbacks, observers);
}

void
mock_subscription::notify(
    std::vector<std::function<void()>> const& callbacks,
    std::vector<std::function<void(std::exception_ptr)>> const& errbacks,
    std::vector<std::function<void(subscription_result const&)>> const&
        observers)
{
    if (is_delivered(outcome_))
    {
        for (auto const& callback : callbacks)
            callback();
    }
    else
    {
        auto error = std::get<subscription_failed>(outcome_).error;
        for (auto const& errback : errbacks)
            errback(error);
    }
    for (auto const& observer : observers)
        observer(outcome_);
}

mock_streaming_transport::mock_streaming_transport(
    event_loop& loop, mock_subscription_options options)
    : loop_(loop), options_(std::move(options))
{
    if (!options_.playlist)
        options_.playlist = std::vector<nlohmann::json>{
            nlohmann::json{{"id", options_.id}}};
}

void
mock_streaming_transport::add_extension(nlohmann::json const& extension)
{
    extensions_.push_back(extension);
}

void
mock_streaming_transport::disable(string const& label)
{
    disabled_.push_back(label);
}

void
mock_streaming_transport::set_header(string const& name, string const& value)
{
    headers_[name] = value;
}

void
mock_streaming_transport::handshake(std::function<void()> callback)
{
    ++handshake_count_;
    loop_.post(std::move(callback));
}

std::shared_ptr<subscription_interface>
mock_streaming_transport::subscribe(
    string const& channel, message_handler on_message)
{
    subscribed_channels_.push_back(channel);
    get_logger()->debug(
        "mock subscription to {} for {}", channel, options_.id);

    auto subscription = std::make_shared<mock_subscription>(loop_, options_);
    auto handler = std::make_shared<message_handler>(std::move(on_message));
    auto& loop = loop_;
    auto playlist = *options_.playlist;
    subscription->on_settled(
        [&loop, handler, playlist](subscription_result const& result) {
            if (!is_delivered(result))
                return;
            // Each message is delivered as its own unit of work. The loop
            // runs work in posting order, so the playlist order is kept.
            for (auto const& message : playlist)
                loop.post([handler, message] { (*handler)(message); });
        });
    subscription->start();
    return subscription;
}

cppcoro::task<>
mock_streaming_transport::disconnect()
{
    ++disconnect_count_;
    co_return;
}

} // namespace vigil

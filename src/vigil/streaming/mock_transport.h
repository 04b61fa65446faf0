#ifndef VIGIL_STREAMING_MOCK_TRANSPORT_H
#define VIGIL_STREAMING_MOCK_TRANSPORT_H

#include <map>
#include <vector>

#include <vigil/async/event_loop.h>
#include <vigil/core/exception.hpp>
#include <vigil/streaming/transport.hpp>

namespace vigil {

// Does a mock subscription complete or fail?
enum class subscription_outcome
{
    CALLBACK,
    ERRBACK
};

// This is the default error that a failing mock subscription reports.
VIGIL_DEFINE_EXCEPTION(subscription_failure)
VIGIL_DEFINE_ERROR_INFO(string, channel_url)
VIGIL_DEFINE_ERROR_INFO(string, subscriber_id)

struct mock_subscription_options
{
    // the URL of the (simulated) server
    string url;
    // a simple ID to associate with the subscriber
    string id;
    // Does the subscription complete or fail?
    subscription_outcome outcome = subscription_outcome::CALLBACK;
    // If the subscription fails, this is the error it reports. If this is
    // omitted, a subscription_failure is reported.
    std::exception_ptr error;
    // the messages that a successful subscription delivers, in order
    // If this is omitted, a single message of the form { "id": <id> } is
    // delivered.
    optional<std::vector<nlohmann::json>> playlist;
};

// A mock_subscription settles on the next tick after it's started, according
// to its options.
struct mock_subscription
    : subscription_interface,
      std::enable_shared_from_this<mock_subscription>
{
    mock_subscription(event_loop& loop, mock_subscription_options const& options);

    void
    callback(std::function<void()> on_complete) override;

    void
    errback(std::function<void(std::exception_ptr error)> on_error) override;

    void
    on_settled(std::function<void(subscription_result const& result)>
                   observer) override;

    // Schedule the settlement of the subscription.
    void
    start();

    bool
    is_settled() const
    {
        return settled_;
    }

 private:
    void
    settle();

    // Invoke the callbacks that apply to :outcome_.
    void
    notify(
        std::vector<std::function<void()>> const& callbacks,
        std::vector<std::function<void(std::exception_ptr)>> const& errbacks,
        std::vector<std::function<void(subscription_result const&)>> const&
            observers);

    event_loop& loop_;
    subscription_result outcome_;
    bool started_ = false;
    bool settled_ = false;
    std::vector<std::function<void()>> callbacks_;
    std::vector<std::function<void(std::exception_ptr)>> errbacks_;
    std::vector<std::function<void(subscription_result const&)>> observers_;
};

// mock_streaming_transport simulates a streaming server without any network
// traffic. All of its asynchronous behavior is scheduled on an event_loop, one
// unit of work per simulated network event, so that it looks like real
// streaming without the latency.
struct mock_streaming_transport : streaming_transport_interface
{
    mock_streaming_transport(event_loop& loop, mock_subscription_options options);

    void
    add_extension(nlohmann::json const& extension) override;

    void
    disable(string const& label) override;

    void
    set_header(string const& name, string const& value) override;

    void
    handshake(std::function<void()> callback) override;

    std::shared_ptr<subscription_interface>
    subscribe(string const& channel, message_handler on_message) override;

    cppcoro::task<>
    disconnect() override;

    // The following record what's been done to the transport.

    std::vector<nlohmann::json> const&
    extensions() const
    {
        return extensions_;
    }

    std::vector<string> const&
    disabled() const
    {
        return disabled_;
    }

    std::map<string, string> const&
    headers() const
    {
        return headers_;
    }

    std::vector<string> const&
    subscribed_channels() const
    {
        return subscribed_channels_;
    }

    unsigned
    handshake_count() const
    {
        return handshake_count_;
    }

    unsigned
    disconnect_count() const
    {
        return disconnect_count_;
    }

    mock_subscription_options const&
    options() const
    {
        return options_;
    }

 private:
    event_loop& loop_;
    mock_subscription_options options_;

    std::vector<nlohmann::json> extensions_;
    std::vector<string> disabled_;
    std::map<string, string> headers_;
    std::vector<string> subscribed_channels_;
    unsigned handshake_count_ = 0;
    unsigned disconnect_count_ = 0;
};

} // namespace vigil

#endif

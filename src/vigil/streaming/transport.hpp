#ifndef VIGIL_STREAMING_TRANSPORT_HPP
#define VIGIL_STREAMING_TRANSPORT_HPP

#include <exception>
#include <functional>
#include <memory>
#include <variant>

#include <cppcoro/task.hpp>
#include <nlohmann/json.hpp>

#include <vigil/core/type_definitions.hpp>

// This file defines the contract between vigil's streaming client and the
// push-based (comet-style) transport that actually talks to the network.
// The lifecycle is handshake -> subscribe -> (deliver* | fail) -> disconnect.

namespace vigil {

// called once per delivered message, in delivery order
typedef std::function<void(nlohmann::json const& message)> message_handler;

// the two terminal lifecycle events of a subscription
struct subscription_delivered
{
};
struct subscription_failed
{
    std::exception_ptr error;
};
typedef std::variant<subscription_delivered, subscription_failed>
    subscription_result;

inline bool
is_delivered(subscription_result const& result)
{
    return std::holds_alternative<subscription_delivered>(result);
}

// A subscription represents one observation session on a channel.
// Exactly one of its two outcomes happens, once. Callbacks are always invoked
// asynchronously (never from within the registration call).
struct subscription_interface
{
    virtual ~subscription_interface()
    {
    }

    // Register a callback for the 'subscription complete' outcome.
    virtual void
    callback(std::function<void()> on_complete)
        = 0;

    // Register a callback for the 'subscription failed' outcome.
    virtual void
    errback(std::function<void(std::exception_ptr error)> on_error) = 0;

    // Register a callback for whichever outcome happens. These are invoked
    // after the callbacks/errbacks for the same outcome.
    virtual void
    on_settled(std::function<void(subscription_result const& result)> observer)
        = 0;
};

struct streaming_transport_interface
{
    virtual ~streaming_transport_interface()
    {
    }

    // The following are configuration calls for the underlying client.
    // Implementations must accept them, but they have no required behavior.
    virtual void
    add_extension(nlohmann::json const& extension)
        = 0;
    virtual void
    disable(string const& label)
        = 0;
    virtual void
    set_header(string const& name, string const& value)
        = 0;

    // Negotiate the connection. :callback is invoked (asynchronously) once
    // the transport is connected.
    virtual void
    handshake(std::function<void()> callback)
        = 0;

    // Subscribe to :channel. This returns immediately with a live
    // subscription. Messages are passed to :on_message once the subscription
    // is complete.
    virtual std::shared_ptr<subscription_interface>
    subscribe(string const& channel, message_handler on_message)
        = 0;

    // Disconnect from the server. This is idempotent.
    virtual cppcoro::task<>
    disconnect()
        = 0;
};

} // namespace vigil

#endif

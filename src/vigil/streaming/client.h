#ifndef VIGIL_STREAMING_CLIENT_H
#define VIGIL_STREAMING_CLIENT_H

#include <map>
#include <memory>
#include <vector>

#include <vigil/async/event_loop.h>
#include <vigil/status/types.hpp>
#include <vigil/streaming/transport.hpp>

namespace vigil {

// A stream processor interprets one delivered message as a status. When it
// reports completion, the subscription is done. It may throw, in which case
// the subscription fails with that error.
typedef std::function<status_result(nlohmann::json const& message)>
    stream_processor;

struct streaming_options
{
    // the channel to subscribe to
    string channel;
    stream_processor processor;
    duration handshake_timeout = seconds(30);
    duration subscribe_timeout = minutes(3);

    // These are passed along to the transport when the client is created.
    std::map<string, string> headers;
    std::vector<string> disabled;
    std::vector<nlohmann::json> extensions;
};

enum class streaming_state
{
    READY,
    HANDSHAKING,
    CONNECTED,
    SUBSCRIBED,
    COMPLETED,
    FAILED,
    TIMED_OUT
};

// These are thrown when the transport doesn't come through in time.
VIGIL_DEFINE_DERIVED_EXCEPTION(streaming_handshake_timeout, observation_timeout)
VIGIL_DEFINE_DERIVED_EXCEPTION(streaming_subscribe_timeout, observation_timeout)

// A streaming_client observes a remote operation through a push channel
// rather than by polling. It handshakes with the transport, subscribes to a
// channel and feeds each delivered message to the stream processor until one
// of them reports completion.
//
// Errors reported by the transport or thrown by the processor are passed
// through unchanged. Every terminal outcome of a subscription disconnects the
// transport.
//
struct streaming_client : noncopyable
{
    // This validates the options (throwing configuration_error) and applies
    // the headers, disabled features and extensions to the transport.
    streaming_client(
        event_loop& loop,
        std::shared_ptr<streaming_transport_interface> transport,
        streaming_options options);

    // Connect to the server, failing with streaming_handshake_timeout if the
    // transport doesn't connect within the handshake timeout.
    cppcoro::task<>
    handshake();

    // Subscribe to the channel and wait for the operation to complete.
    // The result is the payload of the completing status (or null).
    //
    // If the client hasn't connected yet, this handshakes first.
    //
    // :stream_init (if supplied) is run once the subscription is complete.
    // It's typically used to kick off the operation whose progress is being
    // streamed. If it throws, the subscription fails with that error.
    //
    // If the operation doesn't complete within the subscribe timeout, this
    // fails with streaming_subscribe_timeout.
    //
    cppcoro::task<nlohmann::json>
    subscribe(std::function<cppcoro::task<>()> stream_init = nullptr);

    streaming_state
    state() const
    {
        return state_;
    }

    streaming_transport_interface&
    transport()
    {
        return *transport_;
    }

 private:
    event_loop& loop_;
    std::shared_ptr<streaming_transport_interface> transport_;
    streaming_options options_;
    streaming_state state_ = streaming_state::READY;
};

} // namespace vigil

#endif

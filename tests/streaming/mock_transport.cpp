#include <vigil/streaming/mock_transport.h>

#include <stdexcept>

#include <vigil/async/run.h>
#include <vigil/utilities/errors.h>
#include <vigil/utilities/testing.h>

using namespace vigil;

namespace {

mock_subscription_options
make_options(subscription_outcome outcome)
{
    mock_subscription_options options;
    options.url = "https://streaming.example.com/cometd";
    options.id = "subscriber-12";
    options.outcome = outcome;
    return options;
}

} // namespace

TEST_CASE("mock handshake", "[streaming][mock]")
{
    manual_clock clock;
    event_loop loop(clock);
    mock_streaming_transport transport(
        loop, make_options(subscription_outcome::CALLBACK));

    bool connected = false;
    transport.handshake([&] { connected = true; });
    // The callback is never invoked inside the call.
    REQUIRE(!connected);
    REQUIRE(transport.handshake_count() == 1);
    loop.run_until_idle();
    REQUIRE(connected);
}

TEST_CASE("mock playlist delivery", "[streaming][mock]")
{
    manual_clock clock;
    event_loop loop(clock);

    auto options = make_options(subscription_outcome::CALLBACK);
    options.playlist = std::vector<nlohmann::json>{
        nlohmann::json{{"completed", false}},
        nlohmann::json{{"completed", false}},
        nlohmann::json{{"completed", true}, {"name", "foo"}}};
    mock_streaming_transport transport(loop, options);

    // Record every event in the order it happens.
    std::vector<string> events;
    transport.handshake([&] { events.push_back("handshake"); });
    auto subscription = transport.subscribe(
        "/topic/ops/17", [&](nlohmann::json const& message) {
            events.push_back(message.dump());
        });
    subscription->callback([&] { events.push_back("callback"); });
    subscription->errback(
        [&](std::exception_ptr) { events.push_back("errback"); });
    REQUIRE(events.empty());

    loop.run_until_idle();
    REQUIRE(
        events
        == std::vector<string>{
            "handshake",
            "callback",
            R"({"completed":false})",
            R"({"completed":false})",
            R"({"completed":true,"name":"foo"})"});
    REQUIRE(
        transport.subscribed_channels()
        == std::vector<string>{"/topic/ops/17"});
}

TEST_CASE("mock default message", "[streaming][mock]")
{
    manual_clock clock;
    event_loop loop(clock);
    mock_streaming_transport transport(
        loop, make_options(subscription_outcome::CALLBACK));

    std::vector<nlohmann::json> messages;
    transport.subscribe("/ops", [&](nlohmann::json const& message) {
        messages.push_back(message);
    });
    loop.run_until_idle();
    REQUIRE(
        messages
        == std::vector<nlohmann::json>{
            nlohmann::json{{"id", "subscriber-12"}}});
}

TEST_CASE("mock subscription failure", "[streaming][mock]")
{
    manual_clock clock;
    event_loop loop(clock);

    auto options = make_options(subscription_outcome::ERRBACK);
    options.error = std::make_exception_ptr(std::runtime_error("rejected"));
    mock_streaming_transport transport(loop, options);

    bool completed = false;
    int error_count = 0;
    unsigned message_count = 0;
    auto subscription = transport.subscribe(
        "/ops", [&](nlohmann::json const&) { ++message_count; });
    subscription->callback([&] { completed = true; });
    subscription->errback([&](std::exception_ptr error) {
        ++error_count;
        REQUIRE(error == options.error);
    });
    loop.run_until_idle();

    REQUIRE(!completed);
    REQUIRE(error_count == 1);
    REQUIRE(message_count == 0);
}

TEST_CASE("mock default subscription failure", "[streaming][mock]")
{
    manual_clock clock;
    event_loop loop(clock);
    mock_streaming_transport transport(
        loop, make_options(subscription_outcome::ERRBACK));

    std::exception_ptr reported;
    auto subscription
        = transport.subscribe("/ops", [](nlohmann::json const&) {});
    subscription->errback(
        [&](std::exception_ptr error) { reported = error; });
    loop.run_until_idle();

    REQUIRE(reported);
    try
    {
        std::rethrow_exception(reported);
    }
    catch (subscription_failure& e)
    {
        REQUIRE(
            get_required_error_info<channel_url_info>(e)
            == "https://streaming.example.com/cometd");
        REQUIRE(get_required_error_info<subscriber_id_info>(e) == "subscriber-12");
    }
}

TEST_CASE("mock late registrations", "[streaming][mock]")
{
    manual_clock clock;
    event_loop loop(clock);
    mock_streaming_transport transport(
        loop, make_options(subscription_outcome::CALLBACK));

    auto subscription
        = transport.subscribe("/ops", [](nlohmann::json const&) {});
    loop.run_until_idle();

    // Registrations after settlement only fire if they match the outcome, and
    // still not inside the registration call.
    bool completed = false;
    bool failed = false;
    bool observed = false;
    subscription->callback([&] { completed = true; });
    subscription->errback([&](std::exception_ptr) { failed = true; });
    subscription->on_settled([&](subscription_result const& result) {
        observed = is_delivered(result);
    });
    REQUIRE(!completed);
    loop.run_until_idle();
    REQUIRE(completed);
    REQUIRE(!failed);
    REQUIRE(observed);
}

TEST_CASE("mock subscriptions start once", "[streaming][mock]")
{
    manual_clock clock;
    event_loop loop(clock);

    auto subscription = std::make_shared<mock_subscription>(
        loop, make_options(subscription_outcome::CALLBACK));
    subscription->start();
    REQUIRE_THROWS_AS(subscription->start(), internal_check_failed);
    loop.run_until_idle();
    REQUIRE(subscription->is_settled());
}

TEST_CASE("mock configuration calls", "[streaming][mock]")
{
    manual_clock clock;
    event_loop loop(clock);
    mock_streaming_transport transport(
        loop, make_options(subscription_outcome::CALLBACK));

    transport.set_header("Authorization", "Bearer xyz");
    transport.disable("websocket");
    transport.add_extension({{"ack", true}});
    REQUIRE(transport.headers().at("Authorization") == "Bearer xyz");
    REQUIRE(transport.disabled() == std::vector<string>{"websocket"});
    REQUIRE(transport.extensions().size() == 1);
}

TEST_CASE("mock disconnect", "[streaming][mock]")
{
    manual_clock clock;
    event_loop loop(clock);
    mock_streaming_transport transport(
        loop, make_options(subscription_outcome::CALLBACK));

    // Disconnecting without a subscription is harmless.
    run_until_complete(loop, transport.disconnect());
    REQUIRE(transport.disconnect_count() == 1);

    bool established = false;
    transport.handshake([] {});
    auto subscription = transport.subscribe(
        "/topic/ops/17", [](nlohmann::json const&) {});
    subscription->callback([&] { established = true; });
    loop.run_until_idle();
    REQUIRE(established);

    // Disconnecting a settled subscription, and doing it again, is fine too.
    run_until_complete(loop, transport.disconnect());
    run_until_complete(loop, transport.disconnect());
    REQUIRE(transport.disconnect_count() == 3);
    REQUIRE(loop.pending_count() == 0);
}

TEST_CASE("mock disconnect after an errback", "[streaming][mock]")
{
    manual_clock clock;
    event_loop loop(clock);
    mock_streaming_transport transport(
        loop, make_options(subscription_outcome::ERRBACK));

    bool failed = false;
    transport.handshake([] {});
    auto subscription = transport.subscribe(
        "/topic/ops/17", [](nlohmann::json const&) {});
    subscription->errback([&](std::exception_ptr) { failed = true; });
    loop.run_until_idle();
    REQUIRE(failed);

    run_until_complete(loop, transport.disconnect());
    run_until_complete(loop, transport.disconnect());
    REQUIRE(transport.disconnect_count() == 2);
}

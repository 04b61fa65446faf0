#ifndef VIGIL_UTILITIES_TESTING_H
#define VIGIL_UTILITIES_TESTING_H

#include <memory>
#include <vector>

#include <catch2/catch.hpp>

#include <spdlog/sinks/ringbuffer_sink.h>

#include <vigil/core/type_definitions.hpp>

namespace vigil {

// The test context holds the things that are shared by all tests in a run.
// It's created once, by the test runner, before any tests run.
struct test_context : noncopyable
{
    test_context();

    // a unique ID for this test run
    string id;

    // Generate a new unique string.
    string
    uniqid() const;

    // Everything logged through the "vigil" logger during tests goes to this
    // in-memory sink rather than to the console.
    std::shared_ptr<spdlog::sinks::ringbuffer_sink_mt> log_sink;

    // (Re)register the "vigil" logger so that it writes to :log_sink.
    // Tests that replace the logger call this when they're done.
    void
    capture_logging();

    // Get the formatted lines that have been logged so far (or at least the
    // most recent ones).
    std::vector<string>
    logged_lines() const;

    // Does any logged line contain :text?
    bool
    was_logged(string const& text) const;
};

// Create the test context. This is done by the test runner.
void
initialize_test_context();

// Get the context for the current test run.
test_context&
the_test_context();

} // namespace vigil

#endif

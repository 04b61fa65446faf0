#include <vigil/utilities/testing.h>

#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <spdlog/spdlog.h>

#include <vigil/utilities/errors.h>

namespace vigil {

namespace {

std::unique_ptr<test_context> the_context;

string
generate_uniqid()
{
    thread_local boost::uuids::random_generator generator;
    return boost::uuids::to_string(generator());
}

} // namespace

test_context::test_context()
    : id(generate_uniqid()),
      log_sink(std::make_shared<spdlog::sinks::ringbuffer_sink_mt>(4096))
{
    capture_logging();
}

void
test_context::capture_logging()
{
    // Replace whatever "vigil" logger might exist with one that logs to
    // memory.
    spdlog::drop("vigil");
    auto logger = std::make_shared<spdlog::logger>("vigil", log_sink);
    logger->set_level(spdlog::level::trace);
    spdlog::register_logger(logger);
}

string
test_context::uniqid() const
{
    return generate_uniqid();
}

std::vector<string>
test_context::logged_lines() const
{
    return log_sink->last_formatted();
}

bool
test_context::was_logged(string const& text) const
{
    for (auto const& line : logged_lines())
    {
        if (line.find(text) != string::npos)
            return true;
    }
    return false;
}

void
initialize_test_context()
{
    the_context.reset(new test_context);
}

test_context&
the_test_context()
{
    if (!the_context)
    {
        VIGIL_THROW(
            internal_check_failed() << internal_error_message_info(
                "test context requested before initialization"));
    }
    return *the_context;
}

} // namespace vigil

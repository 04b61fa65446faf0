#include <vigil/core/logging.hpp>

#include <vigil/fs/file_io.h>
#include <vigil/utilities/testing.h>

using namespace vigil;

TEST_CASE("test logging", "[core][logging]")
{
    auto& context = the_test_context();
    auto marker = context.uniqid();
    REQUIRE(marker != context.uniqid());

    // During tests, the logger writes to memory.
    get_logger()->debug("logging check {}", marker);
    REQUIRE(context.was_logged(marker));
    REQUIRE(!context.was_logged(context.uniqid()));

    // Initializing again keeps the existing logger.
    logging_config config;
    config.level = "error";
    initialize_logging(config);
    get_logger()->info("after reinitialization {}", marker);
    REQUIRE(context.was_logged("after reinitialization " + marker));
}

namespace {

// Puts the in-memory test logger back when a test that replaced it is done.
struct logging_capture_restorer
{
    ~logging_capture_restorer()
    {
        the_test_context().capture_logging();
    }
};

} // namespace

TEST_CASE("configured logging", "[core][logging]")
{
    auto& context = the_test_context();
    auto path = file_path("vigil_logging_test.log");
    if (exists(path))
        remove(path);

    logging_capture_restorer restorer;
    spdlog::drop("vigil");
    logging_config config;
    config.level = "warning";
    config.file = path;
    initialize_logging(config);

    auto logger = get_logger();
    REQUIRE(logger->level() == spdlog::level::warn);

    auto shown = context.uniqid();
    auto hidden = context.uniqid();
    logger->warn("configured logging check {}", shown);
    logger->info("configured logging check {}", hidden);
    logger->flush();

    auto logged = read_file_contents(path);
    REQUIRE(logged.find(shown) != string::npos);
    REQUIRE(logged.find(hidden) == string::npos);
    // The file gets the lines instead of the test sink.
    REQUIRE(!context.was_logged(shown));
}

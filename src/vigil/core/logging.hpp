#ifndef VIGIL_CORE_LOGGING_HPP
#define VIGIL_CORE_LOGGING_HPP

#include <memory>

#include <spdlog/spdlog.h>

#include <vigil/core/type_definitions.hpp>

namespace vigil {

struct logging_config
{
    // the minimum level that's logged, as spdlog names it ("trace", "debug",
    // "info", "warning", "error", "critical", "off") - defaults to "info"
    optional<string> level;
    // if set, log lines are also written to this (rotating) file
    optional<file_path> file;
};

// Create and register the "vigil" logger.
// If the logger already exists, this does nothing, so the first caller wins.
void
initialize_logging(logging_config const& config = logging_config());

// Get the "vigil" logger, initializing it with the default configuration if
// nobody has done so yet.
std::shared_ptr<spdlog::logger>
get_logger();

} // namespace vigil

#endif

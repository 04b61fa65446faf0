#include <vigil/core/logging.hpp>

#include <mutex>
#include <vector>

#include <spdlog/sinks/rotating_file_sink.h>
#ifdef _WIN32
#include <spdlog/sinks/wincolor_sink.h>
#else
#include <spdlog/sinks/ansicolor_sink.h>
#endif

namespace vigil {

namespace {

std::mutex logger_creation_mutex;

} // namespace

void
initialize_logging(logging_config const& config)
{
    std::scoped_lock<std::mutex> lock(logger_creation_mutex);
    if (spdlog::get("vigil"))
        return;

    std::vector<spdlog::sink_ptr> sinks;
#ifdef _WIN32
    sinks.push_back(
        std::make_shared<spdlog::sinks::wincolor_stdout_sink_mt>());
#else
    sinks.push_back(
        std::make_shared<spdlog::sinks::ansicolor_stdout_sink_mt>());
#endif
    if (config.file)
    {
        sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            config.file->string(), 262144, 2));
    }
    auto combined_logger
        = std::make_shared<spdlog::logger>("vigil", begin(sinks), end(sinks));
    combined_logger->set_level(
        config.level ? spdlog::level::from_str(*config.level)
                     : spdlog::level::info);
    spdlog::register_logger(combined_logger);
}

std::shared_ptr<spdlog::logger>
get_logger()
{
    auto logger = spdlog::get("vigil");
    if (!logger)
    {
        initialize_logging();
        logger = spdlog::get("vigil");
    }
    return logger;
}

} // namespace vigil

#include <vigil/config.hpp>

#include <fmt/format.h>

#include <vigil/fs/file_io.h>
#include <vigil/utilities/errors.h>

namespace vigil {

namespace {

// Get the subobject :field of :object, or null if it's not there.
nlohmann::json const&
get_section(nlohmann::json const& object, char const* field)
{
    static nlohmann::json const empty;
    auto i = object.find(field);
    if (i == object.end())
        return empty;
    if (!i->is_object())
    {
        VIGIL_THROW(
            parsing_error()
            << expected_format_info(
                   fmt::format("configuration section '{}'", field))
            << parsed_text_info(i->dump()));
    }
    return *i;
}

optional<duration>
read_duration(nlohmann::json const& section, char const* field)
{
    if (section.is_null())
        return none;
    auto i = section.find(field);
    if (i == section.end())
        return none;
    return i->get<duration>();
}

optional<string>
read_string(nlohmann::json const& section, char const* field)
{
    if (section.is_null())
        return none;
    auto i = section.find(field);
    if (i == section.end())
        return none;
    if (!i->is_string())
    {
        VIGIL_THROW(
            parsing_error()
            << expected_format_info(fmt::format("string for '{}'", field))
            << parsed_text_info(i->dump()));
    }
    return i->get<string>();
}

} // namespace

monitor_config
parse_monitor_config(string const& text)
{
    nlohmann::json document;
    try
    {
        document = nlohmann::json::parse(text);
    }
    catch (nlohmann::json::parse_error& e)
    {
        VIGIL_THROW(
            parsing_error() << expected_format_info("JSON")
                            << parsed_text_info(text)
                            << parsing_error_info(e.what()));
    }
    if (!document.is_object())
    {
        VIGIL_THROW(
            parsing_error() << expected_format_info("JSON object")
                            << parsed_text_info(text));
    }

    monitor_config config;

    auto const& polling = get_section(document, "polling");
    config.polling.frequency = read_duration(polling, "frequency");
    config.polling.timeout = read_duration(polling, "timeout");

    auto const& streaming = get_section(document, "streaming");
    config.streaming.handshake_timeout
        = read_duration(streaming, "handshake_timeout");
    config.streaming.subscribe_timeout
        = read_duration(streaming, "subscribe_timeout");

    auto const& logging = get_section(document, "logging");
    config.logging.level = read_string(logging, "level");
    // spdlog maps any name it doesn't know to "off".
    if (config.logging.level
        && spdlog::level::from_str(*config.logging.level) == spdlog::level::off
        && *config.logging.level != "off")
    {
        VIGIL_THROW(
            parsing_error() << expected_format_info("logging level")
                            << parsed_text_info(*config.logging.level));
    }
    if (auto file = read_string(logging, "file"))
        config.logging.file = file_path(*file);

    return config;
}

monitor_config
load_monitor_config(file_path const& path)
{
    return parse_monitor_config(read_file_contents(path));
}

polling_options
make_polling_options(monitor_config const& config, status_probe probe)
{
    polling_options options;
    options.probe = std::move(probe);
    options.frequency = config.polling.frequency.value_or(seconds(10));
    options.timeout = config.polling.timeout.value_or(minutes(10));
    return options;
}

streaming_options
make_streaming_options(
    monitor_config const& config, string channel, stream_processor processor)
{
    streaming_options options;
    options.channel = std::move(channel);
    options.processor = std::move(processor);
    options.handshake_timeout
        = config.streaming.handshake_timeout.value_or(seconds(30));
    options.subscribe_timeout
        = config.streaming.subscribe_timeout.value_or(minutes(3));
    return options;
}

} // namespace vigil

#ifndef VIGIL_CONFIG_HPP
#define VIGIL_CONFIG_HPP

#include <vigil/core/logging.hpp>
#include <vigil/status/polling.h>
#include <vigil/streaming/client.h>

namespace vigil {

// All fields are optional. Omitted fields take the defaults listed here.

struct polling_config
{
    // the time between probes (defaults to 10 seconds)
    optional<duration> frequency;
    // the total time allowed (defaults to 10 minutes)
    optional<duration> timeout;
};

struct streaming_config
{
    // defaults to 30 seconds
    optional<duration> handshake_timeout;
    // defaults to 3 minutes
    optional<duration> subscribe_timeout;
};

struct monitor_config
{
    polling_config polling;
    streaming_config streaming;
    logging_config logging;
};

// Parse a configuration document (JSON).
// This throws parsing_error if the text isn't valid JSON or if a field has
// the wrong type.
monitor_config
parse_monitor_config(string const& text);

// Read and parse a configuration file.
// This also throws file_access_error if the file can't be read.
monitor_config
load_monitor_config(file_path const& path);

// Combine the configuration with a probe to get the options for a
// polling_engine.
polling_options
make_polling_options(monitor_config const& config, status_probe probe);

// Combine the configuration with a channel and processor to get the options
// for a streaming_client.
streaming_options
make_streaming_options(
    monitor_config const& config, string channel, stream_processor processor);

} // namespace vigil

#endif

#ifndef VIGIL_UTILITIES_ERRORS_H
#define VIGIL_UTILITIES_ERRORS_H

#include <vigil/core/exception.hpp>

namespace vigil {

// a human-readable description of what went wrong, usually as reported by a
// lower-level library
VIGIL_DEFINE_ERROR_INFO(string, internal_error_message)

// A condition that vigil guarantees internally didn't hold, or a caller broke
// a documented usage rule (e.g., observing the same engine twice).
VIGIL_DEFINE_EXCEPTION(internal_check_failed)

// Options supplied to one of the monitors were missing or invalid.
VIGIL_DEFINE_EXCEPTION(configuration_error)
// the name of the offending option
VIGIL_DEFINE_ERROR_INFO(string, invalid_option)

// Text (configuration, units, etc.) couldn't be parsed.
VIGIL_DEFINE_EXCEPTION(parsing_error)
// a description of what the text was supposed to be
VIGIL_DEFINE_ERROR_INFO(string, expected_format)
VIGIL_DEFINE_ERROR_INFO(string, parsed_text)
// the parser's own explanation, when it provides one
VIGIL_DEFINE_ERROR_INFO(string, parsing_error)

} // namespace vigil

#endif

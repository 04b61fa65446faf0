#ifndef VIGIL_CORE_EXCEPTION_HPP
#define VIGIL_CORE_EXCEPTION_HPP

#include <typeinfo>

#include <vigil/core/type_definitions.hpp>

#include <boost/exception/all.hpp>
#include <boost/stacktrace.hpp>

namespace vigil {

// All vigil errors are Boost.Exception exceptions. They're defined, annotated
// and thrown through the macros below.

// Define an exception type that derives from :base (which must be
// std::exception or another vigil exception). what() reports the full
// diagnostic information, including every attached error info.
#define VIGIL_DEFINE_DERIVED_EXCEPTION(id, base)                              \
    struct id : virtual boost::exception, virtual base                        \
    {                                                                         \
        char const*                                                           \
        what() const noexcept                                                 \
        {                                                                     \
            return boost::diagnostic_information_what(*this);                 \
        }                                                                     \
    };

#define VIGIL_DEFINE_EXCEPTION(id)                                            \
    VIGIL_DEFINE_DERIVED_EXCEPTION(id, std::exception)

// Define a piece of information that can be attached to an exception.
// VIGIL_DEFINE_ERROR_INFO(string, channel) defines channel_info.
#define VIGIL_DEFINE_ERROR_INFO(T, id)                                        \
    typedef boost::error_info<struct id##_info_tag, T> id##_info;

VIGIL_DEFINE_ERROR_INFO(boost::stacktrace::stacktrace, stacktrace)

// Throw :x with the current stack trace attached.
#define VIGIL_THROW(x)                                                        \
    BOOST_THROW_EXCEPTION(                                                    \
        (x) << stacktrace_info(boost::stacktrace::stacktrace()))

using boost::get_error_info;

// This is thrown by get_required_error_info when the info isn't there.
VIGIL_DEFINE_EXCEPTION(missing_error_info)
// the (implementation-specific) type name of the missing info
VIGIL_DEFINE_ERROR_INFO(string, error_info_id)
// the diagnostics of the exception that was missing it
VIGIL_DEFINE_ERROR_INFO(string, wrapped_exception_diagnostics)

// Get a reference to an error info that the caller knows must be present on
// :e.
template<class ErrorInfo, class Exception>
typename ErrorInfo::error_info::value_type const&
get_required_error_info(Exception const& e)
{
    if (auto const* info = get_error_info<ErrorInfo>(e))
        return *info;
    VIGIL_THROW(
        missing_error_info() << error_info_id_info(typeid(ErrorInfo).name())
                             << wrapped_exception_diagnostics_info(
                                    boost::diagnostic_information(e)));
}

} // namespace vigil

#endif

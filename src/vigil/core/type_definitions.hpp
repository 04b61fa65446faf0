#ifndef VIGIL_CORE_TYPE_DEFINITIONS_HPP
#define VIGIL_CORE_TYPE_DEFINITIONS_HPP

#include <cstdint>
#include <filesystem>
#include <string>
#include <type_traits>
#include <utility>

#include <boost/core/noncopyable.hpp>
#include <boost/optional.hpp>
#include <boost/optional/optional_io.hpp>

namespace vigil {

using std::string;

using boost::none;
using boost::optional;

using boost::noncopyable;

// some(x) creates a boost::optional of the proper type with the value of :x.
template<class T>
auto
some(T&& x)
{
    return optional<std::remove_cv_t<std::remove_reference_t<T>>>(
        std::forward<T>(x));
}

typedef int64_t integer;

// paths of files (or directories)
typedef std::filesystem::path file_path;

} // namespace vigil

#endif

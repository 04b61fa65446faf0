#include <vigil/fs/file_io.h>

#include <cerrno>
#include <cstring>
#include <fstream>
#include <iterator>

#include <vigil/utilities/errors.h>

namespace vigil {

namespace {

[[noreturn]] void
throw_file_access_error(file_path const& path, char const* operation)
{
    VIGIL_THROW(
        file_access_error() << file_path_info(path)
                            << file_operation_info(operation)
                            << internal_error_message_info(strerror(errno)));
}

} // namespace

string
read_file_contents(file_path const& path)
{
    std::ifstream in(path, std::ios::in | std::ios::binary);
    if (!in)
        throw_file_access_error(path, "reading");
    string contents{
        std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
    if (in.bad())
        throw_file_access_error(path, "reading");
    return contents;
}

void
write_file_contents(file_path const& path, string const& contents)
{
    std::ofstream out(path, std::ios::out | std::ios::trunc | std::ios::binary);
    if (!out)
        throw_file_access_error(path, "writing");
    out.write(contents.data(), contents.size());
    out.close();
    if (!out)
        throw_file_access_error(path, "writing");
}

} // namespace vigil

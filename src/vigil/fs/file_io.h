#ifndef VIGIL_FS_FILE_IO_H
#define VIGIL_FS_FILE_IO_H

#include <vigil/core/exception.hpp>

namespace vigil {

// This is thrown when a file can't be opened, read or written.
VIGIL_DEFINE_EXCEPTION(file_access_error)
VIGIL_DEFINE_ERROR_INFO(file_path, file_path)
// what was being done to the file ("reading" or "writing")
VIGIL_DEFINE_ERROR_INFO(string, file_operation)
// This also provides internal_error_message_info.

// Get the entire contents of a file.
string
read_file_contents(file_path const& path);

// Replace the contents of a file (creating it if necessary).
void
write_file_contents(file_path const& path, string const& contents);

} // namespace vigil

#endif

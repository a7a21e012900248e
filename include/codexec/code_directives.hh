#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace codexec {

// Looks for a filename directive in the first line of @p code. Recognized forms:
//   # filename: <name>
//   // filename: <name>
//   /* filename: <name> */
//   <!-- filename: <name> -->
// Returns the name relative to @p work_dir. Throws FilenameOutsideWorkspaceError if the name
// resolves to a path outside @p work_dir.
std::optional<std::string> filename_from_code(std::string_view code, std::string_view work_dir);

// Adds the -qqq flag to the pip install commands of @p code, so that installing packages does
// not flood the output; @p language has to be normalized
std::string silence_pip(std::string_view code, std::string_view language);

} // namespace codexec

#pragma once

#include "codexec/concat_tostr.hh"

#include <cerrno>
#include <cstring>
#include <string>

namespace codexec {

// Returns " - <errnum>: <description>", to be appended to an error message
inline std::string errmsg(int errnum) {
    const char* descr = strerrordesc_np(errnum);
    return concat_tostr(" - ", errnum, ": ", descr ? descr : "Unknown error");
}

inline std::string errmsg() { return errmsg(errno); }

} // namespace codexec

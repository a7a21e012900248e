#pragma once

#include "codexec/file_descriptor.hh"

#include <optional>
#include <unistd.h>

namespace codexec {

struct Pipe {
    FileDescriptor readable;
    FileDescriptor writable;
};

// Returns std::nullopt on error (errno is set then)
inline std::optional<Pipe> pipe2(int flags) noexcept {
    int fds[2];
    if (::pipe2(fds, flags)) {
        return std::nullopt;
    }
    return Pipe{
        .readable = FileDescriptor{fds[0]},
        .writable = FileDescriptor{fds[1]},
    };
}

} // namespace codexec

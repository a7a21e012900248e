#pragma once

#include <csignal>
#include <sys/syscall.h>
#include <sys/types.h>
#include <unistd.h>

namespace codexec::syscalls {

inline int pidfd_open(pid_t pid, unsigned int flags) noexcept {
    return static_cast<int>(syscall(SYS_pidfd_open, pid, flags));
}

inline int
pidfd_send_signal(int pidfd, int sig, siginfo_t* info, unsigned int flags) noexcept {
    return static_cast<int>(syscall(SYS_pidfd_send_signal, pidfd, sig, info, flags));
}

} // namespace codexec::syscalls

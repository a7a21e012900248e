#include "codexec/concat_tostr.hh"
#include "codexec/errmsg.hh"
#include "codexec/file_contents.hh"
#include "codexec/macros/throw.hh"
#include "codexec/pipe.hh"
#include "codexec/subprocess.hh"
#include "codexec/syscalls.hh"

#include <algorithm>
#include <array>
#include <cerrno>
#include <climits>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <string_view>
#include <sys/wait.h>
#include <unistd.h>

using std::chrono::steady_clock;

namespace codexec {

int ExitStatus::exit_code() const noexcept {
    switch (code) {
    case CLD_EXITED: return status;
    case CLD_KILLED:
    case CLD_DUMPED: return 128 + status;
    default: return 128;
    }
}

std::string ExitStatus::description() const {
    auto signal_description = [](const char* prefix, int signum) {
        auto abbrv = sigabbrev_np(signum);
        auto descr = sigdescr_np(signum);
        if (abbrv) {
            if (descr) {
                return concat_tostr(prefix, ' ', abbrv, " - ", descr);
            }
            return concat_tostr(prefix, ' ', abbrv);
        }
        if (descr) {
            return concat_tostr(prefix, " with number ", signum, " - ", descr);
        }
        return concat_tostr(prefix, " with number ", signum);
    };
    switch (code) {
    case CLD_EXITED: return concat_tostr("exited with ", status);
    case CLD_KILLED: return signal_description("killed by signal", status);
    case CLD_DUMPED: return signal_description("killed and dumped by signal", status);
    case CLD_TRAPPED: return signal_description("trapped by signal", status);
    case CLD_STOPPED: return signal_description("stopped by signal", status);
    case CLD_CONTINUED: return signal_description("continued by signal", status);
    }
    return "unable to describe";
}

namespace {

// Reports the failure of the child on its stderr and exits as shells do
[[noreturn]] void die_in_child(std::string_view msg, int errnum) noexcept {
    const char* descr = strerrordesc_np(errnum);
    (void)write_all(STDERR_FILENO, msg);
    (void)write_all(STDERR_FILENO, ": ");
    (void)write_all(STDERR_FILENO, descr ? descr : "Unknown error");
    (void)write_all(STDERR_FILENO, "\n");
    _exit(errnum == ENOENT ? 127 : 126);
}

// Runs in the forked child: only async-signal-safe functions may be used
[[noreturn]] void exec_child(
    char* const* argv,
    const char* cwd,
    int stdin_fd,
    int output_fd,
    std::string_view chdir_error,
    std::string_view exec_error
) noexcept {
    (void)setpgid(0, 0);
    // Restore what the executed program expects
    sigset_t mask;
    sigemptyset(&mask);
    (void)sigprocmask(SIG_SETMASK, &mask, nullptr);
    (void)signal(SIGPIPE, SIG_DFL);

    if (dup2(stdin_fd, STDIN_FILENO) == -1 or dup2(output_fd, STDOUT_FILENO) == -1 or
        dup2(output_fd, STDERR_FILENO) == -1)
    {
        _exit(127);
    }
    if (cwd and chdir(cwd)) {
        die_in_child(chdir_error, errno);
    }
    execvp(argv[0], argv);
    die_in_child(exec_error, errno);
}

void reap(pid_t pid) noexcept {
    siginfo_t si;
    while (waitid(P_PID, static_cast<id_t>(pid), &si, WEXITED) == -1 and errno == EINTR) {
    }
}

void append_output(
    CollectedOutput& collected,
    const char* data,
    size_t len,
    std::optional<uint64_t> max_output_size
) {
    if (max_output_size) {
        uint64_t room = *max_output_size > collected.output.size()
            ? *max_output_size - collected.output.size()
            : 0;
        if (len > room) {
            collected.output.append(data, static_cast<size_t>(room));
            collected.output_truncated = true;
            return;
        }
    }
    collected.output.append(data, len);
}

// Returns false on EOF, true if there may be more data later. At most @p max_chunks reads are
// done, so that a flood of output cannot starve the caller.
bool read_output(
    int fd,
    CollectedOutput& collected,
    std::optional<uint64_t> max_output_size,
    size_t max_chunks
) {
    std::array<char, 1 << 16> buff; // NOLINT(cppcoreguidelines-pro-type-member-init)
    for (size_t chunk = 0; chunk < max_chunks;) {
        auto rc = read(fd, buff.data(), buff.size());
        if (rc == 0) {
            return false;
        }
        if (rc == -1) {
            if (errno == EINTR) {
                continue;
            }
            if (errno == EAGAIN or errno == EWOULDBLOCK) {
                return true;
            }
            THROW("read()", errmsg());
        }
        append_output(collected, buff.data(), static_cast<size_t>(rc), max_output_size);
        ++chunk;
    }
    return true;
}

} // namespace

Subprocess Subprocess::spawn(const std::vector<std::string>& argv, const SpawnOptions& options) {
    if (argv.empty()) {
        THROW("cannot spawn a process with empty argv");
    }
    // Everything that allocates has to be prepared before fork()
    std::vector<char*> c_argv;
    c_argv.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        c_argv.emplace_back(const_cast<char*>(arg.c_str())); // NOLINT
    }
    c_argv.emplace_back(nullptr);
    const char* cwd = options.cwd ? options.cwd->c_str() : nullptr;
    auto chdir_error = concat_tostr("codexec: cannot change directory to ", cwd ? cwd : "");
    auto exec_error = concat_tostr("codexec: cannot execute ", argv[0]);

    auto output_pipe = pipe2(O_CLOEXEC);
    if (not output_pipe) {
        THROW("pipe2()", errmsg());
    }
    if (fcntl(output_pipe->readable, F_SETFL, O_NONBLOCK)) {
        THROW("fcntl()", errmsg());
    }
    FileDescriptor dev_null{open("/dev/null", O_RDONLY | O_CLOEXEC)};
    if (not dev_null.is_open()) {
        THROW("open(/dev/null)", errmsg());
    }

    pid_t pid = fork();
    if (pid == -1) {
        THROW("fork()", errmsg());
    }
    if (pid == 0) {
        exec_child(
            c_argv.data(), cwd, dev_null, output_pipe->writable, chdir_error, exec_error
        );
    }
    // Parent process. The child calls setpgid() too, whichever runs first wins; EACCES means
    // the child has already executed the program, so it has its own group by then.
    (void)setpgid(pid, pid);

    FileDescriptor pidfd{syscalls::pidfd_open(pid, 0)};
    if (not pidfd.is_open()) {
        int errnum = errno;
        (void)kill(-pid, SIGKILL);
        (void)kill(pid, SIGKILL);
        reap(pid);
        THROW("pidfd_open()", errmsg(errnum));
    }
    if (output_pipe->writable.close()) {
        int errnum = errno;
        (void)kill(-pid, SIGKILL);
        reap(pid);
        THROW("close()", errmsg(errnum));
    }
    return Subprocess{pid, std::move(pidfd), std::move(output_pipe->readable)};
}

Subprocess::Subprocess(Subprocess&& other) noexcept
: pid_{std::exchange(other.pid_, -1)}
, pidfd_{std::move(other.pidfd_)}
, output_{std::move(other.output_)}
, exit_status_{std::exchange(other.exit_status_, std::nullopt)} {}

Subprocess& Subprocess::operator=(Subprocess&& other) noexcept {
    if (this != &other) {
        if (pid_ > 0 and not exit_status_) {
            (void)signal_group(SIGKILL);
            reap(pid_);
        }
        pid_ = std::exchange(other.pid_, -1);
        pidfd_ = std::move(other.pidfd_);
        output_ = std::move(other.output_);
        exit_status_ = std::exchange(other.exit_status_, std::nullopt);
    }
    return *this;
}

Subprocess::~Subprocess() {
    if (pid_ > 0 and not exit_status_) {
        (void)signal_group(SIGKILL);
        reap(pid_);
    }
}

bool Subprocess::signal_group(int sig) noexcept {
    if (pid_ <= 0) {
        return true;
    }
    if (kill(-pid_, sig) == 0 or errno == ESRCH) {
        return true;
    }
    // The group may not exist yet if the child has not run setpgid(), signal the process
    // directly then
    if (not exit_status_ and pidfd_.is_open()) {
        return syscalls::pidfd_send_signal(pidfd_, sig, nullptr, 0) == 0 or errno == ESRCH;
    }
    return false;
}

ExitStatus Subprocess::wait() {
    if (exit_status_) {
        return *exit_status_;
    }
    if (pid_ <= 0) {
        THROW("there is no process to wait for");
    }
    siginfo_t si{};
    while (waitid(P_PID, static_cast<id_t>(pid_), &si, WEXITED)) {
        if (errno != EINTR) {
            THROW("waitid()", errmsg());
        }
    }
    exit_status_ = ExitStatus{
        .code = si.si_code,
        .status = si.si_status,
    };
    (void)pidfd_.close();
    return *exit_status_;
}

void read_available_output(
    Subprocess& proc, CollectedOutput& collected, std::optional<uint64_t> max_output_size
) {
    if (not proc.output().is_open()) {
        return;
    }
    // Pipe capacity bounds what an exited process could have left, the limit protects only
    // against descendants that keep writing
    constexpr size_t max_chunks = 64;
    (void)read_output(proc.output(), collected, max_output_size, max_chunks);
}

CollectedOutput collect_output(Subprocess& proc, const CollectOptions& options) {
    CollectedOutput res;
    if (proc.waited()) {
        read_available_output(proc, res, options.max_output_size);
        return res;
    }

    enum {
        OUTPUT = 0,
        PROCESS = 1,
        WAKEUP = 2,
    };
    std::array<pollfd, 3> pfds;
    pfds[OUTPUT] = {
        .fd = proc.output().is_open() ? int{proc.output()} : -1,
        .events = POLLIN,
        .revents = 0,
    };
    pfds[PROCESS] = {
        .fd = proc.pidfd(),
        .events = POLLIN,
        .revents = 0,
    };
    pfds[WAKEUP] = {
        .fd = options.wakeup_fd,
        .events = POLLIN,
        .revents = 0,
    };

    constexpr size_t max_chunks_per_poll = 16;
    for (;;) {
        int timeout_ms = -1;
        if (options.deadline) {
            auto now = steady_clock::now();
            if (now >= *options.deadline) {
                read_available_output(proc, res, options.max_output_size);
                res.outcome = CollectedOutput::Outcome::TimedOut;
                return res;
            }
            auto left =
                std::chrono::ceil<std::chrono::milliseconds>(*options.deadline - now).count();
            timeout_ms = static_cast<int>(std::min<decltype(left)>(left, INT_MAX));
        }

        for (auto& pfd : pfds) {
            pfd.revents = 0;
        }
        int rc = poll(pfds.data(), pfds.size(), timeout_ms);
        if (rc == -1) {
            if (errno == EINTR) {
                continue;
            }
            THROW("poll()", errmsg());
        }
        if (rc == 0) {
            continue; // the deadline is checked at the beginning of the loop
        }

        if (pfds[OUTPUT].revents & POLLNVAL) {
            pfds[OUTPUT].fd = -1;
        } else if (pfds[OUTPUT].revents & (POLLIN | POLLHUP | POLLERR)) {
            bool more = read_output(
                pfds[OUTPUT].fd, res, options.max_output_size, max_chunks_per_poll
            );
            if (not more) {
                pfds[OUTPUT].fd = -1; // EOF, the process may still run though
            }
        }
        if (pfds[PROCESS].revents & POLLNVAL) {
            THROW("poll(): invalid pidfd");
        }
        if (pfds[PROCESS].revents & POLLIN) {
            read_available_output(proc, res, options.max_output_size);
            res.outcome = CollectedOutput::Outcome::Exited;
            return res;
        }
        if (pfds[WAKEUP].revents & (POLLIN | POLLHUP | POLLERR | POLLNVAL)) {
            read_available_output(proc, res, options.max_output_size);
            res.outcome = CollectedOutput::Outcome::Woken;
            return res;
        }
    }
}

CommandResult run_to_completion(
    const std::vector<std::string>& argv,
    std::chrono::nanoseconds timeout,
    const SpawnOptions& options
) {
    auto proc = Subprocess::spawn(argv, options);
    auto collected = collect_output(
        proc,
        {
            .deadline = steady_clock::now() + timeout,
            .wakeup_fd = -1,
            .max_output_size = std::nullopt,
        }
    );
    bool timed_out = collected.outcome == CollectedOutput::Outcome::TimedOut;
    if (timed_out) {
        (void)proc.signal_group(SIGKILL);
    }
    auto status = proc.wait();
    read_available_output(proc, collected, std::nullopt);
    return {
        .exit_code = status.exit_code(),
        .output = std::move(collected.output),
        .timed_out = timed_out,
    };
}

} // namespace codexec

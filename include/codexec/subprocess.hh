#pragma once

#include "codexec/file_descriptor.hh"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <sys/types.h>
#include <utility>
#include <vector>

namespace codexec {

struct ExitStatus {
    int code; // siginfo_t::si_code from waitid()
    int status; // siginfo_t::si_status from waitid()

    // Exit status for processes that exited, 128 + signal number for killed ones (as in shells)
    [[nodiscard]] int exit_code() const noexcept;

    // Returns textual description e.g. "exited with 1" or "killed by signal KILL - Killed"
    [[nodiscard]] std::string description() const;

    friend bool operator==(const ExitStatus&, const ExitStatus&) = default;
};

struct SpawnOptions {
    // Working directory of the new process; inherited if not set
    std::optional<std::string> cwd;
};

// A child process running in its own process group, with stdin redirected from /dev/null and
// both stdout and stderr redirected to a single pipe.
class Subprocess {
    pid_t pid_ = -1;
    FileDescriptor pidfd_;
    FileDescriptor output_;
    std::optional<ExitStatus> exit_status_;

    Subprocess(pid_t pid, FileDescriptor pidfd, FileDescriptor output) noexcept
    : pid_{pid}
    , pidfd_{std::move(pidfd)}
    , output_{std::move(output)} {}

public:
    // If the program cannot be executed, the child writes the reason to the output and exits
    // with 127 (126 if the file is not executable), as shells do. Throws on other errors.
    static Subprocess spawn(const std::vector<std::string>& argv, const SpawnOptions& options = {});

    Subprocess(const Subprocess&) = delete;
    Subprocess(Subprocess&& other) noexcept;
    Subprocess& operator=(const Subprocess&) = delete;
    Subprocess& operator=(Subprocess&& other) noexcept;

    // Kills the whole process group and reaps the process, unless it was already waited
    ~Subprocess();

    [[nodiscard]] pid_t pid() const noexcept { return pid_; }

    // Becomes readable once the process exits; closed after wait()
    [[nodiscard]] int pidfd() const noexcept { return pidfd_; }

    // Non-blocking read end of the output pipe
    [[nodiscard]] FileDescriptor& output() noexcept { return output_; }

    // Sends @p sig to the process group. Returns false on error, the group being already gone
    // is not an error.
    bool signal_group(int sig) noexcept;

    // Blocks until the process exits, subsequent calls return the same status. Throws on error.
    ExitStatus wait();

    [[nodiscard]] bool waited() const noexcept { return exit_status_.has_value(); }
};

struct CollectOptions {
    std::optional<std::chrono::steady_clock::time_point> deadline;
    // Collecting stops as soon as this file descriptor becomes readable; ignored if negative
    int wakeup_fd = -1;
    // Output above this size is read and discarded
    std::optional<uint64_t> max_output_size;
};

struct CollectedOutput {
    enum class Outcome : uint8_t {
        Exited,
        TimedOut,
        Woken,
    } outcome = Outcome::Exited;

    std::string output;
    bool output_truncated = false;
};

// Reads the output of @p proc until the process exits, the deadline passes or the wakeup
// descriptor becomes readable. The process is not waited. Throws on error.
CollectedOutput collect_output(Subprocess& proc, const CollectOptions& options);

// Appends to @p collected the output that can be read without blocking. Throws on error.
void read_available_output(
    Subprocess& proc, CollectedOutput& collected, std::optional<uint64_t> max_output_size
);

struct CommandResult {
    int exit_code;
    std::string output;
    bool timed_out;
};

// Runs the command and waits for it; after @p timeout the process group is killed.
// Throws on error.
CommandResult run_to_completion(
    const std::vector<std::string>& argv,
    std::chrono::nanoseconds timeout,
    const SpawnOptions& options = {}
);

} // namespace codexec

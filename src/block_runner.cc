#include "codexec/block_runner.hh"
#include "codexec/concat_tostr.hh"
#include "codexec/errmsg.hh"
#include "codexec/errors.hh"
#include "codexec/file_contents.hh"
#include "codexec/file_descriptor.hh"
#include "codexec/logger.hh"
#include "codexec/macros/throw.hh"
#include "codexec/subprocess.hh"

#include <csignal>
#include <exception>
#include <filesystem>
#include <memory>
#include <sys/eventfd.h>

namespace codexec {

namespace {

constexpr DebugLogger<false> debuglog{};

constexpr std::string_view timed_out_message = "Code execution was timed out.";
constexpr std::string_view cancelled_message = "Code execution was cancelled.";
constexpr std::string_view truncated_message = "[output truncated]";

void append_line(std::string& output, std::string_view line) {
    if (not output.empty() and output.back() != '\n') {
        output += '\n';
    }
    output += line;
    output += '\n';
}

} // namespace

BlockResult BlockRunner::run(
    std::string_view code,
    const LanguageCommand& command,
    const std::string& file_name,
    const EnvironmentHandle& env,
    CancellationToken& token,
    const Options& options
) {
    if (env.status != EnvironmentStatus::Running) {
        throw InvalidStateError{
            concat_tostr("cannot run code: environment is ", to_string(env.status))};
    }
    if (token.is_cancelled()) {
        return {
            .exit_code = kCancelledExitCode,
            .output = concat_tostr(cancelled_message, '\n'),
        };
    }

    auto path = std::filesystem::path{env.work_dir} / file_name;
    std::filesystem::create_directories(path.parent_path());
    put_file_contents(path.string(), code);

    // The listener may fire after this function returns, so it shares the ownership
    auto wakeup = std::make_shared<FileDescriptor>(eventfd(0, EFD_CLOEXEC | EFD_NONBLOCK));
    if (not wakeup->is_open()) {
        THROW("eventfd()", errmsg());
    }
    ScopedCancelListener listener{token, [wakeup] { (void)eventfd_write(*wakeup, 1); }};

    auto proc = provider_.exec(env, command.argv_for(file_name));
    auto collected = collect_output(
        proc,
        {
            .deadline = std::chrono::steady_clock::now() + options.timeout,
            .wakeup_fd = *wakeup,
            .max_output_size = options.max_output_size,
        }
    );

    BlockResult res{};
    switch (collected.outcome) {
    case CollectedOutput::Outcome::Exited: {
        auto status = proc.wait();
        debuglog(env.name, ": ", file_name, " ", status.description());
        res.exit_code = status.exit_code();
    } break;
    case CollectedOutput::Outcome::TimedOut:
    case CollectedOutput::Outcome::Woken: {
        bool timed_out = collected.outcome == CollectedOutput::Outcome::TimedOut;
        stdlog(
            env.name, ": ", file_name, timed_out ? " exceeded the time limit" : " was cancelled",
            ", terminating"
        );
        try {
            provider_.terminate(env, file_name);
        } catch (const std::exception& e) {
            errlog("failed to terminate ", file_name, " in ", env.name, ": ", e.what());
        }
        if (not proc.signal_group(SIGKILL)) {
            errlog("kill(", proc.pid(), ")", errmsg());
        }
        (void)proc.wait();
        read_available_output(proc, collected, options.max_output_size);
        res.exit_code = timed_out ? kTimeoutExitCode : kCancelledExitCode;
    } break;
    }

    res.output = std::move(collected.output);
    if (collected.output_truncated) {
        append_line(res.output, truncated_message);
    }
    if (collected.outcome == CollectedOutput::Outcome::TimedOut) {
        append_line(res.output, timed_out_message);
    } else if (collected.outcome == CollectedOutput::Outcome::Woken) {
        append_line(res.output, cancelled_message);
    }
    return res;
}

} // namespace codexec

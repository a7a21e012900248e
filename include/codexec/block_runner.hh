#pragma once

#include "codexec/cancellation_token.hh"
#include "codexec/code_block.hh"
#include "codexec/environment.hh"
#include "codexec/language.hh"
#include "codexec/runtime/provider.hh"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace codexec {

// Runs a single code block inside an environment
class BlockRunner {
    runtime::Provider& provider_;

public:
    struct Options {
        std::chrono::nanoseconds timeout;
        std::optional<uint64_t> max_output_size;
    };

    explicit BlockRunner(runtime::Provider& provider) noexcept : provider_{provider} {}

    // Writes @p code to @p file_name (relative to the working directory of @p env) and runs it
    // with @p command. The run is raced against the timeout and @p token; the loser is
    // terminated inside the environment and the result gets kTimeoutExitCode or
    // kCancelledExitCode with the output captured so far.
    //
    // Throws InvalidStateError if @p env is not running and std::exception on system errors;
    // failures of the code itself are reported only in the result.
    BlockResult run(
        std::string_view code,
        const LanguageCommand& command,
        const std::string& file_name,
        const EnvironmentHandle& env,
        CancellationToken& token,
        const Options& options
    );
};

} // namespace codexec

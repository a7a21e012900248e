#pragma once

#include "codexec/cancellation_token.hh"
#include "codexec/code_block.hh"
#include "codexec/config.hh"
#include "codexec/environment.hh"
#include "codexec/language.hh"
#include "codexec/runtime/provider.hh"
#include "codexec/temporary_directory.hh"

#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace codexec {

// Owns a single isolated environment and executes sequences of code blocks in it.
//
// Lifecycle: uninitialized --start()--> starting --> running --stop()--> stopping --> stopped.
// stop() is allowed in every state and never throws; a stopped executor cannot be started
// again.
class Executor {
    ExecutorConfig config_;
    std::shared_ptr<runtime::Provider> provider_;
    CommandMapper mapper_;

    std::mutex lifecycle_mtx_; // serializes start(), stop() and restart()
    mutable std::mutex mtx_; // guards the members below
    std::condition_variable execution_finished_;
    EnvironmentHandle env_;
    TemporaryDirectory owned_work_dir_;
    CancellationToken* in_flight_ = nullptr; // internal token of the execution in progress

public:
    // Uses docker as the provider; throws ConfigError
    explicit Executor(ExecutorConfig config);

    // Throws ConfigError
    Executor(
        ExecutorConfig config,
        std::shared_ptr<runtime::Provider> provider,
        CommandMapper mapper = CommandMapper{}
    );

    Executor(const Executor&) = delete;
    Executor(Executor&&) = delete;
    Executor& operator=(const Executor&) = delete;
    Executor& operator=(Executor&&) = delete;

    // Stops the executor
    ~Executor();

    // Creates the environment, installs the python packages of the configured functions and
    // writes the functions module. No-op if already running. Throws InvalidStateError if the
    // executor is starting, stopping or stopped and EnvironmentStartError if the environment
    // cannot be brought up; in the latter case nothing is left allocated and start() may be
    // retried.
    void start();

    // Cancels the execution in progress (if any), waits for it to finish and destroys the
    // environment. Teardown errors are logged. No-op if already stopped.
    void stop() noexcept;

    // Restarts the environment in place. Throws InvalidStateError if not running,
    // ConcurrentExecutionError if an execution is in progress and EnvironmentStartError if the
    // restart fails (the executor is stopped then).
    void restart();

    // Executes @p blocks in order, stopping at the first block that exits with a non-zero
    // code or at cancellation of @p token. Non-zero exit codes are reported in the result.
    //
    // Throws InvalidStateError if not running, ConcurrentExecutionError if another execution
    // is in progress and UnsupportedLanguageError if any block has an unsupported language;
    // nothing is executed in these cases.
    CommandLineCodeResult
    execute_code_blocks(const std::vector<CodeBlock>& blocks, CancellationToken& token);

    [[nodiscard]] EnvironmentStatus status() const;

    // Host directory where code is staged; empty before start
    [[nodiscard]] std::string work_dir() const;

    [[nodiscard]] std::string environment_name() const;

    [[nodiscard]] const ExecutorConfig& config() const noexcept { return config_; }

    [[nodiscard]] const CommandMapper& command_mapper() const noexcept { return mapper_; }

    // Name of the module that executed python code imports the configured functions from
    [[nodiscard]] const std::string& functions_module() const noexcept {
        return config_.functions_module;
    }

private:
    // lifecycle_mtx_ has to be held
    void stop_locked() noexcept;

    // Installs the required packages and writes the functions module in @p env; throws
    // EnvironmentStartError
    void setup_functions(const EnvironmentHandle& env);

    // Destroys the environment and the owned working directory, logging errors
    void teardown(const EnvironmentHandle& env) noexcept;
};

} // namespace codexec

#include "codexec/block_runner.hh"
#include "codexec/code_directives.hh"
#include "codexec/concat_tostr.hh"
#include "codexec/defer.hh"
#include "codexec/errors.hh"
#include "codexec/executor.hh"
#include "codexec/functions.hh"
#include "codexec/logger.hh"
#include "codexec/random.hh"
#include "codexec/runtime/docker_cli.hh"

#include <exception>
#include <filesystem>
#include <string_view>
#include <system_error>
#include <utility>

namespace codexec {

namespace {

constexpr DebugLogger<false> debuglog{};

// Removes staged files and their byproducts on scope exit
class StagedFiles {
    std::filesystem::path work_dir_;
    bool keep_;
    std::vector<std::filesystem::path> files_;

public:
    StagedFiles(std::filesystem::path work_dir, bool keep)
    : work_dir_{std::move(work_dir)}
    , keep_{keep} {}

    StagedFiles(const StagedFiles&) = delete;
    StagedFiles(StagedFiles&&) = delete;
    StagedFiles& operator=(const StagedFiles&) = delete;
    StagedFiles& operator=(StagedFiles&&) = delete;

    void add(const std::string& file_name, const std::vector<std::string>& byproducts) {
        files_.emplace_back(work_dir_ / file_name);
        for (const auto& byproduct : byproducts) {
            files_.emplace_back(work_dir_ / byproduct);
        }
    }

    ~StagedFiles() {
        if (keep_) {
            return;
        }
        for (const auto& file : files_) {
            std::error_code ec;
            std::filesystem::remove(file, ec);
            if (ec) {
                errlog("failed to remove ", file.string(), ": ", ec.message());
            }
        }
    }
};

std::string shell_quote(std::string_view str) {
    std::string res = "'";
    for (char c : str) {
        if (c == '\'') {
            res += R"('\'')";
        } else {
            res += c;
        }
    }
    res += '\'';
    return res;
}

} // namespace

Executor::Executor(ExecutorConfig config)
: Executor{config, runtime::make_docker_provider(config)} {}

Executor::Executor(
    ExecutorConfig config, std::shared_ptr<runtime::Provider> provider, CommandMapper mapper
)
: config_{std::move(config)}
, provider_{std::move(provider)}
, mapper_{std::move(mapper)} {
    config_.validate();
    if (not provider_) {
        throw ConfigError{"provider cannot be null"};
    }
}

Executor::~Executor() { stop(); }

void Executor::start() {
    std::lock_guard lifecycle_lock{lifecycle_mtx_};
    EnvironmentHandle env;
    {
        std::lock_guard lock{mtx_};
        if (env_.status == EnvironmentStatus::Running) {
            return;
        }
        if (env_.status != EnvironmentStatus::Uninitialized) {
            throw InvalidStateError{
                concat_tostr("cannot start: executor is ", to_string(env_.status))};
        }
        env_.status = EnvironmentStatus::Starting;
        env_.name = concat_tostr(config_.container_name_prefix, random_hex(12));
        env = env_;
    }

    TemporaryDirectory owned_work_dir;
    try {
        if (config_.work_dir.empty()) {
            owned_work_dir = TemporaryDirectory{"/tmp/codexec.XXXXXX"};
            env.work_dir = owned_work_dir.path();
        } else {
            std::filesystem::create_directories(config_.work_dir);
            env.work_dir = std::filesystem::absolute(config_.work_dir).lexically_normal().string();
            if (env.work_dir.size() > 1 and env.work_dir.back() == '/') {
                env.work_dir.pop_back();
            }
        }

        stdlog("starting environment ", env.name, " from image ", config_.image);
        env.id = provider_->create_environment({
            .image = config_.image,
            .name = env.name,
            .work_dir = env.work_dir,
            .bind_dir = config_.bind_dir.empty() ? env.work_dir : config_.bind_dir,
            .extra_volumes = config_.extra_volumes,
            .extra_hosts = config_.extra_hosts,
            .environment = config_.environment,
            .init_command = config_.init_command,
            .auto_remove = config_.auto_remove,
        });
        if (not config_.functions.empty()) {
            setup_functions(env);
        }
    } catch (const std::exception& e) {
        errlog("failed to start environment ", env.name, ": ", e.what());
        // Whatever got created is released, so that nothing leaks and start() can be retried
        try {
            provider_->destroy_environment(env);
        } catch (const std::exception& destroy_error) {
            errlog("failed to destroy environment ", env.name, ": ", destroy_error.what());
        }
        owned_work_dir.remove();
        {
            std::lock_guard lock{mtx_};
            env_ = EnvironmentHandle{};
        }
        if (dynamic_cast<const EnvironmentStartError*>(&e)) {
            throw;
        }
        throw EnvironmentStartError{
            concat_tostr("cannot start environment ", env.name, ": ", e.what())};
    }

    std::lock_guard lock{mtx_};
    env.status = EnvironmentStatus::Running;
    env_ = std::move(env);
    owned_work_dir_ = std::move(owned_work_dir);
    stdlog("environment ", env_.name, " (", env_.id, ") is running, work dir: ", env_.work_dir);
}

void Executor::setup_functions(const EnvironmentHandle& env) {
    auto running_env = env;
    running_env.status = EnvironmentStatus::Running;
    BlockRunner runner{*provider_};
    CancellationToken token;
    const BlockRunner::Options options = {
        .timeout = config_.timeout,
        .max_output_size = config_.max_output_size,
    };

    auto packages = required_packages(config_.functions);
    if (not packages.empty()) {
        std::string install = "python -m pip install -qqq";
        for (const auto& package : packages) {
            install += ' ';
            install += shell_quote(package);
        }
        stdlog(env.name, ": installing python packages: ", install);
        const auto& command = mapper_.command_for("sh");
        auto file_name =
            concat_tostr("tmp_code_", random_hex(8), "_setup.", command.file_extension);
        StagedFiles staged{env.work_dir, config_.keep_staged_files};
        staged.add(file_name, command.byproducts_for(file_name));
        auto res = runner.run(install, command, file_name, running_env, token, options);
        if (res.exit_code != 0) {
            throw EnvironmentStartError{concat_tostr(
                "installing python packages failed with exit code ",
                res.exit_code,
                ": ",
                res.output
            )};
        }
    }

    // Running the module checks that it loads
    const auto& command = mapper_.command_for("python");
    auto file_name = concat_tostr(config_.functions_module, '.', command.file_extension);
    auto res = runner.run(
        build_functions_module(config_.functions), command, file_name, running_env, token, options
    );
    if (res.exit_code != 0) {
        std::error_code ec;
        std::filesystem::remove(std::filesystem::path{env.work_dir} / file_name, ec);
        if (ec) {
            errlog("failed to remove ", file_name, ": ", ec.message());
        }
        throw EnvironmentStartError{concat_tostr(
            "loading functions module ", file_name, " failed with exit code ", res.exit_code, ": ",
            res.output
        )};
    }
    debuglog(env.name, ": wrote functions module ", file_name);
}

void Executor::stop() noexcept {
    std::lock_guard lifecycle_lock{lifecycle_mtx_};
    stop_locked();
}

void Executor::stop_locked() noexcept {
    EnvironmentHandle env;
    {
        std::unique_lock lock{mtx_};
        if (env_.status == EnvironmentStatus::Stopped) {
            return;
        }
        bool was_created = env_.status != EnvironmentStatus::Uninitialized;
        env_.status = EnvironmentStatus::Stopping;
        if (in_flight_) {
            stdlog("stopping ", env_.name, ": cancelling the execution in progress");
            try {
                in_flight_->cancel();
            } catch (const std::exception& e) {
                errlog("cancelling the execution in progress failed: ", e.what());
            }
            execution_finished_.wait(lock, [&] { return in_flight_ == nullptr; });
        }
        if (not was_created) {
            env_.status = EnvironmentStatus::Stopped;
            return;
        }
        env = env_;
    }

    stdlog("stopping environment ", env.name);
    teardown(env);

    std::lock_guard lock{mtx_};
    env_.status = EnvironmentStatus::Stopped;
    env_.id.clear();
}

void Executor::teardown(const EnvironmentHandle& env) noexcept {
    try {
        provider_->destroy_environment(env);
    } catch (const std::exception& e) {
        errlog("failed to destroy environment ", env.name, ": ", e.what());
    }
    owned_work_dir_.remove();
}

void Executor::restart() {
    std::lock_guard lifecycle_lock{lifecycle_mtx_};
    EnvironmentHandle env;
    {
        std::lock_guard lock{mtx_};
        if (env_.status != EnvironmentStatus::Running) {
            throw InvalidStateError{
                concat_tostr("cannot restart: executor is ", to_string(env_.status))};
        }
        if (in_flight_) {
            throw ConcurrentExecutionError{"cannot restart while code is being executed"};
        }
        env_.status = EnvironmentStatus::Starting;
        env = env_;
    }

    stdlog("restarting environment ", env.name);
    try {
        provider_->restart_environment(env);
    } catch (const std::exception& e) {
        errlog("failed to restart environment ", env.name, ": ", e.what());
        stop_locked();
        if (dynamic_cast<const EnvironmentStartError*>(&e)) {
            throw;
        }
        throw EnvironmentStartError{
            concat_tostr("cannot restart environment ", env.name, ": ", e.what())};
    }

    std::lock_guard lock{mtx_};
    env_.status = EnvironmentStatus::Running;
}

CommandLineCodeResult
Executor::execute_code_blocks(const std::vector<CodeBlock>& blocks, CancellationToken& token) {
    CancellationToken call_token;
    EnvironmentHandle env;
    // Every block is checked before anything is staged
    std::vector<const LanguageCommand*> commands;
    {
        std::lock_guard lock{mtx_};
        if (env_.status != EnvironmentStatus::Running) {
            throw InvalidStateError{
                concat_tostr("cannot execute code: executor is ", to_string(env_.status))};
        }
        if (in_flight_) {
            throw ConcurrentExecutionError{
                "another execution is in progress on this executor"};
        }
        commands.reserve(blocks.size());
        for (const auto& block : blocks) {
            commands.emplace_back(&mapper_.command_for(block.language));
        }
        in_flight_ = &call_token;
        env = env_;
    }
    Defer finish{[&]() noexcept {
        std::lock_guard lock{mtx_};
        in_flight_ = nullptr;
        execution_finished_.notify_all();
    }};
    // Cancelling the caller's token cancels the call; stop() cancels the call directly
    ScopedCancelListener link{token, [&call_token] { call_token.cancel(); }};

    StagedFiles staged{env.work_dir, config_.keep_staged_files};
    BlockRunner runner{*provider_};
    const auto call_id = random_hex(8);

    CommandLineCodeResult res{
        .exit_code = 0,
        .output = {},
        .code_file = std::nullopt,
    };
    for (size_t i = 0; i < blocks.size(); ++i) {
        if (call_token.is_cancelled()) {
            res.output += "Code execution was cancelled.\n";
            res.exit_code = kCancelledExitCode;
            break;
        }
        const auto& command = *commands[i];
        auto language = CommandMapper::normalize(blocks[i].language);
        auto code = silence_pip(blocks[i].code, language);

        std::string file_name;
        try {
            file_name = filename_from_code(code, env.work_dir)
                            .value_or(concat_tostr(
                                "tmp_code_", call_id, '_', i, '.', command.file_extension
                            ));
        } catch (const FilenameOutsideWorkspaceError& e) {
            debuglog(e.what());
            res.output += "Filename is not in the workspace\n";
            res.exit_code = 1;
            break;
        }
        staged.add(file_name, command.byproducts_for(file_name));
        if (not res.code_file) {
            res.code_file = (std::filesystem::path{env.work_dir} / file_name).string();
        }

        debuglog(env.name, ": running block ", i, " (", language, ") as ", file_name);
        auto block_res = runner.run(
            code,
            command,
            file_name,
            env,
            call_token,
            {
                .timeout = config_.timeout,
                .max_output_size = config_.max_output_size,
            }
        );
        res.output += block_res.output;
        res.exit_code = block_res.exit_code;
        if (block_res.exit_code != 0) {
            break;
        }
    }
    return res;
}

EnvironmentStatus Executor::status() const {
    std::lock_guard lock{mtx_};
    return env_.status;
}

std::string Executor::work_dir() const {
    std::lock_guard lock{mtx_};
    return env_.work_dir;
}

std::string Executor::environment_name() const {
    std::lock_guard lock{mtx_};
    return env_.name;
}

} // namespace codexec

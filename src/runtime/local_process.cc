#include "codexec/concat_tostr.hh"
#include "codexec/errmsg.hh"
#include "codexec/errors.hh"
#include "codexec/logger.hh"
#include "codexec/macros/throw.hh"
#include "codexec/runtime/local_process.hh"

#include <cerrno>
#include <csignal>
#include <exception>
#include <filesystem>
#include <system_error>

namespace codexec::runtime {

namespace {

constexpr DebugLogger<false> debuglog{};

} // namespace

std::string LocalProcess::create_environment(const EnvironmentRequest& request) {
    std::error_code ec;
    if (not std::filesystem::is_directory(request.work_dir, ec)) {
        throw EnvironmentStartError{
            concat_tostr("working directory ", request.work_dir, " does not exist")};
    }
    if (not request.init_command.empty()) {
        CommandResult res{};
        try {
            res = run_to_completion(
                {"sh", "-c", request.init_command},
                std::chrono::minutes{1},
                {.cwd = request.work_dir}
            );
        } catch (const std::exception& e) {
            throw EnvironmentStartError{concat_tostr("init command failed: ", e.what())};
        }
        if (res.exit_code != 0) {
            throw EnvironmentStartError{concat_tostr(
                "init command failed with exit code ", res.exit_code, ": ", res.output
            )};
        }
    }

    std::lock_guard lock{mtx_};
    auto [it, inserted] = environments_.try_emplace(request.name);
    if (not inserted) {
        throw EnvironmentStartError{
            concat_tostr("environment ", request.name, " already exists")};
    }
    it->second.work_dir = request.work_dir;
    debuglog("local environment ", request.name, " created in ", request.work_dir);
    return concat_tostr("local-", request.name);
}

Subprocess LocalProcess::exec(const EnvironmentHandle& env, const std::vector<std::string>& argv) {
    std::lock_guard lock{mtx_};
    auto it = environments_.find(env.name);
    if (it == environments_.end()) {
        THROW("environment ", env.name, " does not exist");
    }
    // Forget the groups that are gone
    std::erase_if(it->second.process_groups, [](pid_t pgid) {
        return kill(-pgid, 0) == -1 and errno == ESRCH;
    });
    auto proc = Subprocess::spawn(argv, {.cwd = it->second.work_dir});
    it->second.process_groups.emplace_back(proc.pid());
    return proc;
}

void LocalProcess::terminate(const EnvironmentHandle& env, std::string_view staged_file) {
    std::lock_guard lock{mtx_};
    auto it = environments_.find(env.name);
    if (it == environments_.end()) {
        return;
    }
    debuglog("terminating commands of ", env.name, " running ", staged_file);
    kill_process_groups(it->second);
}

void LocalProcess::restart_environment(const EnvironmentHandle& env) {
    std::lock_guard lock{mtx_};
    auto it = environments_.find(env.name);
    if (it == environments_.end()) {
        throw EnvironmentStartError{concat_tostr("environment ", env.name, " does not exist")};
    }
    kill_process_groups(it->second);
}

void LocalProcess::destroy_environment(const EnvironmentHandle& env) {
    std::lock_guard lock{mtx_};
    auto it = environments_.find(env.name);
    if (it == environments_.end()) {
        return;
    }
    kill_process_groups(it->second);
    environments_.erase(it);
    debuglog("local environment ", env.name, " destroyed");
}

std::vector<std::string> LocalProcess::list_environments(std::string_view name_prefix) {
    std::lock_guard lock{mtx_};
    std::vector<std::string> res;
    for (const auto& [name, env] : environments_) {
        if (std::string_view{name}.starts_with(name_prefix)) {
            res.emplace_back(name);
        }
    }
    return res;
}

void LocalProcess::kill_process_groups(Environment& env) noexcept {
    for (auto pgid : env.process_groups) {
        if (kill(-pgid, SIGKILL) and errno != ESRCH) {
            errlog("kill(-", pgid, ", SIGKILL)", errmsg());
        }
    }
    env.process_groups.clear();
}

} // namespace codexec::runtime

#pragma once

#include "codexec/environment.hh"
#include "codexec/subprocess.hh"

#include <string>
#include <string_view>
#include <vector>

namespace codexec::runtime {

struct EnvironmentRequest {
    std::string image;
    std::string name;
    std::string work_dir; // host directory where code is staged
    std::string bind_dir; // host path mounted as the working directory of the environment
    std::vector<std::string> extra_volumes;
    std::vector<std::string> extra_hosts;
    std::vector<std::string> environment; // "NAME=value"
    std::string init_command;
    bool auto_remove = true;
};

// An isolated runtime provider interface: creates environments and runs commands in them
class Provider {
public:
    Provider() = default;

    Provider(const Provider&) = delete;
    Provider(Provider&&) = delete;
    Provider& operator=(const Provider&) = delete;
    Provider& operator=(Provider&&) = delete;

    virtual ~Provider() = default;

    // Creates and starts the environment, returns its id. Throws EnvironmentStartError; what
    // was created before the failure is removed before throwing.
    [[nodiscard]] virtual std::string create_environment(const EnvironmentRequest& request) = 0;

    // Starts @p argv inside the environment, in its working directory. The returned process
    // finishes when the command finishes and carries the command's output. Throws on error.
    [[nodiscard]] virtual Subprocess
    exec(const EnvironmentHandle& env, const std::vector<std::string>& argv) = 0;

    // Forcibly terminates the commands running @p staged_file inside the environment. Throws
    // on error.
    virtual void terminate(const EnvironmentHandle& env, std::string_view staged_file) = 0;

    // Throws EnvironmentStartError
    virtual void restart_environment(const EnvironmentHandle& env) = 0;

    // Releases everything the environment holds; destroying a nonexistent environment is not
    // an error. Throws on error.
    virtual void destroy_environment(const EnvironmentHandle& env) = 0;

    // Names of the existing environments whose names start with @p name_prefix
    [[nodiscard]] virtual std::vector<std::string>
    list_environments(std::string_view name_prefix) = 0;
};

} // namespace codexec::runtime

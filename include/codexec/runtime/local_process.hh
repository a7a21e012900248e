#pragma once

#include "codexec/runtime/provider.hh"

#include <map>
#include <mutex>
#include <string>
#include <sys/types.h>
#include <vector>

namespace codexec::runtime {

// Runs commands directly on the host, in the working directory of the environment.
// It provides no isolation at all; meant for tests and for hosts without a container runtime.
class LocalProcess : public Provider {
    struct Environment {
        std::string work_dir;
        // Process groups started in the environment; a group id cannot be reused while any
        // of its members lives
        std::vector<pid_t> process_groups;
    };

    std::mutex mtx_;
    std::map<std::string, Environment, std::less<>> environments_; // name -> environment

public:
    LocalProcess() = default;

    [[nodiscard]] std::string create_environment(const EnvironmentRequest& request) override;

    [[nodiscard]] Subprocess
    exec(const EnvironmentHandle& env, const std::vector<std::string>& argv) override;

    void terminate(const EnvironmentHandle& env, std::string_view staged_file) override;

    void restart_environment(const EnvironmentHandle& env) override;

    void destroy_environment(const EnvironmentHandle& env) override;

    [[nodiscard]] std::vector<std::string> list_environments(std::string_view name_prefix
    ) override;

private:
    void kill_process_groups(Environment& env) noexcept;
};

} // namespace codexec::runtime

#pragma once

#include "codexec/config.hh"
#include "codexec/runtime/provider.hh"

#include <chrono>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace codexec::runtime {

// Runs environments as Docker containers, driving the docker command line client
class DockerCli : public Provider {
public:
    struct Options {
        std::string docker_binary = "docker";
        // Bound on waiting for a container to report the running state
        std::chrono::seconds start_timeout{60};
        // Grace period given to `docker stop` before the container is killed
        std::chrono::seconds stop_timeout{10};
        // Bound on every short docker command (inspect, ps, rm, ...)
        std::chrono::seconds command_timeout{60};
    };

    // Working directory of the commands inside the container
    static constexpr std::string_view container_work_dir = "/workspace";

    // Run as `sh -c terminate_script sh <file>` inside the container, kills every process
    // whose command line contains <file>. Images without procps (no pkill) are handled by
    // scanning /proc. Exits with 1 if pkill found nothing to kill.
    static constexpr std::string_view terminate_script =
        "if command -v pkill >/dev/null 2>&1; then"
        " exec pkill -9 -f -- \"$1\";"
        " fi;"
        " for dir in /proc/[0-9]*; do"
        " pid=${dir#/proc/};"
        " [ \"$pid\" = $$ ] && continue;"
        " cmdline=$(tr '\\000' ' ' < \"$dir/cmdline\" 2>/dev/null) || continue;"
        " case \"$cmdline\" in *\"$1\"*) kill -9 \"$pid\" 2>/dev/null;; esac;"
        " done;"
        " exit 0";

private:
    Options options_;

public:
    explicit DockerCli(Options options) : options_{std::move(options)} {}

    [[nodiscard]] std::string create_environment(const EnvironmentRequest& request) override;

    [[nodiscard]] Subprocess
    exec(const EnvironmentHandle& env, const std::vector<std::string>& argv) override;

    void terminate(const EnvironmentHandle& env, std::string_view staged_file) override;

    void restart_environment(const EnvironmentHandle& env) override;

    void destroy_environment(const EnvironmentHandle& env) override;

    [[nodiscard]] std::vector<std::string> list_environments(std::string_view name_prefix
    ) override;

private:
    CommandResult docker(std::vector<std::string> args) const;

    CommandResult docker(std::vector<std::string> args, std::chrono::nanoseconds timeout) const;

    // Throws EnvironmentStartError
    void wait_until_running(std::string_view name) const;

    // Throws on error; removing a nonexistent container is not an error
    void remove_container(std::string_view name) const;
};

std::shared_ptr<DockerCli> make_docker_provider(const ExecutorConfig& config);

} // namespace codexec::runtime

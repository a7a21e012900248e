#pragma once

#include "codexec/functions.hh"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace codexec {

// Upper bound of every time limit; deadlines computed from it cannot overflow
constexpr auto max_time_limit =
    std::chrono::duration_cast<std::chrono::seconds>(std::chrono::nanoseconds::max()) / 2;

struct ExecutorConfig {
    // Image the environment is created from; it has to be available locally
    std::string image = "python:3-slim";
    // Environment name is this prefix followed by random characters
    std::string container_name_prefix = "codexec-";
    // Host directory where code is staged; if empty, a temporary directory is created on
    // start and removed on stop
    std::string work_dir;
    // Host path bind mounted as the working directory of the environment; defaults to
    // work_dir. Useful when the executor itself runs in a container.
    std::string bind_dir;
    // Time limit of executing a single code block
    std::chrono::seconds timeout{60};
    // Additional bind mounts in docker's -v format: "host_path:container_path[:mode]"
    std::vector<std::string> extra_volumes;
    // Additional hosts in docker's --add-host format: "name:ip"
    std::vector<std::string> extra_hosts;
    // Environment variables: "NAME=value"
    std::vector<std::string> environment;
    // Shell command run inside the environment once it is started
    std::string init_command;
    // Remove the container as soon as it stops
    bool auto_remove = true;
    // Leave staged code files in work_dir after execution
    bool keep_staged_files = false;
    // Output of a single block above this size is discarded
    std::optional<uint64_t> max_output_size;
    std::chrono::seconds stop_timeout{10};
    std::chrono::seconds start_timeout{60};
    std::string docker_binary = "docker";
    // Functions written on start to <functions_module>.py in the working directory, so that
    // executed python code can import them; their packages are installed with pip first
    std::vector<FunctionWithRequirements> functions;
    std::string functions_module = "functions";

    // Throws ConfigError
    void validate() const;
};

// Parses configuration in the format:
//   # comment
//   image: python:3.12-slim
//   timeout: 30
//   extra_volumes: [/data:/data:ro, "/my dir:/mnt"]
// Options not mentioned keep their default values. Throws ConfigError.
ExecutorConfig parse_config(std::string_view text);

// Throws ConfigError
ExecutorConfig load_config(const std::string& path);

} // namespace codexec

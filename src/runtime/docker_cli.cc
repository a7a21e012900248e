#include "codexec/concat_tostr.hh"
#include "codexec/errors.hh"
#include "codexec/logger.hh"
#include "codexec/macros/throw.hh"
#include "codexec/runtime/docker_cli.hh"

#include <cctype>
#include <exception>
#include <thread>

using std::string;
using std::string_view;
using std::vector;

namespace codexec::runtime {

namespace {

constexpr DebugLogger<false> debuglog{};

constexpr auto poll_interval = std::chrono::milliseconds{100};

string_view trim(string_view str) noexcept {
    while (not str.empty() and std::isspace(static_cast<unsigned char>(str.front()))) {
        str.remove_prefix(1);
    }
    while (not str.empty() and std::isspace(static_cast<unsigned char>(str.back()))) {
        str.remove_suffix(1);
    }
    return str;
}

bool is_no_such_container(string_view output) noexcept {
    return output.find("No such container") != string_view::npos;
}

} // namespace

CommandResult DockerCli::docker(vector<string> args) const {
    return docker(std::move(args), options_.command_timeout);
}

CommandResult DockerCli::docker(vector<string> args, std::chrono::nanoseconds timeout) const {
    args.insert(args.begin(), options_.docker_binary);
    debuglog("running:", [&] {
        string cmd;
        for (const auto& arg : args) {
            cmd += ' ';
            cmd += arg;
        }
        return cmd;
    }());
    auto res = run_to_completion(args, timeout);
    if (res.timed_out) {
        THROW(args[0], ' ', args[1], " did not finish within the time limit");
    }
    return res;
}

std::string DockerCli::create_environment(const EnvironmentRequest& request) {
    // Images are never pulled, the image has to be present
    CommandResult inspect{};
    try {
        inspect = docker({"image", "inspect", "--format", "{{.Id}}", request.image});
    } catch (const std::exception& e) {
        throw EnvironmentStartError{concat_tostr("docker is unreachable: ", e.what())};
    }
    if (inspect.exit_code != 0) {
        throw EnvironmentStartError{concat_tostr(
            "image ", request.image, " is not available: ", trim(inspect.output)
        )};
    }

    vector<string> args = {
        "run",
        "--detach",
        "--tty",
        "--entrypoint",
        "/bin/sh",
        "--name",
        request.name,
        "--workdir",
        string{container_work_dir},
        "--volume",
        concat_tostr(request.bind_dir, ':', container_work_dir, ":rw"),
    };
    for (const auto& volume : request.extra_volumes) {
        args.emplace_back("--volume");
        args.emplace_back(volume);
    }
    for (const auto& host : request.extra_hosts) {
        args.emplace_back("--add-host");
        args.emplace_back(host);
    }
    for (const auto& var : request.environment) {
        args.emplace_back("--env");
        args.emplace_back(var);
    }
    if (request.auto_remove) {
        args.emplace_back("--rm");
    }
    args.emplace_back(request.image);

    auto fail = [&](const string& reason) {
        try {
            remove_container(request.name);
        } catch (const std::exception& e) {
            errlog("failed to remove container ", request.name, ": ", e.what());
        }
        throw EnvironmentStartError{
            concat_tostr("cannot start container ", request.name, ": ", reason)};
    };

    try {
        auto run = docker(std::move(args));
        if (run.exit_code != 0) {
            fail(string{trim(run.output)});
        }
        // The container id is the last line of the output
        auto out = trim(run.output);
        auto id = string{out.substr(out.rfind('\n') + 1)};

        wait_until_running(request.name);

        if (not request.init_command.empty()) {
            auto init = docker(
                {"exec",
                 "--workdir",
                 string{container_work_dir},
                 request.name,
                 "sh",
                 "-c",
                 request.init_command},
                options_.start_timeout
            );
            if (init.exit_code != 0) {
                fail(concat_tostr(
                    "init command failed with exit code ", init.exit_code, ": ", trim(init.output)
                ));
            }
        }
        return id;
    } catch (const EnvironmentStartError&) {
        throw;
    } catch (const std::exception& e) {
        fail(e.what());
    }
    __builtin_unreachable();
}

void DockerCli::wait_until_running(string_view name) const {
    auto deadline = std::chrono::steady_clock::now() + options_.start_timeout;
    for (;;) {
        auto res = docker({"inspect", "--format", "{{.State.Status}}", string{name}});
        auto state = trim(res.output);
        if (res.exit_code == 0) {
            if (state == "running") {
                return;
            }
            if (state == "exited" or state == "dead") {
                throw EnvironmentStartError{
                    concat_tostr("container ", name, " stopped right after the start")};
            }
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            throw EnvironmentStartError{concat_tostr(
                "container ", name, " did not start within ", options_.start_timeout.count(),
                " s (last state: ", state, ')'
            )};
        }
        std::this_thread::sleep_for(poll_interval);
    }
}

Subprocess DockerCli::exec(const EnvironmentHandle& env, const vector<string>& argv) {
    vector<string> args = {
        options_.docker_binary,
        "exec",
        "--workdir",
        string{container_work_dir},
        env.name,
    };
    args.insert(args.end(), argv.begin(), argv.end());
    return Subprocess::spawn(args);
}

void DockerCli::terminate(const EnvironmentHandle& env, string_view staged_file) {
    auto res = docker(
        {"exec",
         "--workdir",
         string{container_work_dir},
         env.name,
         "sh",
         "-c",
         string{terminate_script},
         "sh",
         string{staged_file}}
    );
    // pkill exits with 1 if no process matched
    if (res.exit_code != 0 and res.exit_code != 1) {
        THROW("terminating ", staged_file, " in ", env.name, " failed with exit code ",
              res.exit_code, ": ", trim(res.output));
    }
}

void DockerCli::restart_environment(const EnvironmentHandle& env) {
    CommandResult res{};
    try {
        res = docker(
            {"restart", "--time", std::to_string(options_.stop_timeout.count()), env.name},
            options_.command_timeout + options_.stop_timeout
        );
    } catch (const std::exception& e) {
        throw EnvironmentStartError{concat_tostr("cannot restart ", env.name, ": ", e.what())};
    }
    if (res.exit_code != 0) {
        throw EnvironmentStartError{
            concat_tostr("cannot restart ", env.name, ": ", trim(res.output))};
    }
    wait_until_running(env.name);
}

void DockerCli::destroy_environment(const EnvironmentHandle& env) {
    auto stop = docker(
        {"stop", "--time", std::to_string(options_.stop_timeout.count()), env.name},
        options_.command_timeout + options_.stop_timeout
    );
    if (stop.exit_code != 0 and not is_no_such_container(stop.output)) {
        errlog("docker stop ", env.name, " failed: ", trim(stop.output));
    }
    // With --rm the container may already be gone; if stop failed, this kills it
    remove_container(env.name);
}

void DockerCli::remove_container(string_view name) const {
    auto rm = docker({"rm", "--force", string{name}});
    if (rm.exit_code != 0 and not is_no_such_container(rm.output)) {
        THROW("docker rm ", name, " failed: ", trim(rm.output));
    }
}

vector<string> DockerCli::list_environments(string_view name_prefix) {
    auto res = docker(
        {"ps", "--all", "--filter", concat_tostr("name=", name_prefix), "--format", "{{.Names}}"}
    );
    if (res.exit_code != 0) {
        THROW("docker ps failed: ", trim(res.output));
    }
    vector<string> names;
    string_view out = res.output;
    while (not out.empty()) {
        auto eol = out.find('\n');
        auto line = trim(out.substr(0, eol));
        // The filter matches substrings, so the prefix is checked here
        if (not line.empty() and line.starts_with(name_prefix)) {
            names.emplace_back(line);
        }
        out.remove_prefix(eol == string_view::npos ? out.size() : eol + 1);
    }
    return names;
}

std::shared_ptr<DockerCli> make_docker_provider(const ExecutorConfig& config) {
    return std::make_shared<DockerCli>(DockerCli::Options{
        .docker_binary = config.docker_binary,
        .start_timeout = config.start_timeout,
        .stop_timeout = config.stop_timeout,
        .command_timeout = std::chrono::seconds{60},
    });
}

} // namespace codexec::runtime

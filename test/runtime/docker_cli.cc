#include "test_utils.hh"

#include <algorithm>
#include <chrono>
#include <codexec/code_block.hh>
#include <codexec/concat_tostr.hh>
#include <codexec/errors.hh>
#include <codexec/executor.hh>
#include <codexec/file_contents.hh>
#include <codexec/random.hh>
#include <codexec/runtime/docker_cli.hh>
#include <codexec/subprocess.hh>
#include <codexec/temporary_directory.hh>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <gtest/gtest.h>
#include <string>
#include <string_view>
#include <vector>

using codexec::concat_tostr;
using codexec::EnvironmentHandle;
using codexec::EnvironmentStartError;
using codexec::EnvironmentStatus;
using codexec::TemporaryDirectory;
using codexec::runtime::DockerCli;
using codexec::runtime::EnvironmentRequest;
using std::string;
using std::string_view;
using std::vector;
using namespace std::chrono_literals;

namespace {

// Shell script standing in for the docker client: logs its arguments and emulates the
// commands used by DockerCli
class FakeDocker {
    TemporaryDirectory dir_{"/tmp/codexec-test.XXXXXX"};

public:
    bool image_available = true;
    string container_state = "running";

    [[nodiscard]] string workspace() const { return dir_.path() + "/workspace"; }

    [[nodiscard]] string binary() const { return dir_.path() + "/docker"; }

    void install() const {
        std::filesystem::create_directories(workspace());
        auto image_case = image_available
            ? string{"echo sha256:5e1f6a0b"}
            : string{"echo \"Error: No such image: $5\" >&2; exit 1"};
        codexec::put_file_contents(
            binary(),
            concat_tostr(
                "#!/bin/sh\n"
                "printf '%s\\n' \"$*\" >> '",
                dir_.path(),
                "/log'\n"
                "case \"$1\" in\n"
                "image) ",
                image_case,
                " ;;\n"
                "run) echo 4f3c2a1b ;;\n"
                "inspect) echo ",
                container_state,
                " ;;\n"
                "exec)\n"
                "    shift 4\n"
                "    if [ \"$1\" = sh ] && [ \"$4\" = sh ]; then exit 1; fi\n"
                "    cd '",
                workspace(),
                "' && exec \"$@\" ;;\n"
                "stop|restart|rm) exit 0 ;;\n"
                "ps) printf 'codexec-test-aaa\\nother-codexec-test-bbb\\ncodexec-test-ccc\\n' ;;\n"
                "*) echo \"unknown command $1\" >&2; exit 1 ;;\n"
                "esac\n"
            )
        );
        std::filesystem::permissions(binary(), std::filesystem::perms::owner_all);
    }

    [[nodiscard]] vector<string> log() const {
        vector<string> lines;
        string contents;
        try {
            contents = codexec::get_file_contents(dir_.path() + "/log");
        } catch (const std::exception&) {
            return lines; // nothing was run
        }
        string_view str = contents;
        while (not str.empty()) {
            auto eol = str.find('\n');
            lines.emplace_back(str.substr(0, eol));
            str.remove_prefix(eol == string_view::npos ? str.size() : eol + 1);
        }
        return lines;
    }

    [[nodiscard]] DockerCli provider() const {
        return DockerCli{{
            .docker_binary = binary(),
            .start_timeout = 5s,
            .stop_timeout = 10s,
            .command_timeout = 10s,
        }};
    }
};

EnvironmentRequest request(const string& bind_dir) {
    return {
        .image = "python:3-slim",
        .name = "codexec-test-x",
        .work_dir = bind_dir,
        .bind_dir = bind_dir,
        .extra_volumes = {},
        .extra_hosts = {},
        .environment = {},
        .init_command = "",
        .auto_remove = true,
    };
}

EnvironmentHandle handle() {
    return {
        .id = "4f3c2a1b",
        .name = "codexec-test-x",
        .work_dir = "",
        .status = EnvironmentStatus::Running,
    };
}

bool contains(const vector<string>& lines, const string& line) {
    return std::find(lines.begin(), lines.end(), line) != lines.end();
}

} // namespace

// NOLINTNEXTLINE
TEST(docker_cli, image_not_available) {
    FakeDocker docker;
    docker.image_available = false;
    docker.install();
    auto provider = docker.provider();
    try {
        (void)provider.create_environment(request(docker.workspace()));
        FAIL() << "expected EnvironmentStartError";
    } catch (const EnvironmentStartError& e) {
        ASSERT_NE(string{e.what()}.find("No such image: python:3-slim"), string::npos)
            << e.what();
    }
    // Nothing is pulled nor run
    ASSERT_EQ(docker.log(), vector<string>{"image inspect --format {{.Id}} python:3-slim"});
}

// NOLINTNEXTLINE
TEST(docker_cli, create_environment) {
    FakeDocker docker;
    docker.install();
    auto provider = docker.provider();
    auto req = request("/srv/bind");
    req.extra_volumes = {"/data:/data:ro"};
    req.extra_hosts = {"db:10.0.0.2"};
    req.environment = {"A=1", "B=two"};
    ASSERT_EQ(provider.create_environment(req), "4f3c2a1b");
    ASSERT_EQ(
        docker.log(),
        (vector<string>{
            "image inspect --format {{.Id}} python:3-slim",
            "run --detach --tty --entrypoint /bin/sh --name codexec-test-x --workdir /workspace "
            "--volume /srv/bind:/workspace:rw --volume /data:/data:ro --add-host db:10.0.0.2 "
            "--env A=1 --env B=two --rm python:3-slim",
            "inspect --format {{.State.Status}} codexec-test-x",
        })
    );
}

// NOLINTNEXTLINE
TEST(docker_cli, without_auto_remove) {
    FakeDocker docker;
    docker.install();
    auto provider = docker.provider();
    auto req = request("/srv/bind");
    req.auto_remove = false;
    (void)provider.create_environment(req);
    ASSERT_EQ(
        docker.log().at(1),
        "run --detach --tty --entrypoint /bin/sh --name codexec-test-x --workdir /workspace "
        "--volume /srv/bind:/workspace:rw python:3-slim"
    );
}

// NOLINTNEXTLINE
TEST(docker_cli, init_command) {
    FakeDocker docker;
    docker.install();
    auto provider = docker.provider();
    auto req = request(docker.workspace());
    req.init_command = "touch initialized";
    (void)provider.create_environment(req);
    ASSERT_TRUE(contains(
        docker.log(), "exec --workdir /workspace codexec-test-x sh -c touch initialized"
    ));
    ASSERT_TRUE(std::filesystem::exists(docker.workspace() + "/initialized"));
}

// NOLINTNEXTLINE
TEST(docker_cli, failing_init_command_removes_container) {
    FakeDocker docker;
    docker.install();
    auto provider = docker.provider();
    auto req = request(docker.workspace());
    req.init_command = "exit 3";
    ASSERT_THROW((void)provider.create_environment(req), EnvironmentStartError);
    ASSERT_EQ(docker.log().back(), "rm --force codexec-test-x");
}

// NOLINTNEXTLINE
TEST(docker_cli, container_exits_right_after_start) {
    FakeDocker docker;
    docker.container_state = "exited";
    docker.install();
    auto provider = docker.provider();
    ASSERT_THROW(
        (void)provider.create_environment(request(docker.workspace())), EnvironmentStartError
    );
    ASSERT_EQ(docker.log().back(), "rm --force codexec-test-x");
}

// NOLINTNEXTLINE
TEST(docker_cli, container_does_not_start_in_time) {
    FakeDocker docker;
    docker.container_state = "created";
    docker.install();
    DockerCli provider{{
        .docker_binary = docker.binary(),
        .start_timeout = 1s,
        .stop_timeout = 10s,
        .command_timeout = 10s,
    }};
    ASSERT_THROW(
        (void)provider.create_environment(request(docker.workspace())), EnvironmentStartError
    );
    ASSERT_EQ(docker.log().back(), "rm --force codexec-test-x");
}

// NOLINTNEXTLINE
TEST(docker_cli, missing_docker_binary) {
    DockerCli provider{{.docker_binary = "/nonexistent/docker"}};
    ASSERT_THROW((void)provider.create_environment(request("/tmp")), EnvironmentStartError);
}

// NOLINTNEXTLINE
TEST(docker_cli, exec) {
    FakeDocker docker;
    docker.install();
    auto provider = docker.provider();
    auto proc = provider.exec(handle(), {"sh", "-c", "echo in container; exit 2"});
    ASSERT_EQ(proc.wait().exit_code(), 2);
    codexec::CollectedOutput collected;
    codexec::read_available_output(proc, collected, std::nullopt);
    ASSERT_EQ(collected.output, "in container\n");
    ASSERT_EQ(
        docker.log(),
        vector<string>{"exec --workdir /workspace codexec-test-x sh -c echo in container; exit 2"}
    );
}

// NOLINTNEXTLINE
TEST(docker_cli, terminate) {
    FakeDocker docker;
    docker.install();
    auto provider = docker.provider();
    // Exit code 1 means nothing matched, that is fine
    ASSERT_NO_THROW(provider.terminate(handle(), "tmp_code_1.py"));
    ASSERT_EQ(
        docker.log(),
        vector<string>{concat_tostr(
            "exec --workdir /workspace codexec-test-x sh -c ", DockerCli::terminate_script,
            " sh tmp_code_1.py"
        )}
    );
}

namespace {

// Runs the terminate script on the host against a looping shell script and checks that the
// script is killed
void check_terminate_script_kills(const TemporaryDirectory& dir) {
    auto victim_name = concat_tostr("victim_", codexec::random_hex(12), ".sh");
    codexec::put_file_contents(
        dir.path() + "/" + victim_name, "touch started\nwhile :; do sleep 1; done\n"
    );
    auto victim = codexec::Subprocess::spawn({"/bin/sh", victim_name}, {.cwd = dir.path()});
    ASSERT_TRUE(wait_until([&] { return std::filesystem::exists(dir.path() + "/started"); }));

    auto res = codexec::run_to_completion(
        {"/bin/sh", "-c", string{DockerCli::terminate_script}, "sh", victim_name}, 10s
    );
    ASSERT_EQ(res.exit_code, 0) << res.output;
    ASSERT_EQ(victim.wait().exit_code(), 128 + SIGKILL);
    (void)victim.signal_group(SIGKILL); // the sleep
}

} // namespace

// NOLINTNEXTLINE
TEST(docker_cli, terminate_script_with_pkill) {
    if (codexec::run_to_completion({"sh", "-c", "command -v pkill"}, 10s).exit_code != 0) {
        GTEST_SKIP() << "pkill is not available";
    }
    TemporaryDirectory dir{"/tmp/codexec-test.XXXXXX"};
    check_terminate_script_kills(dir);
}

// NOLINTNEXTLINE
TEST(docker_cli, terminate_script_without_pkill) {
    TemporaryDirectory dir{"/tmp/codexec-test.XXXXXX"};
    // PATH with only tr on it, as in an image without procps
    auto bin_dir = dir.path() + "/bin";
    std::filesystem::create_directories(bin_dir);
    auto tr = std::filesystem::exists("/usr/bin/tr") ? "/usr/bin/tr" : "/bin/tr";
    std::filesystem::create_symlink(tr, bin_dir + "/tr");

    ScopedEnvVar path{"PATH", bin_dir};
    check_terminate_script_kills(dir);
}

// NOLINTNEXTLINE
TEST(docker_cli, restart_and_destroy) {
    FakeDocker docker;
    docker.install();
    auto provider = docker.provider();
    provider.restart_environment(handle());
    provider.destroy_environment(handle());
    ASSERT_EQ(
        docker.log(),
        (vector<string>{
            "restart --time 10 codexec-test-x",
            "inspect --format {{.State.Status}} codexec-test-x",
            "stop --time 10 codexec-test-x",
            "rm --force codexec-test-x",
        })
    );
}

// NOLINTNEXTLINE
TEST(docker_cli, list_environments) {
    FakeDocker docker;
    docker.install();
    auto provider = docker.provider();
    ASSERT_EQ(
        provider.list_environments("codexec-test-"),
        (vector<string>{"codexec-test-aaa", "codexec-test-ccc"})
    );
    ASSERT_EQ(
        docker.log(), vector<string>{"ps --all --filter name=codexec-test- --format {{.Names}}"}
    );
}

// NOLINTNEXTLINE
TEST(docker_cli, executor) {
    FakeDocker docker;
    docker.install();
    codexec::ExecutorConfig config;
    config.docker_binary = docker.binary();
    config.work_dir = docker.workspace();
    config.container_name_prefix = "codexec-test-";
    config.timeout = 1s;
    codexec::Executor executor{config};
    executor.start();

    codexec::CancellationToken token;
    auto res = executor.execute_code_blocks(
        {
            {.language = "sh", .code = "echo from container"},
            {.language = "sh", .code = "sleep 30"},
        },
        token
    );
    ASSERT_EQ(res.exit_code, codexec::kTimeoutExitCode);
    ASSERT_EQ(res.output, "from container\nCode execution was timed out.\n");

    auto name = executor.environment_name();
    executor.stop();
    auto log = docker.log();
    ASSERT_EQ(log.at(1).find("run --detach"), 0);
    auto volume = concat_tostr("--volume ", docker.workspace(), ":/workspace:rw");
    ASSERT_NE(log.at(1).find(volume), string::npos);
    ASSERT_EQ(log.at(log.size() - 2), concat_tostr("stop --time 10 ", name));
    ASSERT_EQ(log.back(), concat_tostr("rm --force ", name));
}

// Requires a docker daemon and the image present locally
// NOLINTNEXTLINE
TEST(docker_cli, real_docker) {
    const char* image_env = std::getenv("CODEXEC_TEST_IMAGE");
    string image = image_env ? image_env : "python:3-slim";
    auto info = codexec::run_to_completion({"docker", "image", "inspect", image}, 30s);
    if (info.exit_code != 0) {
        GTEST_SKIP() << "docker or image " << image << " is not available";
    }

    codexec::ExecutorConfig config;
    config.image = image;
    config.container_name_prefix = "codexec-test-";
    config.timeout = 30s;
    codexec::Executor executor{config};
    executor.start();
    auto provider = codexec::runtime::make_docker_provider(config);
    auto name = executor.environment_name();
    ASSERT_TRUE(contains(provider->list_environments("codexec-test-"), name));

    codexec::CancellationToken token;
    auto res = executor.execute_code_blocks(
        {
            {.language = "sh", .code = "echo hello > greeting.txt"},
            {.language = "python", .code = "print(open('greeting.txt').read().strip())"},
        },
        token
    );
    ASSERT_EQ(res.exit_code, 0) << res.output;
    ASSERT_EQ(res.output, "hello\n");

    executor.stop();
    ASSERT_FALSE(contains(provider->list_environments("codexec-test-"), name));
}

// Prints the environment variables seen by code running inside a container.
// Usage: codexec-example-basic [config file]

#include <codexec/cancellation_token.hh>
#include <codexec/config.hh>
#include <codexec/errors.hh>
#include <codexec/executor.hh>
#include <codexec/logger.hh>

#include <cstdio>
#include <exception>

int main(int argc, char** argv) {
    try {
        auto config = argc > 1 ? codexec::load_config(argv[1]) : codexec::ExecutorConfig{};
        codexec::Executor executor{config};
        executor.start();

        codexec::CancellationToken token;
        auto res = executor.execute_code_blocks(
            {{
                .language = "python",
                .code = "import os\n"
                        "for k, v in os.environ.items():\n"
                        "    print(f\"{k}={v}\")\n",
            }},
            token
        );
        std::fputs(res.output.c_str(), stdout);
        executor.stop();
        return res.exit_code;
    } catch (const std::exception& e) {
        codexec::errlog("error: ", e.what());
        return 1;
    }
}

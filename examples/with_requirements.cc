// Makes a pandas-backed function importable by the executed code.
// Usage: codexec-example-with-requirements [config file]

#include <codexec/cancellation_token.hh>
#include <codexec/concat_tostr.hh>
#include <codexec/config.hh>
#include <codexec/executor.hh>
#include <codexec/logger.hh>

#include <cstdio>
#include <exception>

int main(int argc, char** argv) {
    try {
        auto config = argc > 1 ? codexec::load_config(argv[1]) : codexec::ExecutorConfig{};
        config.functions.push_back({
            .source = "def load_data():\n"
                      "    data = {'name': ['John', 'Anna'], 'location': ['New York', 'Paris']}\n"
                      "    return pd.DataFrame(data)",
            .python_packages = {"pandas"},
            .global_imports = {{.module = "pandas", .alias = "pd"}},
        });
        codexec::Executor executor{config};
        executor.start();

        codexec::CancellationToken token;
        auto res = executor.execute_code_blocks(
            {{
                .language = "python",
                .code = codexec::concat_tostr(
                    "from ", executor.functions_module(), " import load_data\n"
                    "print(load_data())\n"
                ),
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

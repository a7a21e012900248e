#pragma once

#include <optional>
#include <string>

namespace codexec {

struct CodeBlock {
    std::string language; // language tag, e.g. "python" or "sh"
    std::string code;
};

// Exit code of a block whose command was killed because the time limit was exceeded
constexpr int kTimeoutExitCode = 124;
// Exit code of a block whose command was killed because execution was cancelled
constexpr int kCancelledExitCode = 130;

struct BlockResult {
    int exit_code;
    std::string output; // stdout and stderr interleaved
};

struct CommandLineCodeResult {
    // 0 if every block succeeded, otherwise the exit code of the first failed block
    int exit_code;
    // Concatenated output of the executed blocks
    std::string output;
    // Path of the first staged file (on the host)
    std::optional<std::string> code_file;
};

} // namespace codexec

#pragma once

#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace codexec {

// How to run a staged code file. In every string "{file}" is replaced with the name of the
// staged file (relative to the working directory).
struct LanguageCommand {
    std::string file_extension; // without the leading '.'
    std::vector<std::string> run_command;
    // Files created by the command next to the staged file, removed together with it
    std::vector<std::string> byproducts;

    [[nodiscard]] std::vector<std::string> argv_for(std::string_view file) const;

    [[nodiscard]] std::vector<std::string> byproducts_for(std::string_view file) const;
};

// Maps language tags (case-insensitive) to commands
class CommandMapper {
    std::map<std::string, LanguageCommand, std::less<>> commands_;

public:
    // Populated with the default languages
    CommandMapper();

    // Throws UnsupportedLanguageError for unknown tags
    [[nodiscard]] const LanguageCommand& command_for(std::string_view language) const;

    [[nodiscard]] bool is_supported(std::string_view language) const;

    // Adds a new language or replaces the command of an existing one
    void register_language(std::string_view language, LanguageCommand command);

    [[nodiscard]] std::vector<std::string> supported_languages() const;

    [[nodiscard]] static std::string normalize(std::string_view language);
};

} // namespace codexec

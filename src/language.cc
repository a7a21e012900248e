#include "codexec/concat_tostr.hh"
#include "codexec/errors.hh"
#include "codexec/language.hh"

#include <cctype>
#include <utility>

namespace codexec {

namespace {

constexpr std::string_view file_placeholder = "{file}";

std::string substitute_file(std::string_view templ, std::string_view file) {
    std::string res;
    for (;;) {
        auto pos = templ.find(file_placeholder);
        if (pos == std::string_view::npos) {
            res += templ;
            return res;
        }
        res += templ.substr(0, pos);
        res += file;
        templ.remove_prefix(pos + file_placeholder.size());
    }
}

LanguageCommand interpreted(std::string_view extension, std::string_view interpreter) {
    return {
        .file_extension = std::string{extension},
        .run_command = {std::string{interpreter}, std::string{file_placeholder}},
        .byproducts = {},
    };
}

LanguageCommand compiled(std::string_view extension, std::string_view compiler) {
    // $1 is the staged file
    return {
        .file_extension = std::string{extension},
        .run_command =
            {
                "sh",
                "-c",
                concat_tostr(compiler, R"( -o "$1.out" "$1" && exec "./$1.out")"),
                "sh",
                std::string{file_placeholder},
            },
        .byproducts = {"{file}.out"},
    };
}

} // namespace

std::vector<std::string> LanguageCommand::argv_for(std::string_view file) const {
    std::vector<std::string> argv;
    argv.reserve(run_command.size());
    for (const auto& arg : run_command) {
        argv.emplace_back(substitute_file(arg, file));
    }
    return argv;
}

std::vector<std::string> LanguageCommand::byproducts_for(std::string_view file) const {
    std::vector<std::string> res;
    res.reserve(byproducts.size());
    for (const auto& templ : byproducts) {
        res.emplace_back(substitute_file(templ, file));
    }
    return res;
}

CommandMapper::CommandMapper() {
    for (auto lang : {"python", "python3", "py"}) {
        commands_.emplace(lang, interpreted("py", "python"));
    }
    commands_.emplace("bash", interpreted("sh", "bash"));
    for (auto lang : {"sh", "shell"}) {
        commands_.emplace(lang, interpreted("sh", "sh"));
    }
    for (auto lang : {"pwsh", "powershell", "ps1"}) {
        commands_.emplace(lang, interpreted("ps1", "pwsh"));
    }
    for (auto lang : {"javascript", "js", "node"}) {
        commands_.emplace(lang, interpreted("js", "node"));
    }
    commands_.emplace("c", compiled("c", "cc"));
    for (auto lang : {"cpp", "c++"}) {
        commands_.emplace(lang, compiled("cpp", "c++"));
    }
}

const LanguageCommand& CommandMapper::command_for(std::string_view language) const {
    auto it = commands_.find(normalize(language));
    if (it == commands_.end()) {
        throw UnsupportedLanguageError{
            concat_tostr("language \"", language, "\" is not supported")};
    }
    return it->second;
}

bool CommandMapper::is_supported(std::string_view language) const {
    return commands_.find(normalize(language)) != commands_.end();
}

void CommandMapper::register_language(std::string_view language, LanguageCommand command) {
    commands_.insert_or_assign(normalize(language), std::move(command));
}

std::vector<std::string> CommandMapper::supported_languages() const {
    std::vector<std::string> res;
    res.reserve(commands_.size());
    for (const auto& [lang, cmd] : commands_) {
        res.emplace_back(lang);
    }
    return res;
}

std::string CommandMapper::normalize(std::string_view language) {
    std::string res;
    res.reserve(language.size());
    for (unsigned char c : language) {
        if (not std::isspace(c)) {
            res += static_cast<char>(std::tolower(c));
        }
    }
    return res;
}

} // namespace codexec

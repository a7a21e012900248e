#include "codexec/code_directives.hh"
#include "codexec/concat_tostr.hh"
#include "codexec/errors.hh"

#include <array>
#include <cctype>
#include <filesystem>
#include <utility>

namespace codexec {

namespace {

std::string_view trim(std::string_view str) noexcept {
    while (not str.empty() and std::isspace(static_cast<unsigned char>(str.front()))) {
        str.remove_prefix(1);
    }
    while (not str.empty() and std::isspace(static_cast<unsigned char>(str.back()))) {
        str.remove_suffix(1);
    }
    return str;
}

std::optional<std::string_view> directive_value(std::string_view line) noexcept {
    // {prefix, suffix}
    constexpr std::array<std::pair<std::string_view, std::string_view>, 4> comment_forms = {{
        {"<!--", "-->"},
        {"/*", "*/"},
        {"//", ""},
        {"#", ""},
    }};
    for (auto [prefix, suffix] : comment_forms) {
        if (not line.starts_with(prefix) or not line.ends_with(suffix) or
            line.size() < prefix.size() + suffix.size())
        {
            continue;
        }
        auto inner = line.substr(prefix.size(), line.size() - prefix.size() - suffix.size());
        inner = trim(inner);
        constexpr std::string_view key = "filename:";
        if (not inner.starts_with(key)) {
            return std::nullopt;
        }
        auto value = trim(inner.substr(key.size()));
        if (value.empty()) {
            return std::nullopt;
        }
        return value;
    }
    return std::nullopt;
}

} // namespace

std::optional<std::string> filename_from_code(std::string_view code, std::string_view work_dir) {
    auto first_line = trim(code.substr(0, code.find('\n')));
    auto name = directive_value(first_line);
    if (not name) {
        return std::nullopt;
    }

    namespace fs = std::filesystem;
    auto root = fs::weakly_canonical(fs::absolute(work_dir));
    auto path = fs::path{*name};
    if (path.is_relative()) {
        path = root / path;
    }
    path = fs::weakly_canonical(path);
    auto rel = path.lexically_relative(root);
    if (rel.empty() or rel == "." or *rel.begin() == "..") {
        throw FilenameOutsideWorkspaceError{
            concat_tostr("file \"", *name, "\" is not in the workspace")};
    }
    return rel.string();
}

std::string silence_pip(std::string_view code, std::string_view language) {
    std::array<std::string_view, 2> prefixes;
    if (language == "python" or language == "python3" or language == "py") {
        prefixes = {"!pip install", "! pip install"};
    } else if (
        language == "bash" or language == "shell" or language == "sh" or language == "pwsh" or
        language == "powershell" or language == "ps1")
    {
        prefixes = {"pip install", ""};
    } else {
        return std::string{code};
    }

    std::string res;
    res.reserve(code.size());
    for (;;) {
        auto eol = code.find('\n');
        auto line = code.substr(0, eol);
        for (auto prefix : prefixes) {
            if (not prefix.empty() and line.starts_with(prefix) and
                line.find("-qqq") == std::string_view::npos)
            {
                res += prefix;
                res += " -qqq";
                line.remove_prefix(prefix.size());
                break;
            }
        }
        res += line;
        if (eol == std::string_view::npos) {
            return res;
        }
        res += '\n';
        code.remove_prefix(eol + 1);
    }
}

} // namespace codexec

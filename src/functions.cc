#include "codexec/concat_tostr.hh"
#include "codexec/errors.hh"
#include "codexec/functions.hh"

#include <algorithm>
#include <cctype>
#include <optional>

namespace codexec {

bool is_python_identifier(std::string_view str) noexcept {
    if (str.empty() or std::isdigit(static_cast<unsigned char>(str.front()))) {
        return false;
    }
    return std::all_of(str.begin(), str.end(), [](unsigned char c) {
        return std::isalnum(c) or c == '_';
    });
}

namespace {

// Dotted module path, e.g. "os.path"
bool is_module_path(std::string_view str) noexcept {
    for (;;) {
        auto dot = str.find('.');
        if (not is_python_identifier(str.substr(0, dot))) {
            return false;
        }
        if (dot == std::string_view::npos) {
            return true;
        }
        str.remove_prefix(dot + 1);
    }
}

std::string with_alias(std::string_view name, std::string_view alias) {
    if (not is_python_identifier(alias)) {
        throw ConfigError{concat_tostr("invalid import alias \"", alias, '"')};
    }
    return concat_tostr(name, " as ", alias);
}

// Returns the function name if @p line starts a top-level function definition
std::optional<std::string_view> defined_function(std::string_view line) noexcept {
    for (std::string_view prefix : {"def ", "async def "}) {
        if (line.starts_with(prefix)) {
            line.remove_prefix(prefix.size());
            while (line.starts_with(' ')) {
                line.remove_prefix(1);
            }
            auto name = line.substr(0, line.find_first_of(" ("));
            if (is_python_identifier(name)) {
                return name;
            }
            return std::nullopt;
        }
    }
    return std::nullopt;
}

} // namespace

std::string to_string(const Import& im) {
    if (not is_module_path(im.module)) {
        throw ConfigError{concat_tostr("invalid import module \"", im.module, '"')};
    }
    if (im.names.empty()) {
        if (im.alias.empty()) {
            return concat_tostr("import ", im.module);
        }
        return concat_tostr("import ", with_alias(im.module, im.alias));
    }
    if (not im.alias.empty()) {
        throw ConfigError{
            concat_tostr("import of names from ", im.module, " cannot have a module alias")};
    }
    auto res = concat_tostr("from ", im.module, " import ");
    bool first = true;
    for (const auto& [name, alias] : im.names) {
        if (not is_python_identifier(name) and name != "*") {
            throw ConfigError{concat_tostr("invalid imported name \"", name, '"')};
        }
        if (not first) {
            res += ", ";
        }
        first = false;
        res += alias.empty() ? name : with_alias(name, alias);
    }
    return res;
}

std::string function_name(std::string_view source) {
    std::optional<std::string_view> name;
    std::string_view src = source;
    while (not src.empty()) {
        auto eol = src.find('\n');
        auto line = src.substr(0, eol);
        src.remove_prefix(eol == std::string_view::npos ? src.size() : eol + 1);
        // Indented lines belong to the body
        auto found = defined_function(line);
        if (not found) {
            continue;
        }
        if (name) {
            throw ConfigError{concat_tostr(
                "function source has to define exactly one function, found ", *name, " and ",
                *found
            )};
        }
        name = found;
    }
    if (not name) {
        throw ConfigError{"function source does not define a top-level function"};
    }
    return std::string{*name};
}

std::string build_functions_module(const std::vector<FunctionWithRequirements>& functions) {
    std::vector<std::string> imports;
    for (const auto& func : functions) {
        for (const auto& im : func.global_imports) {
            auto line = to_string(im);
            if (std::find(imports.begin(), imports.end(), line) == imports.end()) {
                imports.emplace_back(std::move(line));
            }
        }
    }

    std::string res;
    for (const auto& line : imports) {
        res += line;
        res += '\n';
    }
    res += '\n';
    for (const auto& func : functions) {
        res += func.source;
        res += "\n\n";
    }
    return res;
}

std::vector<std::string> required_packages(const std::vector<FunctionWithRequirements>& functions
) {
    std::vector<std::string> res;
    for (const auto& func : functions) {
        for (const auto& package : func.python_packages) {
            if (std::find(res.begin(), res.end(), package) == res.end()) {
                res.emplace_back(package);
            }
        }
    }
    return res;
}

} // namespace codexec

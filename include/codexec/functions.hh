#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace codexec {

struct ImportedName {
    std::string name;
    std::string alias; // empty if not renamed
};

// A Python import statement:
//   import <module>
//   import <module> as <alias>
//   from <module> import <name> [as <alias>], ...
struct Import {
    std::string module;
    std::string alias;
    std::vector<ImportedName> names;
};

// Throws ConfigError if @p im is malformed
[[nodiscard]] std::string to_string(const Import& im);

// Python function made importable by the executed code, together with what it needs to run
struct FunctionWithRequirements {
    // Source of exactly one top-level function (decorators and comments are allowed)
    std::string source;
    // pip requirement specifiers, e.g. "pandas>=2.0"
    std::vector<std::string> python_packages;
    // Imports the function uses, placed at the top of the functions module
    std::vector<Import> global_imports;
};

// Returns the name of the only top-level function defined in @p source. Throws ConfigError if
// there is none or more than one.
[[nodiscard]] std::string function_name(std::string_view source);

// Contents of the module holding @p functions: the deduplicated global imports followed by the
// function sources. Throws ConfigError.
[[nodiscard]] std::string
build_functions_module(const std::vector<FunctionWithRequirements>& functions);

// Python packages of @p functions without duplicates, in the order of the first occurrence
[[nodiscard]] std::vector<std::string>
required_packages(const std::vector<FunctionWithRequirements>& functions);

[[nodiscard]] bool is_python_identifier(std::string_view str) noexcept;

} // namespace codexec

#include "codexec/concat_tostr.hh"
#include "codexec/config.hh"
#include "codexec/errors.hh"
#include "codexec/file_contents.hh"

#include <cctype>
#include <charconv>
#include <exception>
#include <system_error>
#include <utility>
#include <set>

namespace codexec {

void ExecutorConfig::validate() const {
    if (image.empty()) {
        throw ConfigError{"image cannot be empty"};
    }
    if (timeout < std::chrono::seconds{1}) {
        throw ConfigError{"timeout has to be at least 1 second"};
    }
    for (auto [name, limit] : {
             std::pair{"timeout", timeout},
             std::pair{"stop_timeout", stop_timeout},
             std::pair{"start_timeout", start_timeout},
         })
    {
        if (limit > max_time_limit) {
            throw ConfigError{concat_tostr(
                name, " cannot exceed ", max_time_limit.count(), " seconds"
            )};
        }
    }
    if (stop_timeout < std::chrono::seconds{0}) {
        throw ConfigError{"stop_timeout cannot be negative"};
    }
    if (start_timeout < std::chrono::seconds{1}) {
        throw ConfigError{"start_timeout has to be at least 1 second"};
    }
    if (docker_binary.empty()) {
        throw ConfigError{"docker_binary cannot be empty"};
    }
    for (const auto& volume : extra_volumes) {
        if (volume.find(':') == std::string::npos) {
            throw ConfigError{
                concat_tostr("invalid volume \"", volume, "\": expected host_path:container_path"
                )};
        }
    }
    for (const auto& var : environment) {
        if (var.empty() or var.front() == '=' or var.find('=') == std::string::npos) {
            throw ConfigError{
                concat_tostr("invalid environment variable \"", var, "\": expected NAME=value")};
        }
    }
    if (max_output_size and *max_output_size == 0) {
        throw ConfigError{"max_output_size has to be positive"};
    }
    if (not is_python_identifier(functions_module)) {
        throw ConfigError{concat_tostr(
            "functions_module has to be a python identifier, got \"", functions_module, '"'
        )};
    }
    std::set<std::string> function_names;
    for (const auto& func : functions) {
        auto name = function_name(func.source);
        if (not function_names.emplace(name).second) {
            throw ConfigError{concat_tostr("function ", name, " is defined more than once")};
        }
        for (const auto& im : func.global_imports) {
            (void)to_string(im);
        }
        for (const auto& package : func.python_packages) {
            if (package.empty() or package.find_first_of("\n\r") != std::string::npos) {
                throw ConfigError{concat_tostr("invalid python package \"", package, '"')};
            }
        }
    }
}

namespace {

class ConfigParser {
    std::string_view text_;
    size_t line_no_ = 0;

public:
    explicit ConfigParser(std::string_view text) noexcept : text_{text} {}

    template <class... Args>
    [[noreturn]] void error(const Args&... args) const {
        throw ConfigError{concat_tostr("config line ", line_no_, ": ", args...)};
    }

    static bool is_space(char c) noexcept {
        return std::isspace(static_cast<unsigned char>(c));
    }

    static std::string_view trim(std::string_view str) noexcept {
        while (not str.empty() and is_space(str.front())) {
            str.remove_prefix(1);
        }
        while (not str.empty() and is_space(str.back())) {
            str.remove_suffix(1);
        }
        return str;
    }

    // Parses a single value from the beginning of @p str, advances @p str past it
    std::string parse_scalar(std::string_view& str, bool in_array) const {
        std::string res;
        if (not str.empty() and str.front() == '"') {
            str.remove_prefix(1);
            for (;;) {
                if (str.empty()) {
                    error("unterminated string");
                }
                char c = str.front();
                str.remove_prefix(1);
                if (c == '"') {
                    return res;
                }
                if (c == '\\') {
                    if (str.empty()) {
                        error("unterminated string");
                    }
                    c = str.front();
                    str.remove_prefix(1);
                    switch (c) {
                    case 'n': c = '\n'; break;
                    case 't': c = '\t'; break;
                    case '"':
                    case '\\': break;
                    default: error("invalid escape sequence \\", c);
                    }
                }
                res += c;
            }
        }
        // Unquoted
        auto end = in_array ? str.find_first_of(",]") : str.find('#');
        if (end == std::string_view::npos) {
            end = str.size();
        }
        res = trim(str.substr(0, end));
        str.remove_prefix(end);
        return res;
    }

    std::vector<std::string> parse_array(std::string_view str) const {
        std::vector<std::string> res;
        str.remove_prefix(1); // '['
        str = trim(str);
        if (not str.empty() and str.front() == ']') {
            str.remove_prefix(1);
        } else {
            for (;;) {
                str = trim(str);
                res.emplace_back(parse_scalar(str, true));
                str = trim(str);
                if (str.empty()) {
                    error("unterminated array");
                }
                if (str.front() == ']') {
                    str.remove_prefix(1);
                    break;
                }
                if (str.front() != ',') {
                    error("expected ',' or ']' in array");
                }
                str.remove_prefix(1);
            }
        }
        str = trim(str);
        if (not str.empty() and str.front() != '#') {
            error("unexpected characters after array");
        }
        return res;
    }

    std::string parse_string(std::string_view str) const {
        if (not str.empty() and str.front() == '[') {
            error("expected a single value, not an array");
        }
        auto res = parse_scalar(str, false);
        str = trim(str);
        if (not str.empty() and str.front() != '#') {
            error("unexpected characters after value");
        }
        return res;
    }

    uint64_t parse_uint(std::string_view str) const {
        auto val = parse_string(str);
        uint64_t res{};
        auto [ptr, ec] = std::from_chars(val.data(), val.data() + val.size(), res);
        if (ec != std::errc{} or ptr != val.data() + val.size() or val.empty()) {
            error("expected a non-negative integer, got \"", val, '"');
        }
        return res;
    }

    std::chrono::seconds parse_seconds(std::string_view str) const {
        auto val = parse_uint(str);
        if (val > static_cast<uint64_t>(std::chrono::seconds::max().count())) {
            error("value too large");
        }
        return std::chrono::seconds{static_cast<std::chrono::seconds::rep>(val)};
    }

    bool parse_bool(std::string_view str) const {
        auto val = parse_string(str);
        if (val == "true") {
            return true;
        }
        if (val == "false") {
            return false;
        }
        error("expected true or false, got \"", val, '"');
    }

    void set_option(ExecutorConfig& config, std::string_view name, std::string_view value) const {
        if (name == "image") {
            config.image = parse_string(value);
        } else if (name == "container_name_prefix") {
            config.container_name_prefix = parse_string(value);
        } else if (name == "work_dir") {
            config.work_dir = parse_string(value);
        } else if (name == "bind_dir") {
            config.bind_dir = parse_string(value);
        } else if (name == "timeout") {
            config.timeout = parse_seconds(value);
        } else if (name == "extra_volumes") {
            config.extra_volumes = parse_list(value);
        } else if (name == "extra_hosts") {
            config.extra_hosts = parse_list(value);
        } else if (name == "environment") {
            config.environment = parse_list(value);
        } else if (name == "init_command") {
            config.init_command = parse_string(value);
        } else if (name == "auto_remove") {
            config.auto_remove = parse_bool(value);
        } else if (name == "keep_staged_files") {
            config.keep_staged_files = parse_bool(value);
        } else if (name == "max_output_size") {
            config.max_output_size = parse_uint(value);
        } else if (name == "stop_timeout") {
            config.stop_timeout = parse_seconds(value);
        } else if (name == "start_timeout") {
            config.start_timeout = parse_seconds(value);
        } else if (name == "docker_binary") {
            config.docker_binary = parse_string(value);
        } else if (name == "functions_module") {
            config.functions_module = parse_string(value);
        } else {
            error("unknown option \"", name, '"');
        }
    }

    std::vector<std::string> parse_list(std::string_view str) const {
        if (str.empty() or str.front() != '[') {
            error("expected an array");
        }
        return parse_array(str);
    }

    ExecutorConfig parse() {
        ExecutorConfig config;
        std::set<std::string, std::less<>> seen;
        while (not text_.empty()) {
            ++line_no_;
            auto eol = text_.find('\n');
            auto line = trim(text_.substr(0, eol));
            text_.remove_prefix(eol == std::string_view::npos ? text_.size() : eol + 1);
            if (line.empty() or line.front() == '#') {
                continue;
            }
            auto colon = line.find(':');
            if (colon == std::string_view::npos) {
                error("expected \"name: value\"");
            }
            auto name = trim(line.substr(0, colon));
            if (name.empty()) {
                error("missing option name");
            }
            if (not seen.emplace(name).second) {
                error("option \"", name, "\" is set more than once");
            }
            set_option(config, name, trim(line.substr(colon + 1)));
        }
        config.validate();
        return config;
    }
};

} // namespace

ExecutorConfig parse_config(std::string_view text) { return ConfigParser{text}.parse(); }

ExecutorConfig load_config(const std::string& path) {
    std::string contents;
    try {
        contents = get_file_contents(path);
    } catch (const std::exception& e) {
        throw ConfigError{concat_tostr("cannot read config file ", path, ": ", e.what())};
    }
    return parse_config(contents);
}

} // namespace codexec

#pragma once

#include "codexec/concat_tostr.hh"

#include <cstdio>
#include <mutex>
#include <string_view>

namespace codexec {

// Thread-safe line logger; every line is labelled with the local time and the pid
class Logger {
    std::mutex mtx_;
    FILE* stream_;
    bool label_ = true;

public:
    // Does not take ownership of @p stream
    explicit Logger(FILE* stream) noexcept : stream_{stream} {}

    Logger(const Logger&) = delete;
    Logger(Logger&&) = delete;
    Logger& operator=(const Logger&) = delete;
    Logger& operator=(Logger&&) = delete;
    ~Logger() = default;

    // Does not take ownership of @p stream; nullptr disables logging
    void use(FILE* stream) noexcept;

    void label(bool enabled) noexcept;

    template <class... Args>
    void operator()(const Args&... args) {
        write_line(concat_tostr(args...));
    }

    void write_line(std::string_view line) noexcept;
};

// Standard log: informational messages
extern Logger stdlog; // NOLINT(cppcoreguidelines-avoid-non-const-global-variables)
// Error log: failures that were handled but should not go unnoticed
extern Logger errlog; // NOLINT(cppcoreguidelines-avoid-non-const-global-variables)

// Logs to stdlog only if enabled at compile time
template <bool enabled, bool verbose_enabled = false>
class DebugLogger {
public:
    template <class... Args>
    void operator()(const Args&... args) const {
        if constexpr (enabled) {
            stdlog(args...);
        }
    }

    template <class... Args>
    void verbose(const Args&... args) const {
        if constexpr (enabled and verbose_enabled) {
            stdlog(args...);
        }
    }
};

} // namespace codexec

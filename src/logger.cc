#include "codexec/logger.hh"

#include <chrono>
#include <ctime>
#include <unistd.h>

namespace codexec {

Logger stdlog{stderr}; // NOLINT(cppcoreguidelines-avoid-non-const-global-variables)
Logger errlog{stderr}; // NOLINT(cppcoreguidelines-avoid-non-const-global-variables)

void Logger::use(FILE* stream) noexcept {
    std::lock_guard lock{mtx_};
    if (stream_) {
        (void)fflush(stream_);
    }
    stream_ = stream;
}

void Logger::label(bool enabled) noexcept {
    std::lock_guard lock{mtx_};
    label_ = enabled;
}

void Logger::write_line(std::string_view line) noexcept {
    std::lock_guard lock{mtx_};
    if (not stream_) {
        return;
    }
    if (label_) {
        using std::chrono::system_clock;
        auto now = system_clock::now();
        auto secs = system_clock::to_time_t(now);
        auto millis =
            std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) %
            1000;
        tm local{};
        char date[32] = "????-??-?? ??:??:??";
        if (localtime_r(&secs, &local)) {
            (void)strftime(date, sizeof(date), "%Y-%m-%d %H:%M:%S", &local);
        }
        (void)fprintf(
            stream_, "[ %s.%03lld %d ] ", date, static_cast<long long>(millis.count()), getpid()
        );
    }
    (void)fwrite(line.data(), 1, line.size(), stream_);
    (void)fputc('\n', stream_);
    (void)fflush(stream_);
}

} // namespace codexec

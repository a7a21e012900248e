#pragma once

#include <cstdint>
#include <string>

namespace codexec {

// Uninitialized --> Starting --> Running --> Stopping --> Stopped
enum class EnvironmentStatus : uint8_t {
    Uninitialized,
    Starting,
    Running,
    Stopping,
    Stopped,
};

[[nodiscard]] constexpr const char* to_string(EnvironmentStatus status) noexcept {
    switch (status) {
    case EnvironmentStatus::Uninitialized: return "uninitialized";
    case EnvironmentStatus::Starting: return "starting";
    case EnvironmentStatus::Running: return "running";
    case EnvironmentStatus::Stopping: return "stopping";
    case EnvironmentStatus::Stopped: return "stopped";
    }
    return "unknown";
}

// Isolated runtime instance and the directory where code is staged
struct EnvironmentHandle {
    std::string id; // provider-assigned, empty until the environment is created
    std::string name; // chosen before creation, allows to clean up a half-created environment
    std::string work_dir; // absolute host path
    EnvironmentStatus status = EnvironmentStatus::Uninitialized;
};

} // namespace codexec

#pragma once

#include <unistd.h>
#include <utility>

namespace codexec {

// Owning wrapper of a file descriptor
class FileDescriptor {
    int fd_ = -1;

public:
    FileDescriptor() noexcept = default;

    explicit FileDescriptor(int fd) noexcept : fd_{fd} {}

    FileDescriptor(const FileDescriptor&) = delete;

    FileDescriptor(FileDescriptor&& other) noexcept : fd_{std::exchange(other.fd_, -1)} {}

    FileDescriptor& operator=(const FileDescriptor&) = delete;

    FileDescriptor& operator=(FileDescriptor&& other) noexcept {
        if (this != &other) {
            (void)close();
            fd_ = std::exchange(other.fd_, -1);
        }
        return *this;
    }

    FileDescriptor& operator=(int fd) noexcept {
        (void)close();
        fd_ = fd;
        return *this;
    }

    ~FileDescriptor() { (void)close(); }

    [[nodiscard]] bool is_open() const noexcept { return fd_ >= 0; }

    // NOLINTNEXTLINE(google-explicit-constructor)
    operator int() const noexcept { return fd_; }

    int release() noexcept { return std::exchange(fd_, -1); }

    // Returns 0 on success, -1 on error (errno is set then); closing a closed descriptor is
    // not an error
    int close() noexcept {
        if (fd_ < 0) {
            return 0;
        }
        return ::close(std::exchange(fd_, -1));
    }
};

} // namespace codexec

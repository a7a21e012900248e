#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <sys/types.h>

namespace codexec {

// Writes all @p len bytes unless an error occurs; returns the number of bytes written, errno
// is set on error
size_t write_all(int fd, const void* buff, size_t len) noexcept;

inline size_t write_all(int fd, std::string_view str) noexcept {
    return write_all(fd, str.data(), str.size());
}

// Reads until EOF or an error; returns the number of bytes read, errno is set on error
size_t pread_all(int fd, off_t pos, void* buff, size_t len) noexcept;

// Throws on error
std::string get_file_contents(const std::string& path);

// Creates or truncates the file; throws on error
void put_file_contents(const std::string& path, std::string_view contents);

} // namespace codexec

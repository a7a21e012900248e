#include "codexec/errmsg.hh"
#include "codexec/file_contents.hh"
#include "codexec/file_descriptor.hh"
#include "codexec/macros/throw.hh"

#include <cerrno>
#include <fcntl.h>
#include <unistd.h>

namespace codexec {

size_t write_all(int fd, const void* buff, size_t len) noexcept {
    const auto* data = static_cast<const char*>(buff);
    size_t pos = 0;
    errno = 0;
    while (pos < len) {
        auto rc = write(fd, data + pos, len - pos);
        if (rc == -1) {
            if (errno == EINTR) {
                continue;
            }
            break;
        }
        if (rc == 0) {
            break;
        }
        pos += static_cast<size_t>(rc);
    }
    return pos;
}

size_t pread_all(int fd, off_t pos, void* buff, size_t len) noexcept {
    auto* data = static_cast<char*>(buff);
    size_t done = 0;
    errno = 0;
    while (done < len) {
        auto rc = pread(fd, data + done, len - done, pos + static_cast<off_t>(done));
        if (rc == -1) {
            if (errno == EINTR) {
                continue;
            }
            break;
        }
        if (rc == 0) {
            break;
        }
        done += static_cast<size_t>(rc);
    }
    return done;
}

std::string get_file_contents(const std::string& path) {
    FileDescriptor fd{open(path.c_str(), O_RDONLY | O_CLOEXEC)};
    if (not fd.is_open()) {
        THROW("open(", path, ")", errmsg());
    }
    std::string res;
    char buff[1 << 14];
    for (;;) {
        auto rc = read(fd, buff, sizeof(buff));
        if (rc == -1) {
            if (errno == EINTR) {
                continue;
            }
            THROW("read(", path, ")", errmsg());
        }
        if (rc == 0) {
            return res;
        }
        res.append(buff, static_cast<size_t>(rc));
    }
}

void put_file_contents(const std::string& path, std::string_view contents) {
    FileDescriptor fd{open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644)};
    if (not fd.is_open()) {
        THROW("open(", path, ")", errmsg());
    }
    if (write_all(fd, contents) != contents.size()) {
        THROW("write(", path, ")", errmsg());
    }
    if (fd.close()) {
        THROW("close(", path, ")", errmsg());
    }
}

} // namespace codexec

#pragma once

#include <string>

namespace codexec {

// Creates a directory from the mkdtemp() template and removes it recursively on destruction
class TemporaryDirectory {
    std::string path_;

public:
    TemporaryDirectory() noexcept = default;

    // @p templ has to end with "XXXXXX", throws on error
    explicit TemporaryDirectory(std::string templ);

    TemporaryDirectory(const TemporaryDirectory&) = delete;
    TemporaryDirectory(TemporaryDirectory&& other) noexcept;
    TemporaryDirectory& operator=(const TemporaryDirectory&) = delete;
    TemporaryDirectory& operator=(TemporaryDirectory&& other) noexcept;

    ~TemporaryDirectory();

    [[nodiscard]] bool exists() const noexcept { return not path_.empty(); }

    // Absolute path without the trailing '/'
    [[nodiscard]] const std::string& path() const noexcept { return path_; }

    // Removes the directory now; errors are logged
    void remove() noexcept;
};

} // namespace codexec

#include "codexec/errmsg.hh"
#include "codexec/logger.hh"
#include "codexec/macros/throw.hh"
#include "codexec/temporary_directory.hh"

#include <cstdlib>
#include <filesystem>
#include <system_error>
#include <utility>

namespace codexec {

TemporaryDirectory::TemporaryDirectory(std::string templ) {
    if (mkdtemp(templ.data()) == nullptr) {
        THROW("mkdtemp(", templ, ")", errmsg());
    }
    std::error_code ec;
    auto abs = std::filesystem::absolute(templ, ec);
    path_ = ec ? std::move(templ) : abs.string();
}

TemporaryDirectory::TemporaryDirectory(TemporaryDirectory&& other) noexcept
: path_{std::exchange(other.path_, {})} {}

TemporaryDirectory& TemporaryDirectory::operator=(TemporaryDirectory&& other) noexcept {
    if (this != &other) {
        remove();
        path_ = std::exchange(other.path_, {});
    }
    return *this;
}

TemporaryDirectory::~TemporaryDirectory() { remove(); }

void TemporaryDirectory::remove() noexcept {
    if (path_.empty()) {
        return;
    }
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
    if (ec) {
        errlog("failed to remove temporary directory ", path_, ": ", ec.message());
    }
    path_.clear();
}

} // namespace codexec

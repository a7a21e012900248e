#pragma once

#include <cstddef>
#include <string>

namespace codexec {

// Returns a string of @p len random lowercase hexadecimal digits
std::string random_hex(size_t len);

} // namespace codexec

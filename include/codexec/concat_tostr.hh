#pragma once

#include <string>
#include <string_view>
#include <type_traits>

namespace codexec {

namespace detail {

template <class T>
void append_tostr(std::string& str, const T& val) {
    if constexpr (std::is_same_v<T, char>) {
        str += val;
    } else if constexpr (std::is_same_v<T, bool>) {
        str += val ? "true" : "false";
    } else if constexpr (std::is_arithmetic_v<T>) {
        str += std::to_string(val);
    } else {
        str += std::string_view{val};
    }
}

} // namespace detail

// Concatenates textual representations of @p args
template <class... Args>
std::string concat_tostr(const Args&... args) {
    std::string res;
    (detail::append_tostr(res, args), ...);
    return res;
}

} // namespace codexec

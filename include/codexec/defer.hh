#pragma once

#include <type_traits>
#include <utility>

namespace codexec {

// Calls the function on scope exit
template <class Func>
class Defer {
    Func func_;

public:
    explicit Defer(Func func) noexcept(std::is_nothrow_move_constructible_v<Func>)
    : func_{std::move(func)} {}

    Defer(const Defer&) = delete;
    Defer(Defer&&) = delete;
    Defer& operator=(const Defer&) = delete;
    Defer& operator=(Defer&&) = delete;

    ~Defer() { func_(); }
};

} // namespace codexec

#pragma once

#include "codexec/concat_tostr.hh"

#include <stdexcept>

// Throws std::runtime_error with message made of concatenated arguments and the throw location
#define THROW(...)                                                                             \
    throw std::runtime_error(::codexec::concat_tostr(                                          \
        __VA_ARGS__, " (thrown at " __FILE__ ":", __LINE__, ')'                                \
    ))

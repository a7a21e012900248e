#pragma once

#include <stdexcept>

namespace codexec {

// Base of the errors reported by the executor; failures of user code are never reported this
// way, they are encoded in the execution result
class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Operation is not valid in the current lifecycle state of the executor
class InvalidStateError : public Error {
public:
    using Error::Error;
};

// The isolated runtime could not be brought up
class EnvironmentStartError : public Error {
public:
    using Error::Error;
};

class UnsupportedLanguageError : public Error {
public:
    using Error::Error;
};

// Execution requested while another one is in progress on the same executor
class ConcurrentExecutionError : public Error {
public:
    using Error::Error;
};

// A filename directive points outside of the working directory
class FilenameOutsideWorkspaceError : public Error {
public:
    using Error::Error;
};

class ConfigError : public Error {
public:
    using Error::Error;
};

} // namespace codexec

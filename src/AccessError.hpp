#pragma once
#include <stdexcept>
#include <string>

enum class ErrorKind {
    InvalidPath,
    NotFound,
    NotAllowed,
    FileTooLarge,
    ExtensionNotAllowed,
    IOError,
    NotConfigured
};

// Stable name used in tool results ("NotAllowed", "FileTooLarge", ...)
const char* errorKindName(ErrorKind kind);

class AccessError : public std::runtime_error {
public:
    AccessError(ErrorKind kind, const std::string& message);

    ErrorKind kind() const { return kind_; }

    static AccessError accessDenied();

private:
    ErrorKind kind_;
};

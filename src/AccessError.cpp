#include "AccessError.hpp"

const char* errorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::InvalidPath: return "InvalidPath";
        case ErrorKind::NotFound: return "NotFound";
        case ErrorKind::NotAllowed: return "NotAllowed";
        case ErrorKind::FileTooLarge: return "FileTooLarge";
        case ErrorKind::ExtensionNotAllowed: return "ExtensionNotAllowed";
        case ErrorKind::IOError: return "IOError";
        case ErrorKind::NotConfigured: return "NotConfigured";
    }
    return "IOError";
}

AccessError::AccessError(ErrorKind kind, const std::string& message)
    : std::runtime_error(message), kind_(kind) {}

// Same text for every rejected path, whether or not it exists
AccessError AccessError::accessDenied() {
    return AccessError(ErrorKind::NotAllowed, "Access denied: path is outside the allowed directories");
}

#pragma once

#include <ostream>
#include <stdexcept>
#include <string>

namespace wami {

enum class ErrorKind {
    InvalidFormat,
    MissingComponent,
    InvalidComponent,
    InvalidParameter,
    ResourceNotFound,
    ResourceExists,
    AccessDenied,
    StoreError,
};

/// Human-readable label used as the prefix of Error::what().
const char* error_kind_label(ErrorKind kind);

inline std::ostream& operator<<(std::ostream& os, ErrorKind k) {
    return os << error_kind_label(k);
}

/**
 * Error
 *
 * Base exception for the library. Carries a kind that callers switch on,
 * and the bare message without the kind prefix.
 */
class Error : public std::runtime_error {
public:
    Error(ErrorKind kind, const std::string& message);

    ErrorKind kind() const noexcept { return kind_; }
    const std::string& message() const noexcept { return message_; }

private:
    ErrorKind   kind_;
    std::string message_;
};

class AccessDeniedError : public Error {
public:
    AccessDeniedError(std::string caller, std::string action, std::string resource);

    const std::string& caller() const noexcept { return caller_; }
    const std::string& action() const noexcept { return action_; }
    const std::string& resource() const noexcept { return resource_; }

private:
    std::string caller_;
    std::string action_;
    std::string resource_;
};

} // namespace wami

#include "wami/error.hpp"

#include <utility>

namespace wami {

const char* error_kind_label(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::InvalidFormat:    return "Invalid ARN format";
        case ErrorKind::MissingComponent: return "Missing ARN component";
        case ErrorKind::InvalidComponent: return "Invalid ARN component";
        case ErrorKind::InvalidParameter: return "Invalid parameter";
        case ErrorKind::ResourceNotFound: return "Resource not found";
        case ErrorKind::ResourceExists:   return "Resource already exists";
        case ErrorKind::AccessDenied:     return "Access denied";
        case ErrorKind::StoreError:       return "Store error";
        default:                          return "Unknown error";
    }
}

Error::Error(ErrorKind kind, const std::string& message)
    : std::runtime_error(std::string(error_kind_label(kind)) + ": " + message),
      kind_(kind),
      message_(message) {}

AccessDeniedError::AccessDeniedError(std::string caller, std::string action, std::string resource)
    : Error(ErrorKind::AccessDenied,
            "User " + caller + " is not authorized to perform " + action + " on " + resource),
      caller_(std::move(caller)),
      action_(std::move(action)),
      resource_(std::move(resource)) {}

} // namespace wami

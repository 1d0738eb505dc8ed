#include "metacache/meta/errors.hpp"

namespace metacache::meta {

ProtocolError::ProtocolError(Status status, const std::string& message)
    : Error(message), status_(status) {}

ConflictError::ConflictError(const std::string& message)
    : ProtocolError(Status::Exists, message) {}

ProtocolError to_error(Status status, const std::string& detail) {
    std::string message = "unexpected status " + std::string(status_to_string(status));
    if (!detail.empty()) {
        message += ": " + detail;
    }
    return ProtocolError(status, message);
}

bool should_close_connection(Status status) noexcept {
    return status == Status::Error || status == Status::ClientError;
}

}  // namespace metacache::meta

#pragma once

#include <stdexcept>
#include <string>

namespace errors {

enum class ErrorKind {
    VALIDATION,
    CONNECT,
    STREAM,
    CANCELLED
};

// Message delivered to on_error when a transfer observes its cancel flag
constexpr const char* CANCELLED_MESSAGE = "cancelled";

const char* to_string(ErrorKind kind);

// Builds the observer message for a failure of the given kind,
// e.g. "connect failed: Connection refused"
std::string format_message(ErrorKind kind, const std::string& reason);

bool is_cancellation(const std::string& message);

class TransferError : public std::runtime_error {
public:
    TransferError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

// Thrown synchronously for malformed packets and transfer arguments.
class ValidationError : public TransferError {
public:
    explicit ValidationError(const std::string& message)
        : TransferError(ErrorKind::VALIDATION, message) {}
};

} // namespace errors

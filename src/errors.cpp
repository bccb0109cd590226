#include "errors.hpp"

namespace errors {

const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::VALIDATION: return "validation error";
        case ErrorKind::CONNECT:    return "connect failed";
        case ErrorKind::STREAM:     return "stream error";
        case ErrorKind::CANCELLED:  return CANCELLED_MESSAGE;
    }
    return "unknown error";
}

std::string format_message(ErrorKind kind, const std::string& reason) {
    if (kind == ErrorKind::CANCELLED) {
        return CANCELLED_MESSAGE;
    }
    if (reason.empty()) {
        return to_string(kind);
    }
    return std::string(to_string(kind)) + ": " + reason;
}

bool is_cancellation(const std::string& message) {
    return message == CANCELLED_MESSAGE;
}

} // namespace errors

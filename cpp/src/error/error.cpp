// ==============================================================================
// error.cpp - Таксономия ошибок
// ==============================================================================

#include "bridge/error.hpp"

namespace bridge {

const char* error_kind_to_code(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::NotFound:
        return "NOT_FOUND";
    case ErrorKind::ParseFailed:
        return "PARSE_FAILED";
    case ErrorKind::InvalidHandoff:
        return "INVALID_HANDOFF";
    case ErrorKind::UnsupportedAgent:
        return "UNSUPPORTED_AGENT";
    case ErrorKind::UnsupportedMode:
        return "UNSUPPORTED_MODE";
    case ErrorKind::IoError:
        return "IO_ERROR";
    case ErrorKind::EmptySession:
        return "EMPTY_SESSION";
    }
    return "IO_ERROR";
}

std::string BridgeError::format() const {
    std::string result = error_kind_to_code(kind);
    result += ": ";
    result += message;
    return result;
}

}  // namespace bridge

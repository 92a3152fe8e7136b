#pragma once

#include <string>

namespace upsync {

/**
 * @brief Failure taxonomy shared by every layer
 *
 * Format, Config and Auth stop the whole operation and need an operator.
 * Server stops forward progress but keeps confirmed work.
 * Validation only affects the batch that caused it.
 * Cancelled is a user pause, not a failure.
 */
enum class ErrorKind {
    Format,
    Config,
    Auth,
    Server,
    Validation,
    Cancelled,
    Io,
    State,
    Protocol
};

struct Error {
    ErrorKind kind = ErrorKind::State;
    std::string message;

    Error() = default;
    Error(ErrorKind k, std::string msg) : kind(k), message(std::move(msg)) {}

    /// True for kinds that need external action before anything can continue
    [[nodiscard]] bool is_fatal() const noexcept {
        return kind == ErrorKind::Format || kind == ErrorKind::Config || kind == ErrorKind::Auth;
    }
};

inline const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Format: return "FormatError";
        case ErrorKind::Config: return "ConfigError";
        case ErrorKind::Auth: return "AuthError";
        case ErrorKind::Server: return "ServerError";
        case ErrorKind::Validation: return "ValidationError";
        case ErrorKind::Cancelled: return "CancelledError";
        case ErrorKind::Io: return "IoError";
        case ErrorKind::State: return "StateError";
        case ErrorKind::Protocol: return "ProtocolError";
    }
    return "UnknownError";
}

inline std::string describe(const Error& error) {
    return std::string(error_kind_name(error.kind)) + ": " + error.message;
}

} // namespace upsync

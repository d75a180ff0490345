#pragma once
#include <chrono>
#include <stdexcept>
#include <string>

enum class ErrorKind {
    InvalidInput,
    NotFound,
    Process,
    StartupTimeout,
    Protocol,
    Io
};

/**
 * @brief Typed failure raised by every supervisor operation.
 *
 * what() is the human-readable message handed to the UI layer; kind()
 * lets callers tell a slow server (StartupTimeout) from a broken one.
 */
class SupervisorError : public std::runtime_error {
public:
    SupervisorError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), errorKind(kind) {}

    ErrorKind kind() const noexcept { return errorKind; }

    static SupervisorError invalidInput(const std::string& detail) {
        return SupervisorError(ErrorKind::InvalidInput, "Invalid input: " + detail);
    }
    static SupervisorError notFound(const std::string& detail) {
        return SupervisorError(ErrorKind::NotFound, "Not found: " + detail);
    }
    static SupervisorError process(const std::string& detail) {
        return SupervisorError(ErrorKind::Process, "Process error: " + detail);
    }
    static SupervisorError protocol(const std::string& detail) {
        return SupervisorError(ErrorKind::Protocol, detail);
    }
    static SupervisorError io(const std::string& detail) {
        return SupervisorError(ErrorKind::Io, "IO error: " + detail);
    }
    static SupervisorError startupTimeout(std::chrono::milliseconds timeout) {
        auto ms = timeout.count();
        std::string amount = (ms % 1000 == 0)
            ? std::to_string(ms / 1000) + " seconds"
            : std::to_string(ms) + " milliseconds";
        return SupervisorError(ErrorKind::StartupTimeout, "Server startup timed out after " + amount);
    }

private:
    ErrorKind errorKind;
};

inline const char* errorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::InvalidInput: return "InvalidInput";
        case ErrorKind::NotFound: return "NotFound";
        case ErrorKind::Process: return "Process";
        case ErrorKind::StartupTimeout: return "StartupTimeout";
        case ErrorKind::Protocol: return "Protocol";
        case ErrorKind::Io: return "Io";
    }
    return "Unknown";
}

#pragma once

#include <optional>
#include <stdexcept>
#include <string>

namespace vibium {

/**
 * @brief Machine-readable category of every error surfaced to callers
 *
 * Each category maps to one exception type below. Callers can branch on
 * kind() instead of catching each type separately.
 */
enum class ErrorKind {
    RESOLUTION,         // clicker binary not found
    START_TIMEOUT,      // subprocess never announced its endpoint
    PROCESS_CRASHED,    // subprocess exited unexpectedly
    CONNECTION,         // transport could not be established or dropped
    CONNECTION_CLOSED,  // transport-level send after close
    TIMEOUT,            // single command deadline elapsed
    PROTOCOL,           // remote reported an error response
    CLOSED              // operation after deliberate close()
};

/**
 * @brief Convert ErrorKind to string representation
 */
std::string error_kind_to_string(ErrorKind kind);

/**
 * @brief Base class for all runtime errors
 */
class VibiumError : public std::runtime_error {
public:
    VibiumError(ErrorKind kind, const std::string &message) : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

class ResolutionError : public VibiumError {
public:
    ResolutionError(const std::string &path, const std::string &message, const std::string &remediation = "");

    // Path that failed the check; empty when the whole search came up empty
    const std::string &path() const { return path_; }
    const std::string &remediation() const { return remediation_; }

private:
    std::string path_;
    std::string remediation_;
};

class StartTimeoutError : public VibiumError {
public:
    explicit StartTimeoutError(int timeout_ms);

    int timeout_ms() const { return timeout_ms_; }

private:
    int timeout_ms_;
};

class ProcessCrashedError : public VibiumError {
public:
    ProcessCrashedError(int exit_code, const std::string &output);

    int exit_code() const { return exit_code_; }
    const std::string &output() const { return output_; }

private:
    int exit_code_;
    std::string output_;
};

class ConnectionError : public VibiumError {
public:
    ConnectionError(const std::string &url, const std::string &cause);

    const std::string &url() const { return url_; }
    const std::string &cause() const { return cause_; }

private:
    std::string url_;
    std::string cause_;
};

class ConnectionClosedError : public VibiumError {
public:
    ConnectionClosedError() : VibiumError(ErrorKind::CONNECTION_CLOSED, "Connection closed") {}
};

class TimeoutError : public VibiumError {
public:
    TimeoutError(const std::string &method, int timeout_ms, const std::string &reason = "");

    const std::string &method() const { return method_; }
    int timeout_ms() const { return timeout_ms_; }
    const std::string &reason() const { return reason_; }

private:
    std::string method_;
    int timeout_ms_;
    std::string reason_;
};

class ProtocolError : public VibiumError {
public:
    ProtocolError(const std::string &code, const std::string &message, std::optional<std::string> trace = std::nullopt);

    const std::string &code() const { return code_; }
    const std::string &remote_message() const { return remote_message_; }
    const std::optional<std::string> &trace() const { return trace_; }

private:
    std::string code_;
    std::string remote_message_;
    std::optional<std::string> trace_;
};

class ClosedError : public VibiumError {
public:
    explicit ClosedError(const std::string &reason = "Connection closed")
        : VibiumError(ErrorKind::CLOSED, reason), reason_(reason) {}

    const std::string &reason() const { return reason_; }

private:
    std::string reason_;
};

}  // namespace vibium

#include "errors.hpp"

namespace vibium {

std::string error_kind_to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::RESOLUTION:
            return "RESOLUTION";
        case ErrorKind::START_TIMEOUT:
            return "START_TIMEOUT";
        case ErrorKind::PROCESS_CRASHED:
            return "PROCESS_CRASHED";
        case ErrorKind::CONNECTION:
            return "CONNECTION";
        case ErrorKind::CONNECTION_CLOSED:
            return "CONNECTION_CLOSED";
        case ErrorKind::TIMEOUT:
            return "TIMEOUT";
        case ErrorKind::PROTOCOL:
            return "PROTOCOL";
        case ErrorKind::CLOSED:
            return "CLOSED";
    }
    return "UNKNOWN";
}

namespace {

std::string with_remediation(const std::string &message, const std::string &remediation) {
    if (remediation.empty()) {
        return message;
    }
    return message + "\n" + remediation;
}

std::string format_crash(int exit_code, const std::string &output) {
    std::string msg = "Clicker process exited with code " + std::to_string(exit_code);
    if (!output.empty()) {
        msg += ": " + output;
    }
    return msg;
}

std::string format_timeout(const std::string &method, int timeout_ms, const std::string &reason) {
    std::string msg = "Timeout after " + std::to_string(timeout_ms) + "ms waiting for '" + method + "'";
    if (!reason.empty()) {
        msg += ": " + reason;
    }
    return msg;
}

}  // namespace

ResolutionError::ResolutionError(const std::string &path, const std::string &message, const std::string &remediation)
    : VibiumError(ErrorKind::RESOLUTION, with_remediation(message, remediation)),
      path_(path),
      remediation_(remediation) {}

StartTimeoutError::StartTimeoutError(int timeout_ms)
    : VibiumError(ErrorKind::START_TIMEOUT,
                  format_timeout("clicker", timeout_ms, "waiting for clicker to announce its port")),
      timeout_ms_(timeout_ms) {}

ProcessCrashedError::ProcessCrashedError(int exit_code, const std::string &output)
    : VibiumError(ErrorKind::PROCESS_CRASHED, format_crash(exit_code, output)), exit_code_(exit_code), output_(output) {}

ConnectionError::ConnectionError(const std::string &url, const std::string &cause)
    : VibiumError(ErrorKind::CONNECTION, "Failed to connect to " + url + (cause.empty() ? "" : ": " + cause)),
      url_(url),
      cause_(cause) {}

TimeoutError::TimeoutError(const std::string &method, int timeout_ms, const std::string &reason)
    : VibiumError(ErrorKind::TIMEOUT, format_timeout(method, timeout_ms, reason)),
      method_(method),
      timeout_ms_(timeout_ms),
      reason_(reason) {}

ProtocolError::ProtocolError(const std::string &code, const std::string &message, std::optional<std::string> trace)
    : VibiumError(ErrorKind::PROTOCOL, code + ": " + message),
      code_(code),
      remote_message_(message),
      trace_(std::move(trace)) {}

}  // namespace vibium

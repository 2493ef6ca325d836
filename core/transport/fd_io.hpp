#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <string>

namespace vibium {
namespace transport {

// Poll slice used by readers so a stop request is noticed promptly
constexpr int kReadPollMs = 100;

enum class IoStatus { OK, TIMEOUT, CLOSED, ERROR };

// Wait for fd to become readable. TIMEOUT if nothing arrived within timeout_ms.
IoStatus wait_readable(int fd, int timeout_ms, std::string &error);

// Read exactly n bytes, polling in kReadPollMs slices until stop is set.
// CLOSED on EOF or when stop was requested mid-read.
IoStatus read_exact(int fd, uint8_t *buf, size_t n, const std::atomic<bool> &stop, std::string &error);

// Write exactly n bytes (handles partial writes, EINTR). A vanished peer is
// an error rather than SIGPIPE: sockets are written with MSG_NOSIGNAL, other
// descriptors with SIGPIPE blocked on the calling thread.
bool write_exact(int fd, const uint8_t *buf, size_t n, std::string &error);

}  // namespace transport
}  // namespace vibium

#include "fd_io.hpp"

#include <errno.h>
#include <poll.h>
#include <pthread.h>
#include <signal.h>
#include <sys/socket.h>
#include <time.h>
#include <unistd.h>

#include <chrono>
#include <cstring>
#include <thread>

namespace vibium {
namespace transport {

namespace {

// Blocks SIGPIPE on the calling thread for the lifetime of the object.
// Pipes have no MSG_NOSIGNAL; a write to a pipe without a reader would
// otherwise kill the process. A SIGPIPE raised while blocked is consumed
// before the old mask is restored.
class ScopedSigpipeBlock {
public:
    ScopedSigpipeBlock() {
        sigemptyset(&sigpipe_);
        sigaddset(&sigpipe_, SIGPIPE);

        // Already pending: it belongs to someone else, leave it alone
        sigset_t pending;
        sigemptyset(&pending);
        if (sigpending(&pending) == 0 && sigismember(&pending, SIGPIPE) == 1) {
            return;
        }
        blocked_ = pthread_sigmask(SIG_BLOCK, &sigpipe_, &old_mask_) == 0;
    }

    ~ScopedSigpipeBlock() {
        if (!blocked_) {
            return;
        }
        if (raised_) {
            struct timespec zero = {0, 0};
            int saved_errno = errno;
            while (sigtimedwait(&sigpipe_, nullptr, &zero) == -1 && errno == EINTR) {
            }
            errno = saved_errno;
        }
        pthread_sigmask(SIG_SETMASK, &old_mask_, nullptr);
    }

    ScopedSigpipeBlock(const ScopedSigpipeBlock &) = delete;
    ScopedSigpipeBlock &operator=(const ScopedSigpipeBlock &) = delete;

    void mark_raised() { raised_ = true; }

private:
    sigset_t sigpipe_;
    sigset_t old_mask_;
    bool blocked_ = false;
    bool raised_ = false;
};

}  // namespace

IoStatus wait_readable(int fd, int timeout_ms, std::string &error) {
    if (fd < 0) {
        error = "Invalid descriptor";
        return IoStatus::ERROR;
    }

    struct pollfd pfd;
    pfd.fd = fd;
    pfd.events = POLLIN;
    pfd.revents = 0;
    int result = poll(&pfd, 1, timeout_ms);
    if (result < 0) {
        if (errno == EINTR) {
            return IoStatus::TIMEOUT;
        }
        error = "poll failed: " + std::string(strerror(errno));
        return IoStatus::ERROR;
    }
    if (result == 0) {
        return IoStatus::TIMEOUT;
    }

    // POLLHUP with buffered data still reports POLLIN; let read() see EOF
    if ((pfd.revents & (POLLIN | POLLHUP)) != 0) {
        return IoStatus::OK;
    }
    error = "poll error on descriptor";
    return IoStatus::ERROR;
}

IoStatus read_exact(int fd, uint8_t *buf, size_t n, const std::atomic<bool> &stop, std::string &error) {
    size_t total = 0;
    while (total < n) {
        if (stop.load(std::memory_order_acquire)) {
            return IoStatus::CLOSED;
        }

        IoStatus ready = wait_readable(fd, kReadPollMs, error);
        if (ready == IoStatus::TIMEOUT) {
            continue;
        }
        if (ready != IoStatus::OK) {
            return ready;
        }

        ssize_t r = ::read(fd, buf + total, n - total);
        if (r < 0) {
            if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) {
                continue;
            }
            if (errno == ECONNRESET) {
                error = "Connection reset by peer";
                return IoStatus::CLOSED;
            }
            error = "Read failed: " + std::string(strerror(errno));
            return IoStatus::ERROR;
        }
        if (r == 0) {
            return IoStatus::CLOSED;
        }
        total += static_cast<size_t>(r);
    }
    return IoStatus::OK;
}

bool write_exact(int fd, const uint8_t *buf, size_t n, std::string &error) {
    if (fd < 0) {
        error = "Invalid descriptor";
        return false;
    }

    bool is_socket = true;
    size_t total = 0;
    while (total < n) {
        ssize_t w;
        if (is_socket) {
            w = ::send(fd, buf + total, n - total, MSG_NOSIGNAL);
            if (w < 0 && errno == ENOTSOCK) {
                is_socket = false;
                continue;
            }
        } else {
            ScopedSigpipeBlock sigpipe_block;
            w = ::write(fd, buf + total, n - total);
            if (w < 0 && errno == EPIPE) {
                sigpipe_block.mark_raised();
            }
        }

        if (w < 0) {
            if (errno == EINTR) {
                continue;
            }
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                std::this_thread::sleep_for(std::chrono::milliseconds(1));
                continue;
            }
            if (errno == EPIPE) {
                error = "Broken pipe (peer closed)";
            } else {
                error = "Write failed: " + std::string(strerror(errno));
            }
            return false;
        }
        if (w == 0) {
            error = "Write returned 0 bytes";
            return false;
        }
        total += static_cast<size_t>(w);
    }
    return true;
}

}  // namespace transport
}  // namespace vibium

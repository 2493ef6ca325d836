#include "connection.hpp"

#include <chrono>
#include <exception>

#include "errors/errors.hpp"
#include "logging/logger.hpp"
#include "websocket_connection.hpp"

namespace vibium {
namespace transport {

std::string connection_state_to_string(ConnectionState state) {
    switch (state) {
        case ConnectionState::CONNECTING:
            return "CONNECTING";
        case ConnectionState::OPEN:
            return "OPEN";
        case ConnectionState::CLOSING:
            return "CLOSING";
        case ConnectionState::CLOSED:
            return "CLOSED";
    }
    return "UNKNOWN";
}

std::unique_ptr<Connection> open_connection(const std::string &url, MessageHandler on_message, CloseHandler on_close,
                                            const ConnectOptions &options) {
    if (url.rfind("ws://", 0) == 0) {
        return WebSocketConnection::open(url, std::move(on_message), std::move(on_close), options);
    }
    if (url.rfind("wss://", 0) == 0) {
        throw ConnectionError(url, "wss:// endpoints are not supported");
    }
    throw ConnectionError(url, "unsupported URL scheme");
}

StreamConnection::StreamConnection(std::string endpoint, MessageHandler on_message, CloseHandler on_close)
    : endpoint_(std::move(endpoint)), on_message_(std::move(on_message)), on_close_(std::move(on_close)) {}

StreamConnection::~StreamConnection() { join_reader(); }

void StreamConnection::start_reader() {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        state_ = ConnectionState::OPEN;
    }
    reader_thread_ = std::thread(&StreamConnection::reader_loop, this);
}

void StreamConnection::join_reader() {
    if (!reader_thread_.joinable()) {
        return;
    }
    if (reader_thread_.get_id() == std::this_thread::get_id()) {
        // close() from inside a handler: the loop exits once the handler
        // returns; the owner's destructor (another thread) joins it.
        return;
    }
    reader_thread_.join();
}

void StreamConnection::send(const std::string &text) {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (state_ != ConnectionState::OPEN) {
            throw ConnectionClosedError();
        }
    }

    std::string error;
    bool ok;
    {
        std::lock_guard<std::mutex> lock(write_mutex_);
        ok = write_message(text, error);
    }
    if (!ok) {
        LOG_WARN("[Connection] Write to " << endpoint_ << " failed: " << error);
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            if (write_error_.empty()) {
                write_error_ = error;
            }
        }
        // The reader observes the stop and reports the close
        stopping_.store(true, std::memory_order_release);
        shutdown_transport();
        throw ConnectionClosedError();
    }
    LOG_TRACE("[Connection] >> " << text);
}

void StreamConnection::close() {
    bool was_open = false;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (state_ == ConnectionState::CLOSED || state_ == ConnectionState::CLOSING) {
            return;
        }
        was_open = state_ == ConnectionState::OPEN;
        state_ = ConnectionState::CLOSING;
        deliberate_close_ = true;
    }

    LOG_DEBUG("[Connection] Closing " << endpoint_);

    if (was_open) {
        std::lock_guard<std::mutex> lock(write_mutex_);
        send_goodbye();
    }

    stopping_.store(true, std::memory_order_release);
    shutdown_transport();
    join_reader();

    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        state_ = ConnectionState::CLOSED;
    }
    state_cv_.notify_all();
}

bool StreamConnection::is_closed() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return state_ == ConnectionState::CLOSED;
}

ConnectionState StreamConnection::state() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return state_;
}

std::string StreamConnection::close_reason() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return close_reason_;
}

bool StreamConnection::wait_closed(int timeout_ms) {
    std::unique_lock<std::mutex> lock(state_mutex_);
    return state_cv_.wait_for(lock, std::chrono::milliseconds(timeout_ms),
                              [this] { return state_ == ConnectionState::CLOSED; });
}

void StreamConnection::reader_loop() {
    std::string reason;
    while (!stopping()) {
        std::string message;
        std::string error;
        ReadResult result = read_message(message, error);
        if (result == ReadResult::IDLE) {
            continue;
        }
        if (result == ReadResult::CLOSED) {
            reason = error.empty() ? "Connection closed by peer" : error;
            break;
        }

        LOG_TRACE("[Connection] << " << message);
        try {
            on_message_(message);
        } catch (const std::exception &e) {
            LOG_ERROR("[Connection] Message handler failed: " << e.what());
        }
    }

    bool deliberate;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        deliberate = deliberate_close_;
        if (!deliberate) {
            if (!write_error_.empty()) {
                reason = write_error_;
            } else if (reason.empty()) {
                reason = "Connection closed";
            }
            state_ = ConnectionState::CLOSED;
            close_reason_ = reason;
        }
    }
    if (deliberate) {
        return;
    }

    stopping_.store(true, std::memory_order_release);
    state_cv_.notify_all();
    LOG_DEBUG("[Connection] " << endpoint_ << " closed: " << reason);
    if (on_close_) {
        on_close_(reason);
    }
}

}  // namespace transport
}  // namespace vibium

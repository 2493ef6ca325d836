#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace vibium {
namespace transport {

// Largest single message accepted from the peer (64 MiB: screenshots are big)
constexpr size_t kMaxMessageSize = 64u * 1024u * 1024u;

enum class ConnectionState { CONNECTING, OPEN, CLOSING, CLOSED };

std::string connection_state_to_string(ConnectionState state);

using MessageHandler = std::function<void(const std::string &text)>;
using CloseHandler = std::function<void(const std::string &reason)>;

struct ConnectOptions {
    int connect_timeout_ms = 10000;  // TCP connect + upgrade handshake
};

// Duplex text channel. Implementations are created already Open with the
// message handler attached, so no message can arrive before a handler exists.
class Connection {
public:
    virtual ~Connection() = default;

    // Throws ConnectionClosedError if the connection is not Open
    virtual void send(const std::string &text) = 0;

    // Idempotent. Wakes wait_closed() callers. Does not fire the close handler.
    virtual void close() = 0;

    virtual bool is_closed() const = 0;
    virtual ConnectionState state() const = 0;

    // Transport error that closed the connection; empty after a deliberate close()
    virtual std::string close_reason() const = 0;

    // True once Closed; false on timeout
    virtual bool wait_closed(int timeout_ms) = 0;

    virtual const std::string &endpoint() const = 0;
};

// Picks the transport for the URL scheme (ws:// -> WebSocketConnection).
// Throws ConnectionError if the scheme is unsupported or the transport fails before Open.
std::unique_ptr<Connection> open_connection(const std::string &url, MessageHandler on_message,
                                            CloseHandler on_close = nullptr, const ConnectOptions &options = {});

// Shared state machine and reader thread for stream-based transports.
// Subclasses implement framing; their destructors must call close() and
// join_reader() before releasing the underlying descriptors.
// close() may be called from a handler; destroying the connection from one may not.
class StreamConnection : public Connection {
public:
    ~StreamConnection() override;

    StreamConnection(const StreamConnection &) = delete;
    StreamConnection &operator=(const StreamConnection &) = delete;

    void send(const std::string &text) override;
    void close() override;
    bool is_closed() const override;
    ConnectionState state() const override;
    std::string close_reason() const override;
    bool wait_closed(int timeout_ms) override;
    const std::string &endpoint() const override { return endpoint_; }

protected:
    enum class ReadResult {
        MESSAGE,  // out holds one complete message
        IDLE,     // nothing arrived within the poll interval
        CLOSED    // peer closed or transport error (error says which)
    };

    StreamConnection(std::string endpoint, MessageHandler on_message, CloseHandler on_close);

    // CONNECTING -> OPEN, then start delivering messages
    void start_reader();

    void join_reader();

    bool stopping() const { return stopping_.load(std::memory_order_acquire); }
    const std::atomic<bool> &stopping_flag() const { return stopping_; }

    virtual ReadResult read_message(std::string &out, std::string &error) = 0;
    virtual bool write_message(const std::string &text, std::string &error) = 0;

    // Called with the write lock held, only if the connection was Open
    virtual void send_goodbye() {}

    // Make a blocked read_message() return promptly. Readers also watch stopping().
    virtual void shutdown_transport() {}

private:
    void reader_loop();

    std::string endpoint_;
    MessageHandler on_message_;
    CloseHandler on_close_;

    mutable std::mutex state_mutex_;
    std::condition_variable state_cv_;
    ConnectionState state_ = ConnectionState::CONNECTING;
    std::string close_reason_;
    std::string write_error_;
    bool deliberate_close_ = false;

    std::atomic<bool> stopping_{false};
    std::mutex write_mutex_;
    std::thread reader_thread_;
};

}  // namespace transport
}  // namespace vibium

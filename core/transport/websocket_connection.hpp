#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <random>
#include <string>

#include "connection.hpp"

namespace vibium {
namespace transport {

struct WebSocketUrl {
    std::string host;
    int port = 80;
    std::string path = "/";
};

// Parse ws://host[:port][/path]. Throws ConnectionError on anything else.
WebSocketUrl parse_websocket_url(const std::string &url);

// Client side of RFC 6455 over a plain TCP socket.
// Text frames out (masked), text or binary frames in; fragments are
// reassembled, pings answered, close frames echoed.
class WebSocketConnection : public StreamConnection {
    struct PrivateTag {
        explicit PrivateTag() = default;
    };

public:
    // TCP connect + HTTP upgrade within options.connect_timeout_ms.
    // The connection is Open on return. Throws ConnectionError(url, cause).
    static std::unique_ptr<WebSocketConnection> open(const std::string &url, MessageHandler on_message,
                                                     CloseHandler on_close = nullptr,
                                                     const ConnectOptions &options = {});

    WebSocketConnection(PrivateTag, const std::string &url, int fd, MessageHandler on_message, CloseHandler on_close);
    ~WebSocketConnection() override;

protected:
    ReadResult read_message(std::string &out, std::string &error) override;
    bool write_message(const std::string &text, std::string &error) override;
    void send_goodbye() override;
    void shutdown_transport() override;

private:
    bool write_frame(uint8_t opcode, const std::string &payload, std::string &error);

    int fd_;
    std::mutex frame_mutex_;  // pong/close from the reader vs. send()
    std::random_device random_device_;
    std::string fragments_;
    bool reading_fragment_ = false;
};

}  // namespace transport
}  // namespace vibium

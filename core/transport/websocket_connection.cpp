#include "websocket_connection.hpp"

#include <errno.h>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <chrono>
#include <cstring>
#include <sstream>
#include <stdexcept>
#include <vector>

#include "errors/errors.hpp"
#include "fd_io.hpp"
#include "logging/logger.hpp"

namespace vibium {
namespace transport {

namespace {

constexpr size_t kMaxHandshakeSize = 16384;

constexpr uint8_t kOpContinuation = 0x0;
constexpr uint8_t kOpText = 0x1;
constexpr uint8_t kOpBinary = 0x2;
constexpr uint8_t kOpClose = 0x8;
constexpr uint8_t kOpPing = 0x9;
constexpr uint8_t kOpPong = 0xA;

constexpr uint16_t kCloseNormal = 1000;

std::string base64_encode(const uint8_t *data, size_t len) {
    static const char *kAlphabet = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
    std::string out;
    out.reserve(((len + 2) / 3) * 4);
    for (size_t i = 0; i < len; i += 3) {
        uint32_t chunk = uint32_t(data[i]) << 16;
        if (i + 1 < len) chunk |= uint32_t(data[i + 1]) << 8;
        if (i + 2 < len) chunk |= uint32_t(data[i + 2]);
        out.push_back(kAlphabet[(chunk >> 18) & 0x3F]);
        out.push_back(kAlphabet[(chunk >> 12) & 0x3F]);
        out.push_back(i + 1 < len ? kAlphabet[(chunk >> 6) & 0x3F] : '=');
        out.push_back(i + 2 < len ? kAlphabet[chunk & 0x3F] : '=');
    }
    return out;
}

int remaining_ms(std::chrono::steady_clock::time_point deadline) {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
    return left.count() > 0 ? static_cast<int>(left.count()) : 0;
}

// Returns a connected blocking socket, or -1 with cause set
int connect_with_deadline(const WebSocketUrl &target, std::chrono::steady_clock::time_point deadline,
                          std::string &cause) {
    struct addrinfo hints;
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    struct addrinfo *results = nullptr;
    std::string port = std::to_string(target.port);
    int rc = ::getaddrinfo(target.host.c_str(), port.c_str(), &hints, &results);
    if (rc != 0) {
        cause = "cannot resolve host " + target.host + ": " + gai_strerror(rc);
        return -1;
    }

    int connected = -1;
    for (struct addrinfo *ai = results; ai != nullptr && connected < 0; ai = ai->ai_next) {
        int fd = ::socket(ai->ai_family, ai->ai_socktype | SOCK_CLOEXEC, ai->ai_protocol);
        if (fd < 0) {
            cause = "socket failed: " + std::string(strerror(errno));
            continue;
        }

        int flags = fcntl(fd, F_GETFL, 0);
        fcntl(fd, F_SETFL, flags | O_NONBLOCK);

        if (::connect(fd, ai->ai_addr, ai->ai_addrlen) != 0) {
            if (errno != EINPROGRESS) {
                cause = "connect failed: " + std::string(strerror(errno));
                ::close(fd);
                continue;
            }

            struct pollfd pfd;
            pfd.fd = fd;
            pfd.events = POLLOUT;
            pfd.revents = 0;
            int ready;
            do {
                ready = poll(&pfd, 1, remaining_ms(deadline));
            } while (ready < 0 && errno == EINTR);

            if (ready <= 0) {
                cause = ready == 0 ? "connect timed out" : "poll failed: " + std::string(strerror(errno));
                ::close(fd);
                continue;
            }

            int so_error = 0;
            socklen_t so_len = sizeof(so_error);
            getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &so_len);
            if (so_error != 0) {
                cause = "connect failed: " + std::string(strerror(so_error));
                ::close(fd);
                continue;
            }
        }

        fcntl(fd, F_SETFL, flags);
        int one = 1;
        setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));
        connected = fd;
    }

    ::freeaddrinfo(results);
    return connected;
}

// HTTP/1.1 upgrade. Reads the response one byte at a time so no frame
// bytes that follow the headers are consumed here.
bool perform_handshake(int fd, const WebSocketUrl &target, std::chrono::steady_clock::time_point deadline,
                       std::random_device &random, std::string &cause) {
    std::array<uint8_t, 16> nonce{};
    for (auto &b : nonce) {
        b = static_cast<uint8_t>(random());
    }

    std::ostringstream req;
    req << "GET " << target.path << " HTTP/1.1\r\n";
    req << "Host: " << target.host << ":" << target.port << "\r\n";
    req << "Upgrade: websocket\r\n";
    req << "Connection: Upgrade\r\n";
    req << "Sec-WebSocket-Key: " << base64_encode(nonce.data(), nonce.size()) << "\r\n";
    req << "Sec-WebSocket-Version: 13\r\n\r\n";

    std::string request = req.str();
    if (!write_exact(fd, reinterpret_cast<const uint8_t *>(request.data()), request.size(), cause)) {
        return false;
    }

    std::string headers;
    headers.reserve(1024);
    while (headers.find("\r\n\r\n") == std::string::npos) {
        int left = remaining_ms(deadline);
        if (left <= 0) {
            cause = "handshake timed out";
            return false;
        }
        IoStatus ready = wait_readable(fd, left, cause);
        if (ready == IoStatus::TIMEOUT) {
            continue;
        }
        if (ready != IoStatus::OK) {
            return false;
        }

        char ch = 0;
        ssize_t n = ::recv(fd, &ch, 1, 0);
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n <= 0) {
            cause = "connection closed during handshake";
            return false;
        }
        headers.push_back(ch);
        if (headers.size() > kMaxHandshakeSize) {
            cause = "handshake response too large";
            return false;
        }
    }

    std::string status_line = headers.substr(0, headers.find("\r\n"));
    if (status_line.find(" 101") == std::string::npos) {
        cause = "upgrade rejected: " + status_line;
        return false;
    }

    std::string lower = headers;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower.find("upgrade: websocket") == std::string::npos) {
        cause = "server did not upgrade to websocket";
        return false;
    }
    return true;
}

}  // namespace

WebSocketUrl parse_websocket_url(const std::string &url) {
    const std::string scheme = "ws://";
    if (url.rfind(scheme, 0) != 0) {
        throw ConnectionError(url, "expected a ws:// URL");
    }

    std::string rest = url.substr(scheme.size());
    WebSocketUrl parsed;

    size_t slash = rest.find('/');
    std::string authority = slash == std::string::npos ? rest : rest.substr(0, slash);
    if (slash != std::string::npos) {
        parsed.path = rest.substr(slash);
    }

    std::string port_text;
    if (!authority.empty() && authority[0] == '[') {
        size_t close_bracket = authority.find(']');
        if (close_bracket == std::string::npos) {
            throw ConnectionError(url, "malformed IPv6 host");
        }
        parsed.host = authority.substr(1, close_bracket - 1);
        if (close_bracket + 1 < authority.size() && authority[close_bracket + 1] == ':') {
            port_text = authority.substr(close_bracket + 2);
        }
    } else {
        size_t colon = authority.rfind(':');
        parsed.host = authority.substr(0, colon);
        if (colon != std::string::npos) {
            port_text = authority.substr(colon + 1);
        }
    }

    if (parsed.host.empty()) {
        throw ConnectionError(url, "missing host");
    }

    if (!port_text.empty()) {
        try {
            size_t consumed = 0;
            parsed.port = std::stoi(port_text, &consumed);
            if (consumed != port_text.size()) {
                throw std::invalid_argument(port_text);
            }
        } catch (const std::exception &) {
            throw ConnectionError(url, "invalid port '" + port_text + "'");
        }
        if (parsed.port < 1 || parsed.port > 65535) {
            throw ConnectionError(url, "port out of range");
        }
    }
    return parsed;
}

std::unique_ptr<WebSocketConnection> WebSocketConnection::open(const std::string &url, MessageHandler on_message,
                                                               CloseHandler on_close, const ConnectOptions &options) {
    WebSocketUrl target = parse_websocket_url(url);
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(options.connect_timeout_ms);

    LOG_DEBUG("[WebSocket] Connecting to " << url);

    std::string cause;
    int fd = connect_with_deadline(target, deadline, cause);
    if (fd < 0) {
        throw ConnectionError(url, cause);
    }

    auto connection =
        std::make_unique<WebSocketConnection>(PrivateTag(), url, fd, std::move(on_message), std::move(on_close));

    // Destroying a CONNECTING connection closes the socket without a close frame
    if (!perform_handshake(fd, target, deadline, connection->random_device_, cause)) {
        throw ConnectionError(url, cause);
    }

    connection->start_reader();
    LOG_INFO("[WebSocket] Connected to " << url);
    return connection;
}

WebSocketConnection::WebSocketConnection(PrivateTag, const std::string &url, int fd, MessageHandler on_message,
                                         CloseHandler on_close)
    : StreamConnection(url, std::move(on_message), std::move(on_close)), fd_(fd) {}

WebSocketConnection::~WebSocketConnection() {
    close();
    join_reader();
    if (fd_ >= 0) {
        ::close(fd_);
    }
}

StreamConnection::ReadResult WebSocketConnection::read_message(std::string &out, std::string &error) {
    IoStatus ready = wait_readable(fd_, kReadPollMs, error);
    if (ready == IoStatus::TIMEOUT) {
        return ReadResult::IDLE;
    }
    if (ready != IoStatus::OK) {
        return ReadResult::CLOSED;
    }

    uint8_t header[2];
    if (read_exact(fd_, header, 2, stopping_flag(), error) != IoStatus::OK) {
        return ReadResult::CLOSED;
    }

    bool fin = (header[0] & 0x80) != 0;
    uint8_t opcode = static_cast<uint8_t>(header[0] & 0x0F);
    bool masked = (header[1] & 0x80) != 0;
    uint64_t len = static_cast<uint64_t>(header[1] & 0x7F);

    if (len == 126) {
        uint8_t ext[2];
        if (read_exact(fd_, ext, 2, stopping_flag(), error) != IoStatus::OK) {
            return ReadResult::CLOSED;
        }
        len = (static_cast<uint64_t>(ext[0]) << 8) | ext[1];
    } else if (len == 127) {
        uint8_t ext[8];
        if (read_exact(fd_, ext, 8, stopping_flag(), error) != IoStatus::OK) {
            return ReadResult::CLOSED;
        }
        len = 0;
        for (int i = 0; i < 8; ++i) {
            len = (len << 8) | ext[i];
        }
    }

    if (len > kMaxMessageSize || fragments_.size() + len > kMaxMessageSize) {
        error = "Message too large: " + std::to_string(fragments_.size() + len) + " bytes";
        return ReadResult::CLOSED;
    }

    std::array<uint8_t, 4> mask{};
    if (masked && read_exact(fd_, mask.data(), mask.size(), stopping_flag(), error) != IoStatus::OK) {
        return ReadResult::CLOSED;
    }

    std::string payload(static_cast<size_t>(len), '\0');
    if (len > 0 &&
        read_exact(fd_, reinterpret_cast<uint8_t *>(&payload[0]), payload.size(), stopping_flag(), error) !=
            IoStatus::OK) {
        return ReadResult::CLOSED;
    }
    if (masked) {
        for (size_t i = 0; i < payload.size(); ++i) {
            payload[i] = static_cast<char>(payload[i] ^ mask[i % 4]);
        }
    }

    switch (opcode) {
        case kOpClose: {
            int code = payload.size() >= 2 ? (uint8_t(payload[0]) << 8) | uint8_t(payload[1]) : 0;
            std::string ignored;
            write_frame(kOpClose, payload.substr(0, 2), ignored);
            error = "Connection closed by peer (code " + std::to_string(code) + ")";
            return ReadResult::CLOSED;
        }
        case kOpPing:
            if (!write_frame(kOpPong, payload, error)) {
                return ReadResult::CLOSED;
            }
            return ReadResult::IDLE;
        case kOpPong:
            return ReadResult::IDLE;
        case kOpText:
        case kOpBinary:
            fragments_.clear();
            fragments_.append(payload);
            reading_fragment_ = !fin;
            break;
        case kOpContinuation:
            if (!reading_fragment_) {
                error = "Unexpected continuation frame";
                return ReadResult::CLOSED;
            }
            fragments_.append(payload);
            reading_fragment_ = !fin;
            break;
        default:
            error = "Unknown opcode " + std::to_string(opcode);
            return ReadResult::CLOSED;
    }

    if (reading_fragment_) {
        return ReadResult::IDLE;
    }
    out.swap(fragments_);
    fragments_.clear();
    return ReadResult::MESSAGE;
}

bool WebSocketConnection::write_message(const std::string &text, std::string &error) {
    return write_frame(kOpText, text, error);
}

void WebSocketConnection::send_goodbye() {
    std::string payload;
    payload.push_back(static_cast<char>((kCloseNormal >> 8) & 0xFF));
    payload.push_back(static_cast<char>(kCloseNormal & 0xFF));
    std::string error;
    if (!write_frame(kOpClose, payload, error)) {
        LOG_DEBUG("[WebSocket] Close frame not sent: " << error);
    }
}

void WebSocketConnection::shutdown_transport() {
    if (fd_ >= 0) {
        ::shutdown(fd_, SHUT_RDWR);
    }
}

bool WebSocketConnection::write_frame(uint8_t opcode, const std::string &payload, std::string &error) {
    std::lock_guard<std::mutex> lock(frame_mutex_);

    std::vector<uint8_t> frame;
    frame.reserve(payload.size() + 14);
    frame.push_back(static_cast<uint8_t>(0x80 | (opcode & 0x0F)));

    uint64_t len = payload.size();
    if (len < 126) {
        frame.push_back(static_cast<uint8_t>(0x80 | len));
    } else if (len <= 0xFFFF) {
        frame.push_back(static_cast<uint8_t>(0x80 | 126));
        frame.push_back(static_cast<uint8_t>((len >> 8) & 0xFF));
        frame.push_back(static_cast<uint8_t>(len & 0xFF));
    } else {
        frame.push_back(static_cast<uint8_t>(0x80 | 127));
        for (int i = 7; i >= 0; --i) {
            frame.push_back(static_cast<uint8_t>((len >> (i * 8)) & 0xFF));
        }
    }

    std::array<uint8_t, 4> mask{};
    for (auto &b : mask) {
        b = static_cast<uint8_t>(random_device_());
        frame.push_back(b);
    }
    for (size_t i = 0; i < payload.size(); ++i) {
        frame.push_back(static_cast<uint8_t>(payload[i]) ^ mask[i % 4]);
    }

    return write_exact(fd_, frame.data(), frame.size(), error);
}

}  // namespace transport
}  // namespace vibium

#include "framed_pipe_connection.hpp"

#include <unistd.h>

#include "fd_io.hpp"

namespace vibium {
namespace transport {

std::unique_ptr<FramedPipeConnection> FramedPipeConnection::open(int read_fd, int write_fd, MessageHandler on_message,
                                                                 CloseHandler on_close) {
    auto connection = std::make_unique<FramedPipeConnection>(PrivateTag(), read_fd, write_fd, std::move(on_message),
                                                             std::move(on_close));
    connection->start_reader();
    return connection;
}

FramedPipeConnection::FramedPipeConnection(PrivateTag, int read_fd, int write_fd, MessageHandler on_message,
                                           CloseHandler on_close)
    : StreamConnection("pipe:" + std::to_string(read_fd) + "," + std::to_string(write_fd), std::move(on_message),
                       std::move(on_close)),
      read_fd_(read_fd),
      write_fd_(write_fd) {}

FramedPipeConnection::~FramedPipeConnection() {
    close();
    join_reader();

    if (read_fd_ >= 0) {
        ::close(read_fd_);
    }
    if (write_fd_ >= 0 && write_fd_ != read_fd_) {
        ::close(write_fd_);
    }
}

StreamConnection::ReadResult FramedPipeConnection::read_message(std::string &out, std::string &error) {
    IoStatus ready = wait_readable(read_fd_, kReadPollMs, error);
    if (ready == IoStatus::TIMEOUT) {
        return ReadResult::IDLE;
    }
    if (ready != IoStatus::OK) {
        return ReadResult::CLOSED;
    }

    // Read uint32_le length prefix
    uint8_t len_buf[4];
    IoStatus status = read_exact(read_fd_, len_buf, 4, stopping_flag(), error);
    if (status != IoStatus::OK) {
        if (status == IoStatus::CLOSED && error.empty()) {
            error = "EOF reading frame length";
        }
        return ReadResult::CLOSED;
    }

    uint32_t len = (uint32_t(len_buf[0]) << 0) | (uint32_t(len_buf[1]) << 8) | (uint32_t(len_buf[2]) << 16) |
                   (uint32_t(len_buf[3]) << 24);

    if (len > kMaxMessageSize) {
        error = "Frame too large: " + std::to_string(len) + " bytes";
        return ReadResult::CLOSED;
    }

    out.resize(len);
    if (len > 0) {
        status = read_exact(read_fd_, reinterpret_cast<uint8_t *>(&out[0]), len, stopping_flag(), error);
        if (status != IoStatus::OK) {
            if (status == IoStatus::CLOSED && error.empty()) {
                error = "EOF reading frame payload";
            }
            return ReadResult::CLOSED;
        }
    }
    return ReadResult::MESSAGE;
}

bool FramedPipeConnection::write_message(const std::string &text, std::string &error) {
    if (text.size() > kMaxMessageSize) {
        error = "Frame too large: " + std::to_string(text.size()) + " bytes";
        return false;
    }

    uint32_t len32 = static_cast<uint32_t>(text.size());
    uint8_t len_buf[4];
    len_buf[0] = (len32 >> 0) & 0xFF;
    len_buf[1] = (len32 >> 8) & 0xFF;
    len_buf[2] = (len32 >> 16) & 0xFF;
    len_buf[3] = (len32 >> 24) & 0xFF;

    if (!write_exact(write_fd_, len_buf, 4, error)) {
        return false;
    }
    if (!text.empty()) {
        return write_exact(write_fd_, reinterpret_cast<const uint8_t *>(text.data()), text.size(), error);
    }
    return true;
}

}  // namespace transport
}  // namespace vibium

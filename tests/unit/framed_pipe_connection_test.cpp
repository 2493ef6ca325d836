/**
 * framed_pipe_connection_test.cpp - Length-prefixed transport over a socketpair
 *
 * The test holds the peer end and speaks raw uint32_le frames. One case runs
 * over a pair of anonymous pipes, where a vanished reader raises SIGPIPE.
 */

#include "transport/framed_pipe_connection.hpp"

#include <gtest/gtest.h>
#include <sys/socket.h>
#include <unistd.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "errors/errors.hpp"
#include "support/test_files.hpp"

using namespace vibium;
using namespace vibium::transport;
using vibium::tests::wait_until;

namespace {

void write_frame(int fd, const std::string &payload) {
    uint32_t len = static_cast<uint32_t>(payload.size());
    uint8_t header[4] = {static_cast<uint8_t>(len & 0xFF), static_cast<uint8_t>((len >> 8) & 0xFF),
                         static_cast<uint8_t>((len >> 16) & 0xFF), static_cast<uint8_t>((len >> 24) & 0xFF)};
    ASSERT_EQ(::write(fd, header, 4), 4);
    if (!payload.empty()) {
        ASSERT_EQ(::write(fd, payload.data(), payload.size()), static_cast<ssize_t>(payload.size()));
    }
}

std::string read_frame(int fd) {
    uint8_t header[4];
    size_t got = 0;
    while (got < 4) {
        ssize_t n = ::read(fd, header + got, 4 - got);
        if (n <= 0) {
            return "<eof>";
        }
        got += static_cast<size_t>(n);
    }
    uint32_t len = uint32_t(header[0]) | (uint32_t(header[1]) << 8) | (uint32_t(header[2]) << 16) |
                   (uint32_t(header[3]) << 24);
    std::string payload(len, '\0');
    got = 0;
    while (got < len) {
        ssize_t n = ::read(fd, &payload[got], len - got);
        if (n <= 0) {
            return "<eof>";
        }
        got += static_cast<size_t>(n);
    }
    return payload;
}

}  // namespace

class FramedPipeConnectionTest : public ::testing::Test {
protected:
    void SetUp() override {
        int fds[2];
        ASSERT_EQ(socketpair(AF_UNIX, SOCK_STREAM, 0, fds), 0);
        local_fd_ = fds[0];
        peer_fd_ = fds[1];
    }

    void TearDown() override {
        connection_.reset();
        if (peer_fd_ >= 0) {
            ::close(peer_fd_);
        }
    }

    void open_connection() {
        connection_ = FramedPipeConnection::open(
            local_fd_, local_fd_,
            [this](const std::string &text) {
                std::lock_guard<std::mutex> lock(mutex_);
                received_.push_back(text);
                cv_.notify_all();
            },
            [this](const std::string &reason) {
                std::lock_guard<std::mutex> lock(mutex_);
                close_reasons_.push_back(reason);
                cv_.notify_all();
            });
    }

    bool wait_for_messages(size_t count) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, std::chrono::seconds(2), [&] { return received_.size() >= count; });
    }

    bool wait_for_close() {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, std::chrono::seconds(2), [&] { return !close_reasons_.empty(); });
    }

    int local_fd_ = -1;
    int peer_fd_ = -1;
    std::unique_ptr<FramedPipeConnection> connection_;

    std::mutex mutex_;
    std::condition_variable cv_;
    std::vector<std::string> received_;
    std::vector<std::string> close_reasons_;
};

TEST_F(FramedPipeConnectionTest, OpenOnReturn) {
    open_connection();
    EXPECT_EQ(connection_->state(), ConnectionState::OPEN);
    EXPECT_FALSE(connection_->is_closed());
}

TEST_F(FramedPipeConnectionTest, DeliversFramesInOrder) {
    open_connection();
    write_frame(peer_fd_, R"({"method":"a"})");
    write_frame(peer_fd_, "");
    write_frame(peer_fd_, R"({"method":"b"})");

    ASSERT_TRUE(wait_for_messages(3));
    std::lock_guard<std::mutex> lock(mutex_);
    EXPECT_EQ(received_[0], R"({"method":"a"})");
    EXPECT_EQ(received_[1], "");
    EXPECT_EQ(received_[2], R"({"method":"b"})");
}

TEST_F(FramedPipeConnectionTest, SendWritesLengthPrefixedFrame) {
    open_connection();
    connection_->send(R"({"id":1,"method":"ping","params":{}})");

    EXPECT_EQ(read_frame(peer_fd_), R"({"id":1,"method":"ping","params":{}})");
}

TEST_F(FramedPipeConnectionTest, LargeMessageSurvivesPartialReads) {
    open_connection();
    std::string big(256 * 1024, 'x');

    std::thread writer([&] { write_frame(peer_fd_, big); });
    ASSERT_TRUE(wait_for_messages(1));
    writer.join();

    std::lock_guard<std::mutex> lock(mutex_);
    EXPECT_EQ(received_[0].size(), big.size());
}

TEST_F(FramedPipeConnectionTest, PeerCloseFiresCloseHandler) {
    open_connection();
    ::close(peer_fd_);
    peer_fd_ = -1;

    ASSERT_TRUE(wait_for_close());
    EXPECT_TRUE(connection_->wait_closed(1000));
    EXPECT_EQ(connection_->state(), ConnectionState::CLOSED);
    EXPECT_FALSE(connection_->close_reason().empty());
    EXPECT_THROW(connection_->send("late"), ConnectionClosedError);
}

TEST_F(FramedPipeConnectionTest, OversizedFrameClosesConnection) {
    open_connection();
    uint8_t header[4] = {0xFF, 0xFF, 0xFF, 0xFF};
    ASSERT_EQ(::write(peer_fd_, header, 4), 4);

    ASSERT_TRUE(wait_for_close());
    std::lock_guard<std::mutex> lock(mutex_);
    EXPECT_NE(close_reasons_[0].find("too large"), std::string::npos);
}

TEST_F(FramedPipeConnectionTest, DeliberateCloseIsIdempotentAndSilent) {
    open_connection();
    connection_->close();
    EXPECT_TRUE(connection_->is_closed());
    EXPECT_TRUE(connection_->close_reason().empty());

    EXPECT_NO_THROW(connection_->close());
    EXPECT_THROW(connection_->send("after close"), ConnectionClosedError);

    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    std::lock_guard<std::mutex> lock(mutex_);
    EXPECT_TRUE(close_reasons_.empty());
}

TEST_F(FramedPipeConnectionTest, HandlerExceptionDoesNotStopReader) {
    std::atomic<int> calls{0};
    connection_ = FramedPipeConnection::open(local_fd_, local_fd_, [&calls](const std::string &) {
        if (calls++ == 0) {
            throw std::runtime_error("handler failure");
        }
    });

    write_frame(peer_fd_, "first");
    write_frame(peer_fd_, "second");

    EXPECT_TRUE(wait_until([&calls] { return calls.load() == 2; }));
    EXPECT_EQ(connection_->state(), ConnectionState::OPEN);
}

TEST_F(FramedPipeConnectionTest, CloseFromMessageHandlerThenDestroy) {
    std::atomic<bool> closed_in_handler{false};
    connection_ = FramedPipeConnection::open(local_fd_, local_fd_, [this, &closed_in_handler](const std::string &) {
        connection_->close();
        closed_in_handler = true;
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    });

    write_frame(peer_fd_, "shutdown");

    ASSERT_TRUE(wait_until([&closed_in_handler] { return closed_in_handler.load(); }));
    EXPECT_TRUE(connection_->is_closed());
    connection_.reset();
}

/******************************************************************************
 * Pipe Tests
 ******************************************************************************/

TEST_F(FramedPipeConnectionTest, WriteToClosedPipeIsConnectionClosed) {
    // Socketpair from the fixture is not used here
    ::close(local_fd_);
    local_fd_ = -1;

    int from_peer[2];
    int to_peer[2];
    ASSERT_EQ(pipe(from_peer), 0);
    ASSERT_EQ(pipe(to_peer), 0);

    // Connection owns from_peer[0] and to_peer[1]
    connection_ = FramedPipeConnection::open(
        from_peer[0], to_peer[1], [](const std::string &) {},
        [this](const std::string &reason) {
            std::lock_guard<std::mutex> lock(mutex_);
            close_reasons_.push_back(reason);
            cv_.notify_all();
        });

    write_frame(from_peer[1], "hello");
    ::close(to_peer[0]);

    // Without SIGPIPE handling the process dies here
    EXPECT_THROW(connection_->send("nobody is reading"), ConnectionClosedError);

    ASSERT_TRUE(wait_for_close());
    {
        std::lock_guard<std::mutex> lock(mutex_);
        EXPECT_NE(close_reasons_[0].find("Broken pipe"), std::string::npos);
    }
    EXPECT_THROW(connection_->send("again"), ConnectionClosedError);

    connection_.reset();
    ::close(from_peer[1]);
}

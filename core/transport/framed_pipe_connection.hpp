#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include "connection.hpp"

namespace vibium {
namespace transport {

// FramedPipeConnection carries messages over a descriptor pair.
// Frames are: uint32_le (length) + payload bytes.
//
// Used when clicker is driven over inherited pipes instead of a WebSocket,
// and by tests over a socketpair.
class FramedPipeConnection : public StreamConnection {
    struct PrivateTag {
        explicit PrivateTag() = default;
    };

public:
    // Takes ownership of both descriptors (they may be the same socket).
    // The connection is Open on return.
    static std::unique_ptr<FramedPipeConnection> open(int read_fd, int write_fd, MessageHandler on_message,
                                                      CloseHandler on_close = nullptr);

    FramedPipeConnection(PrivateTag, int read_fd, int write_fd, MessageHandler on_message, CloseHandler on_close);
    ~FramedPipeConnection() override;

protected:
    ReadResult read_message(std::string &out, std::string &error) override;
    bool write_message(const std::string &text, std::string &error) override;

private:
    int read_fd_;
    int write_fd_;
};

}  // namespace transport
}  // namespace vibium

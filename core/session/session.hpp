#pragma once

#include <memory>
#include <mutex>
#include <string>

#include "binary/binary_resolver.hpp"
#include "process/clicker_process.hpp"
#include "protocol/protocol_client.hpp"

namespace vibium {
namespace session {

// How long a dropped connection waits for the process to report its exit
constexpr int kCrashAttributionMs = 500;

struct LaunchOptions {
    process::StartOptions process;
    protocol::ClientOptions client;
};

/**
 * @brief One browser session: a clicker process plus its protocol client
 *
 * launch() never leaks the subprocess: any failure after spawn stops it
 * before the exception propagates. If the process dies while commands are
 * pending they fail with ProcessCrashedError. close() tears down the client
 * first, then the process.
 */
class Session {
    struct PrivateTag {
        explicit PrivateTag() = default;
    };

public:
    // Throws ResolutionError, StartTimeoutError, ProcessCrashedError or ConnectionError
    static std::unique_ptr<Session> launch(const LaunchOptions &options = {});
    static std::unique_ptr<Session> launch(const LaunchOptions &options, const binary::BinaryResolver &resolver);

    // Attach to a server somebody else started; no process is managed
    static std::unique_ptr<Session> connect(const std::string &url, const protocol::ClientOptions &options = {});

    ~Session();

    Session(const Session &) = delete;
    Session &operator=(const Session &) = delete;

    // Idempotent
    void close();

    protocol::ProtocolClient &client() { return *client_; }

    // nullptr for sessions created with connect()
    const std::shared_ptr<process::ClickerProcess> &process() const { return process_; }

    int port() const { return process_ ? process_->port() : 0; }
    const std::string &url() const { return url_; }
    bool is_connected() const;

public:
    Session(PrivateTag, std::shared_ptr<process::ClickerProcess> process,
            std::shared_ptr<protocol::ProtocolClient> client, std::string url);

private:
    void attach_process_failures();

    std::shared_ptr<process::ClickerProcess> process_;
    std::shared_ptr<protocol::ProtocolClient> client_;
    std::string url_;

    std::mutex close_mutex_;
    bool closed_ = false;
};

}  // namespace session
}  // namespace vibium

#pragma once

#include <atomic>
#include <cstdint>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <string>
#include <unordered_map>

#include "event_dispatcher.hpp"
#include "messages.hpp"
#include "transport/connection.hpp"

namespace vibium {
namespace protocol {

constexpr int kDefaultCommandTimeoutMs = 30000;

struct ClientOptions {
    int command_timeout_ms = kDefaultCommandTimeoutMs;
    size_t event_queue_size = kDefaultEventQueueSize;
    transport::ConnectOptions connect;
};

/**
 * @brief Correlates commands with responses over one Connection
 *
 * send() may be called from any number of threads. Each call gets the next
 * id, registers a pending slot and blocks until exactly one of: matching
 * response, timeout, or connection/process failure. Whoever removes the id
 * from the pending table first decides the outcome.
 */
class ProtocolClient {
public:
    using ConnectionFactory = std::function<std::unique_ptr<transport::Connection>(transport::MessageHandler,
                                                                                   transport::CloseHandler)>;

    // Maps a transport drop reason to the exception pending commands receive.
    // Returning nullptr falls back to ConnectionError.
    using DisconnectCauseResolver = std::function<std::exception_ptr(const std::string &reason)>;

    // Opens a connection to url. Throws ConnectionError.
    static std::unique_ptr<ProtocolClient> connect(const std::string &url, const ClientOptions &options = {});

    // The factory is called once, with the handlers already bound
    explicit ProtocolClient(const ConnectionFactory &factory, const ClientOptions &options = {});
    ~ProtocolClient();

    ProtocolClient(const ProtocolClient &) = delete;
    ProtocolClient &operator=(const ProtocolClient &) = delete;

    /**
     * @brief Send a command and wait for its result
     *
     * @return The result payload (empty object if the response carried none)
     * @throws ProtocolError    remote replied with an error
     * @throws TimeoutError     no response within timeout_ms
     * @throws ClosedError      close() was called (before or during the wait)
     * @throws ConnectionClosedError, ConnectionError, ProcessCrashedError
     */
    nlohmann::json send(const std::string &method, const nlohmann::json &params = nlohmann::json::object());
    nlohmann::json send(const std::string &method, const nlohmann::json &params, int timeout_ms);

    // Single sink for events; replaces any previous handler
    void on_event(EventHandler handler);

    // Fails pending commands with ClosedError, then closes the connection. Idempotent.
    void close();

    // Fail every pending command with cause; the connection stays as it is
    void fail_all(std::exception_ptr cause);

    void set_disconnect_cause_resolver(DisconnectCauseResolver resolver);

    bool is_connected() const;
    size_t pending_count() const;
    uint64_t stray_response_count() const { return stray_responses_.load(); }
    const EventDispatcher &events() const { return dispatcher_; }
    const ClientOptions &options() const { return options_; }

private:
    using PendingSlot = std::shared_ptr<std::promise<nlohmann::json>>;

    void handle_message(const std::string &text);
    void handle_close(const std::string &reason);
    void handle_response(Response &response);

    PendingSlot take_pending(int64_t id);

    ClientOptions options_;
    std::string endpoint_;

    std::atomic<int64_t> next_id_{1};
    std::atomic<uint64_t> stray_responses_{0};

    mutable std::mutex mutex_;
    std::unordered_map<int64_t, PendingSlot> pending_;
    bool closed_ = false;
    DisconnectCauseResolver disconnect_resolver_;

    EventDispatcher dispatcher_;
    std::unique_ptr<transport::Connection> connection_;  // last: its reader is joined first
};

}  // namespace protocol
}  // namespace vibium

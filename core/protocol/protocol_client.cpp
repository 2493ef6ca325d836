#include "protocol_client.hpp"

#include <chrono>
#include <utility>

#include "errors/errors.hpp"
#include "logging/logger.hpp"

namespace vibium {
namespace protocol {

std::unique_ptr<ProtocolClient> ProtocolClient::connect(const std::string &url, const ClientOptions &options) {
    ConnectionFactory factory = [url, &options](transport::MessageHandler on_message,
                                                transport::CloseHandler on_close) {
        return transport::open_connection(url, std::move(on_message), std::move(on_close), options.connect);
    };
    return std::make_unique<ProtocolClient>(factory, options);
}

ProtocolClient::ProtocolClient(const ConnectionFactory &factory, const ClientOptions &options)
    : options_(options), dispatcher_(options.event_queue_size) {
    connection_ = factory([this](const std::string &text) { handle_message(text); },
                          [this](const std::string &reason) { handle_close(reason); });
    if (!connection_) {
        dispatcher_.stop();
        throw ConnectionError("", "connection factory returned no connection");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    endpoint_ = connection_->endpoint();
}

ProtocolClient::~ProtocolClient() { close(); }

nlohmann::json ProtocolClient::send(const std::string &method, const nlohmann::json &params) {
    return send(method, params, options_.command_timeout_ms);
}

nlohmann::json ProtocolClient::send(const std::string &method, const nlohmann::json &params, int timeout_ms) {
    if (timeout_ms <= 0) {
        timeout_ms = options_.command_timeout_ms;
    }

    Command command;
    command.id = next_id_.fetch_add(1);
    command.method = method;
    command.params = params;
    std::string text = encode_command(command);

    auto slot = std::make_shared<std::promise<nlohmann::json>>();
    std::future<nlohmann::json> result = slot->get_future();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            throw ClosedError();
        }
        pending_.emplace(command.id, slot);
    }

    LOG_DEBUG("[ProtocolClient] -> " << method << " (id=" << command.id << ")");

    try {
        connection_->send(text);
    } catch (const std::exception &e) {
        LOG_WARN("[ProtocolClient] Failed to send " << method << " (id=" << command.id << "): " << e.what());
        take_pending(command.id);
        throw;
    }

    if (result.wait_for(std::chrono::milliseconds(timeout_ms)) == std::future_status::timeout) {
        if (take_pending(command.id)) {
            LOG_WARN("[ProtocolClient] " << method << " (id=" << command.id << ") timed out after " << timeout_ms
                                         << "ms");
            throw TimeoutError(method, timeout_ms);
        }
        // Lost the race: the slot was fulfilled between the wait and the removal
    }
    return result.get();
}

void ProtocolClient::on_event(EventHandler handler) { dispatcher_.set_handler(std::move(handler)); }

void ProtocolClient::close() {
    std::unordered_map<int64_t, PendingSlot> drained;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return;
        }
        closed_ = true;
        drained.swap(pending_);
    }

    if (!drained.empty()) {
        LOG_DEBUG("[ProtocolClient] Closing with " << drained.size() << " pending command(s)");
    }
    auto cause = std::make_exception_ptr(ClosedError());
    for (auto &entry : drained) {
        entry.second->set_exception(cause);
    }

    dispatcher_.stop();
    if (connection_) {
        connection_->close();
    }
    LOG_DEBUG("[ProtocolClient] Closed " << endpoint_);
}

void ProtocolClient::fail_all(std::exception_ptr cause) {
    std::unordered_map<int64_t, PendingSlot> drained;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        drained.swap(pending_);
    }
    if (drained.empty()) {
        return;
    }

    LOG_WARN("[ProtocolClient] Failing " << drained.size() << " pending command(s)");
    for (auto &entry : drained) {
        entry.second->set_exception(cause);
    }
}

void ProtocolClient::set_disconnect_cause_resolver(DisconnectCauseResolver resolver) {
    std::lock_guard<std::mutex> lock(mutex_);
    disconnect_resolver_ = std::move(resolver);
}

bool ProtocolClient::is_connected() const {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return false;
        }
    }
    return connection_ && connection_->state() == transport::ConnectionState::OPEN;
}

size_t ProtocolClient::pending_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.size();
}

ProtocolClient::PendingSlot ProtocolClient::take_pending(int64_t id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = pending_.find(id);
    if (it == pending_.end()) {
        return nullptr;
    }
    PendingSlot slot = std::move(it->second);
    pending_.erase(it);
    return slot;
}

void ProtocolClient::handle_message(const std::string &text) {
    IncomingMessage message = decode_message(text);
    switch (message.kind) {
        case MessageKind::RESPONSE:
            handle_response(message.response);
            break;
        case MessageKind::EVENT:
            LOG_TRACE("[ProtocolClient] Event " << message.event.method);
            dispatcher_.push(std::move(message.event));
            break;
        case MessageKind::INVALID:
            LOG_WARN("[ProtocolClient] Dropping message (" << message.error << "): " << text.substr(0, 200));
            break;
    }
}

void ProtocolClient::handle_response(Response &response) {
    PendingSlot slot = take_pending(response.id);
    if (!slot) {
        // Late response after a timeout, or an id we never sent
        uint64_t count = ++stray_responses_;
        if (count == 1 || count % 100 == 0) {
            LOG_WARN("[ProtocolClient] Response for unknown id " << response.id << " discarded (" << count
                                                                 << " total)");
        }
        return;
    }

    if (response.success) {
        LOG_DEBUG("[ProtocolClient] <- id=" << response.id << " success");
        slot->set_value(std::move(response.result));
        return;
    }

    LOG_DEBUG("[ProtocolClient] <- id=" << response.id << " error: " << response.error.code);
    slot->set_exception(std::make_exception_ptr(
        ProtocolError(response.error.code, response.error.message, response.error.trace)));
}

void ProtocolClient::handle_close(const std::string &reason) {
    DisconnectCauseResolver resolver;
    std::string endpoint;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return;
        }
        resolver = disconnect_resolver_;
        endpoint = endpoint_;
    }

    LOG_WARN("[ProtocolClient] Connection to " << endpoint << " lost: " << reason);

    std::exception_ptr cause;
    if (resolver) {
        cause = resolver(reason);
    }
    if (!cause) {
        cause = std::make_exception_ptr(ConnectionError(endpoint, reason));
    }
    fail_all(cause);
}

}  // namespace protocol
}  // namespace vibium

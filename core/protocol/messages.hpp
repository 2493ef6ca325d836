#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace vibium {
namespace protocol {

/**
 * @file messages.hpp
 * @brief Wire representation of commands, responses and events
 *
 * Outgoing:  {"id": 7, "method": "browsingContext.navigate", "params": {...}}
 * Incoming:  {"id": 7, "type": "success", "result": {...}}
 *            {"id": 7, "type": "error", "error": "<code>", "message": "...", "stacktrace": "..."}
 *            {"method": "log.entryAdded", "params": {...}}          (event: no id)
 */

struct ErrorDescriptor {
    std::string code = "unknown error";
    std::string message = "Unknown error";
    std::optional<std::string> trace;
};

struct Command {
    int64_t id = 0;
    std::string method;
    nlohmann::json params = nlohmann::json::object();
};

struct Response {
    int64_t id = 0;
    bool success = true;
    nlohmann::json result = nlohmann::json::object();  // success only
    ErrorDescriptor error;                             // failure only
};

struct Event {
    std::string method;
    nlohmann::json params = nlohmann::json::object();
};

enum class MessageKind { RESPONSE, EVENT, INVALID };

struct IncomingMessage {
    MessageKind kind = MessageKind::INVALID;
    Response response;   // kind == RESPONSE
    Event event;         // kind == EVENT
    std::string error;   // kind == INVALID: why it was rejected
};

// Serialize a command. Null params are sent as an empty object.
std::string encode_command(const Command &command);

// Classify and decode one incoming text message. Never throws.
IncomingMessage decode_message(const std::string &text);

}  // namespace protocol
}  // namespace vibium

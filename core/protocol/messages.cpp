#include "messages.hpp"

namespace vibium {
namespace protocol {

namespace {

// Error fields are strings on the wire; anything else is kept as its JSON text
std::string field_as_string(const nlohmann::json &value) {
    if (value.is_string()) {
        return value.get<std::string>();
    }
    return value.dump();
}

}  // namespace

std::string encode_command(const Command &command) {
    nlohmann::json j;
    j["id"] = command.id;
    j["method"] = command.method;
    j["params"] = command.params.is_null() ? nlohmann::json::object() : command.params;
    return j.dump();
}

IncomingMessage decode_message(const std::string &text) {
    IncomingMessage msg;

    nlohmann::json j = nlohmann::json::parse(text, nullptr, false);
    if (j.is_discarded()) {
        msg.error = "invalid JSON";
        return msg;
    }
    if (!j.is_object()) {
        msg.error = "message is not a JSON object";
        return msg;
    }

    auto id_it = j.find("id");
    if (id_it != j.end() && !id_it->is_null()) {
        if (!id_it->is_number_integer()) {
            msg.error = "response id is not an integer";
            return msg;
        }

        msg.kind = MessageKind::RESPONSE;
        msg.response.id = id_it->get<int64_t>();

        auto type_it = j.find("type");
        bool is_error = type_it != j.end() && type_it->is_string() && type_it->get<std::string>() == "error";
        if (!is_error) {
            msg.response.success = true;
            auto result_it = j.find("result");
            if (result_it != j.end() && !result_it->is_null()) {
                msg.response.result = *result_it;
            }
            return msg;
        }

        msg.response.success = false;
        auto code_it = j.find("error");
        if (code_it != j.end() && !code_it->is_null()) {
            msg.response.error.code = field_as_string(*code_it);
        }
        auto message_it = j.find("message");
        if (message_it != j.end() && !message_it->is_null()) {
            msg.response.error.message = field_as_string(*message_it);
        }
        auto trace_it = j.find("stacktrace");
        if (trace_it != j.end() && !trace_it->is_null()) {
            msg.response.error.trace = field_as_string(*trace_it);
        }
        return msg;
    }

    auto method_it = j.find("method");
    if (method_it != j.end() && method_it->is_string()) {
        msg.kind = MessageKind::EVENT;
        msg.event.method = method_it->get<std::string>();
        auto params_it = j.find("params");
        if (params_it != j.end() && !params_it->is_null()) {
            msg.event.params = *params_it;
        }
        return msg;
    }

    msg.error = "neither a response nor an event";
    return msg;
}

}  // namespace protocol
}  // namespace vibium

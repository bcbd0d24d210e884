#include "protocol/message_codec.hpp"

namespace relay::protocol {

using core::errors::ErrorCategory;
using core::errors::RelayError;
using nlohmann::json;

namespace {

RelayError invalid_message(const std::string& detail) {
    return RelayError{ErrorCategory::Protocol, "Invalid JSON-RPC message: " + detail,
                      "invalid_message"};
}

}  // namespace

json to_json(const Message& message) {
    json payload;
    payload["jsonrpc"] = message.jsonrpc;
    if (message.id.has_value()) {
        payload["id"] = message.id.value();
    } else if (!message.method.has_value()) {
        // Responses to unparsable requests carry an explicit null id.
        payload["id"] = nullptr;
    }
    if (message.method.has_value()) {
        payload["method"] = message.method.value();
    }
    if (message.params.has_value()) {
        payload["params"] = message.params.value();
    }
    if (message.result.has_value()) {
        payload["result"] = message.result.value();
    }
    if (message.error.has_value()) {
        json error;
        error["code"] = message.error->code;
        error["message"] = message.error->message;
        if (message.error->data.has_value()) {
            error["data"] = message.error->data.value();
        }
        payload["error"] = error;
    }
    return payload;
}

std::string encode_line(const Message& message) {
    return to_json(message).dump(-1, ' ', false, json::error_handler_t::replace);
}

core::errors::Result<Message> from_json(const json& value) {
    if (!value.is_object()) {
        return invalid_message("not a JSON object");
    }

    Message message;
    auto version = value.find("jsonrpc");
    if (version == value.end() || !version->is_string()) {
        return invalid_message("missing jsonrpc version");
    }
    message.jsonrpc = version->get<std::string>();

    auto id = value.find("id");
    if (id != value.end()) {
        if (id->is_string()) {
            message.id = id->get<std::string>();
        } else if (id->is_number_integer()) {
            message.id = std::to_string(id->get<long long>());
        } else if (!id->is_null()) {
            return invalid_message("id must be a string or an integer");
        }
    }

    auto method = value.find("method");
    if (method != value.end()) {
        if (!method->is_string()) {
            return invalid_message("method must be a string");
        }
        message.method = method->get<std::string>();
    }

    auto params = value.find("params");
    if (params != value.end()) {
        message.params = *params;
    }

    auto result = value.find("result");
    if (result != value.end()) {
        message.result = *result;
    }

    auto error = value.find("error");
    if (error != value.end()) {
        if (!error->is_object()) {
            return invalid_message("error must be an object");
        }
        auto code = error->find("code");
        auto text = error->find("message");
        if (code == error->end() || !code->is_number_integer() || text == error->end() ||
            !text->is_string()) {
            return invalid_message("error needs an integer code and a string message");
        }
        RpcError rpc_error;
        rpc_error.code = code->get<int>();
        rpc_error.message = text->get<std::string>();
        auto data = error->find("data");
        if (data != error->end()) {
            rpc_error.data = *data;
        }
        message.error = rpc_error;
    }

    if (classify(message) == MessageKind::Invalid) {
        return invalid_message("not a request, response or notification");
    }
    return message;
}

core::errors::Result<Message> decode_line(const std::string& line) {
    const json parsed = json::parse(line, nullptr, false);
    if (parsed.is_discarded()) {
        return RelayError{ErrorCategory::Protocol, "Line is not valid JSON.", "parse_error"};
    }
    return from_json(parsed);
}

}  // namespace relay::protocol

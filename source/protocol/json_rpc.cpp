#include "protocol/json_rpc.hpp"

namespace json_rpc {

static const char *const JSONRPC_VERSION = "2.0";

static bool is_valid_id(const json &id) {
    return id.is_null() || id.is_string() || id.is_number();
}

Message parse_message(const json &message) {
    if (!message.is_object()) {
        throw ProtocolError("message must be a JSON object");
    }

    auto version = message.find("jsonrpc");
    if (version == message.end() || !version->is_string() || *version != JSONRPC_VERSION) {
        throw ProtocolError("\"jsonrpc\" must be \"2.0\"");
    }

    auto method = message.find("method");
    if (method == message.end() || !method->is_string()) {
        throw ProtocolError("\"method\" must be a string");
    }

    json params = nullptr;
    auto params_member = message.find("params");
    if (params_member != message.end()) {
        params = *params_member;
    }

    auto id = message.find("id");
    if (id == message.end()) {
        return Notification{method->get<std::string>(), params};
    }
    if (!is_valid_id(*id)) {
        throw ProtocolError("\"id\" must be a string, number or null");
    }
    return Request{*id, method->get<std::string>(), params};
}

Message parse_message_text(const std::string &text) {
    return parse_message(json::parse(text));
}

json build_response(const json &request_id, const json &result_payload) {
    json response;
    response["jsonrpc"] = JSONRPC_VERSION;
    response["id"] = request_id;
    response["result"] = result_payload;
    return response;
}

json build_error_response(const json &request_id, int error_code, const std::string &error_message) {
    json response;
    response["jsonrpc"] = JSONRPC_VERSION;
    response["id"] = request_id;
    response["error"]["code"] = error_code;
    response["error"]["message"] = error_message;
    return response;
}

json build_error_response(const json &request_id, int error_code, const std::string &error_message, const json &error_data) {
    json response = build_error_response(request_id, error_code, error_message);
    response["error"]["data"] = error_data;
    return response;
}

} // namespace json_rpc

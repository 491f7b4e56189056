#include <mcp_echo/mcp/message.hpp>

#include <mcp_echo/mcp/protocol.hpp>

namespace mcp_echo {

Result<Message, DecodeError> DecodeMessage(std::string_view text) {
    nlohmann::json value;
    try {
        value = nlohmann::json::parse(text.begin(), text.end());
    } catch (const nlohmann::json::exception& e) {
        // parse_error for syntax, out_of_range for number overflow (1e999).
        return Result<Message, DecodeError>::Err(DecodeError{
            rpc_error::kParseError,
            std::string("Parse error: ") + e.what()});
    }
    return ClassifyMessage(value);
}

Result<Message, DecodeError> ClassifyMessage(const nlohmann::json& value) {
    if (!value.is_object()) {
        return Result<Message, DecodeError>::Err(DecodeError{
            rpc_error::kInvalidRequest,
            std::string("Invalid Request: expected a JSON object, got ") +
                value.type_name()});
    }

    Message message;

    auto jsonrpc = value.find("jsonrpc");
    if (jsonrpc != value.end() && jsonrpc->is_string()) {
        message.jsonrpc = jsonrpc->get<std::string>();
    }

    // A non-string method can never match the method table; keep its JSON
    // text so the "Method not found" message still names it.
    auto method = value.find("method");
    if (method != value.end()) {
        message.method = method->is_string() ? method->get<std::string>()
                                             : method->dump();
    }

    auto params = value.find("params");
    if (params != value.end() && !params->is_null()) {
        message.params = *params;
    } else {
        message.params = nlohmann::json::object();
    }

    auto id = value.find("id");
    if (id != value.end()) {
        message.id = *id;
        message.has_id = true;
    } else {
        message.id = kDefaultRequestId;
    }

    message.kind = message.method == method::kInitialized
                       ? MessageKind::Notification
                       : MessageKind::Request;

    return Result<Message, DecodeError>::Ok(std::move(message));
}

} // namespace mcp_echo

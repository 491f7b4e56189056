#pragma once

#include <mcp_echo/core/result.hpp>

#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace mcp_echo {

enum class MessageKind {
    Request,       // expects exactly one response
    Notification,  // expects no response
};

// ---------------------------------------------------------------------------
// Message: one decoded JSON-RPC unit. Never mutated after decoding.
//
// Classification follows the reference servers: a message is a Notification
// iff its method is "notifications/initialized". Everything else, including
// messages without an "id", is answered, with id defaulting to 1.
// ---------------------------------------------------------------------------
struct Message {
    std::string jsonrpc;     // as sent; not enforced
    std::string method;      // empty when absent
    nlohmann::json params;   // object; {} when absent
    nlohmann::json id;       // echoed verbatim; 1 when absent
    bool has_id = false;
    MessageKind kind = MessageKind::Request;

    [[nodiscard]] bool IsNotification() const {
        return kind == MessageKind::Notification;
    }
};

// ---------------------------------------------------------------------------
// DecodeError: the unit could not become a Message. Carries the JSON-RPC
// error code to answer with (-32700 or -32600) and the diagnostic text.
// ---------------------------------------------------------------------------
struct DecodeError {
    int code;
    std::string message;
};

/// Parse and classify one text unit.
[[nodiscard]] Result<Message, DecodeError> DecodeMessage(std::string_view text);

/// Classify an already parsed JSON value.
[[nodiscard]] Result<Message, DecodeError> ClassifyMessage(const nlohmann::json& value);

} // namespace mcp_echo

#pragma once
#include <nlohmann/json.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace chatlink {

enum class MessageStatus { Sent, Pending, Failed };

std::string status_to_string(MessageStatus status);
std::optional<MessageStatus> status_from_string(const std::string& s);

struct ChatMessage {
    std::string id;
    std::string from;
    std::string to;
    std::string content;
    bool incoming = false;
    int64_t timestamp = 0; // epoch milliseconds, 0 = unset
    MessageStatus status = MessageStatus::Sent;
    nlohmann::json extra = nlohmann::json::object(); // server-assigned fields
};

// Order-independent conversation key: the two identities sorted ascending
// (numerically when both are integers) and joined with '_'. A chat with
// oneself yields "a_a". Returns "" if either identity is empty.
std::string canonical_conversation_id(const std::string& a, const std::string& b);

// Durable (cache) representation. Timestamps are ISO 8601 strings.
nlohmann::json message_to_json(const ChatMessage& msg);
ChatMessage message_from_json(const nlohmann::json& item);

// Merge a status patch into msg. Keys content/timestamp/from/to update the
// matching fields; any other key lands in msg.extra.
void apply_patch(ChatMessage& msg, const nlohmann::json& patch);

// Read a timestamp given as ISO 8601 string or epoch milliseconds.
std::optional<int64_t> timestamp_from_json(const nlohmann::json& value);

// Read an identity given as JSON string or number.
std::string identity_from_json(const nlohmann::json& value);

} // namespace chatlink

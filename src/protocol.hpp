#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace chatlink {

// Wire frames are JSON objects tagged by a single top-level key.
namespace frame_tags {
    constexpr const char* DirectMessage       = "DirectMessage";
    constexpr const char* MessageAck          = "MessageAck";
    constexpr const char* ChatHistory         = "ChatHistory";
    constexpr const char* ChatHistoryResponse = "ChatHistoryResponse";
} // namespace frame_tags

// Ack status the server sends once a message is stored.
constexpr const char* kAckPersisted = "Persisted";

struct DirectMessageFrame {
    std::string from;
    std::string to;
    std::string content;
    std::string message_id;
    std::optional<int64_t> timestamp; // epoch ms
};

struct HistoryPageFrame {
    std::optional<std::string> conversation_id;
    std::vector<DirectMessageFrame> messages;
    bool has_more = false;
    std::optional<std::string> next_cursor;
};

struct MessageAckFrame {
    std::string message_id;
    std::string status;
};

using InboundFrame = std::variant<DirectMessageFrame, HistoryPageFrame, MessageAckFrame>;

// Parse one inbound text frame. Returns nullopt (and fills *error when
// given) for malformed JSON, unknown tags or missing required fields.
std::optional<InboundFrame> parse_inbound_frame(const std::string& text,
                                                std::string* error = nullptr);

// Outbound frames. Integer identities are encoded as JSON numbers.
std::string encode_direct_message(const std::string& from, const std::string& to,
                                  const std::string& content,
                                  const std::string& message_id);

std::string encode_history_request(const std::string& conversation_id,
                                   const std::optional<std::string>& cursor);

} // namespace chatlink

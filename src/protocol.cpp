#include "protocol.hpp"
#include "message.hpp"
#include "util.hpp"
#include <nlohmann/json.hpp>

namespace chatlink {

using json = nlohmann::json;

namespace {

void set_error(std::string* error, const std::string& msg) {
    if (error) *error = msg;
}

json identity_to_json(const std::string& id) {
    if (is_integer(id)) {
        try {
            return std::stoll(id);
        } catch (const std::out_of_range&) {
            // falls through to string form
        }
    }
    return id;
}

std::optional<DirectMessageFrame> direct_message_from_json(const json& body,
                                                           std::string* error) {
    if (!body.is_object()) {
        set_error(error, "DirectMessage body is not an object");
        return std::nullopt;
    }
    DirectMessageFrame dm;
    if (body.contains("from")) dm.from = identity_from_json(body["from"]);
    if (body.contains("to")) dm.to = identity_from_json(body["to"]);
    if (dm.from.empty() || dm.to.empty()) {
        set_error(error, "DirectMessage missing from/to");
        return std::nullopt;
    }
    if (body.contains("content") && body["content"].is_string())
        dm.content = body["content"].get<std::string>();
    if (body.contains("message_id") && body["message_id"].is_string())
        dm.message_id = body["message_id"].get<std::string>();
    if (body.contains("timestamp") && !body["timestamp"].is_null())
        dm.timestamp = timestamp_from_json(body["timestamp"]);
    return dm;
}

} // namespace

std::optional<InboundFrame> parse_inbound_frame(const std::string& text, std::string* error) {
    json j;
    try {
        j = json::parse(text);
    } catch (const json::parse_error& e) {
        set_error(error, std::string("malformed JSON: ") + e.what());
        return std::nullopt;
    }

    if (!j.is_object() || j.size() != 1) {
        set_error(error, "frame must be an object with exactly one tag");
        return std::nullopt;
    }

    auto first = j.begin();
    const std::string tag = first.key();
    const json& body = first.value();

    if (tag == frame_tags::DirectMessage) {
        auto dm = direct_message_from_json(body, error);
        if (!dm) return std::nullopt;
        return InboundFrame{std::move(*dm)};
    }

    if (tag == frame_tags::MessageAck) {
        if (!body.is_object() || !body.contains("message_id") ||
            !body["message_id"].is_string()) {
            set_error(error, "MessageAck missing message_id");
            return std::nullopt;
        }
        MessageAckFrame ack;
        ack.message_id = body["message_id"].get<std::string>();
        if (body.contains("status") && body["status"].is_string())
            ack.status = body["status"].get<std::string>();
        return InboundFrame{std::move(ack)};
    }

    if (tag == frame_tags::ChatHistoryResponse) {
        if (!body.is_object() || !body.contains("messages") || !body["messages"].is_array()) {
            set_error(error, "ChatHistoryResponse missing messages array");
            return std::nullopt;
        }
        HistoryPageFrame page;
        if (body.contains("conversation_id") && body["conversation_id"].is_string())
            page.conversation_id = body["conversation_id"].get<std::string>();
        for (const auto& item : body["messages"]) {
            // History entries may be bare or wrapped in their own tag.
            const json& inner = (item.is_object() && item.contains(frame_tags::DirectMessage))
                ? item[frame_tags::DirectMessage] : item;
            std::string item_error;
            auto dm = direct_message_from_json(inner, &item_error);
            if (!dm || dm->message_id.empty()) continue;
            page.messages.push_back(std::move(*dm));
        }
        if (body.contains("has_more") && body["has_more"].is_boolean())
            page.has_more = body["has_more"].get<bool>();
        if (body.contains("next_cursor") && body["next_cursor"].is_string())
            page.next_cursor = body["next_cursor"].get<std::string>();
        return InboundFrame{std::move(page)};
    }

    set_error(error, "unknown frame tag: " + tag);
    return std::nullopt;
}

std::string encode_direct_message(const std::string& from, const std::string& to,
                                  const std::string& content,
                                  const std::string& message_id) {
    json frame = {
        {frame_tags::DirectMessage, {
            {"from", identity_to_json(from)},
            {"to", identity_to_json(to)},
            {"content", content},
            {"message_id", message_id}
        }}
    };
    return frame.dump(-1, ' ', false, json::error_handler_t::replace);
}

std::string encode_history_request(const std::string& conversation_id,
                                   const std::optional<std::string>& cursor) {
    json body = {{"conversation_id", conversation_id}};
    if (cursor) body["message_id"] = *cursor;
    json frame = {{frame_tags::ChatHistory, body}};
    return frame.dump(-1, ' ', false, json::error_handler_t::replace);
}

} // namespace chatlink

#include "message.hpp"
#include "util.hpp"
#include <cmath>
#include <limits>

namespace chatlink {

std::string status_to_string(MessageStatus status) {
    switch (status) {
        case MessageStatus::Sent:    return "sent";
        case MessageStatus::Pending: return "pending";
        case MessageStatus::Failed:  return "failed";
    }
    return "sent";
}

std::optional<MessageStatus> status_from_string(const std::string& s) {
    if (s == "sent") return MessageStatus::Sent;
    if (s == "pending") return MessageStatus::Pending;
    if (s == "failed") return MessageStatus::Failed;
    return std::nullopt;
}

// Numeric comparison without overflow: shorter digit strings are smaller.
static bool integer_less(const std::string& a, const std::string& b) {
    bool neg_a = a[0] == '-';
    bool neg_b = b[0] == '-';
    if (neg_a != neg_b) return neg_a;

    auto strip = [](const std::string& s) {
        size_t i = (s[0] == '-' || s[0] == '+') ? 1 : 0;
        while (i + 1 < s.size() && s[i] == '0') ++i;
        return s.substr(i);
    };
    std::string da = strip(a);
    std::string db = strip(b);
    bool less = da.size() != db.size() ? da.size() < db.size() : da < db;
    if (neg_a) return da != db && !less;
    return less;
}

std::string canonical_conversation_id(const std::string& a, const std::string& b) {
    if (a.empty() || b.empty()) return "";

    bool a_first;
    if (is_integer(a) && is_integer(b)) {
        a_first = !integer_less(b, a);
    } else {
        a_first = a <= b;
    }
    return a_first ? a + "_" + b : b + "_" + a;
}

nlohmann::json message_to_json(const ChatMessage& msg) {
    nlohmann::json item = {
        {"id", msg.id},
        {"from", msg.from},
        {"to", msg.to},
        {"content", msg.content},
        {"incoming", msg.incoming},
        {"timestamp", format_iso8601(msg.timestamp)},
        {"status", status_to_string(msg.status)}
    };
    if (!msg.extra.empty()) {
        item["extra"] = msg.extra;
    }
    return item;
}

ChatMessage message_from_json(const nlohmann::json& item) {
    ChatMessage msg;
    msg.id = item.value("id", "");
    if (item.contains("from")) msg.from = identity_from_json(item["from"]);
    if (item.contains("to")) msg.to = identity_from_json(item["to"]);
    msg.content = item.value("content", "");
    msg.incoming = item.value("incoming", false);
    if (item.contains("timestamp")) {
        msg.timestamp = timestamp_from_json(item["timestamp"]).value_or(0);
    }
    msg.status = status_from_string(item.value("status", "sent")).value_or(MessageStatus::Sent);
    if (item.contains("extra") && item["extra"].is_object()) {
        msg.extra = item["extra"];
    }
    return msg;
}

void apply_patch(ChatMessage& msg, const nlohmann::json& patch) {
    if (!patch.is_object()) return;
    for (const auto& [key, value] : patch.items()) {
        if (key == "content" && value.is_string()) {
            msg.content = value.get<std::string>();
        } else if (key == "timestamp") {
            if (auto ts = timestamp_from_json(value)) msg.timestamp = *ts;
        } else if (key == "from") {
            msg.from = identity_from_json(value);
        } else if (key == "to") {
            msg.to = identity_from_json(value);
        } else if (key == "id" || key == "status") {
            continue; // identity and bucket are owned by the cache
        } else {
            msg.extra[key] = value;
        }
    }
}

std::optional<int64_t> timestamp_from_json(const nlohmann::json& value) {
    if (value.is_number_unsigned()) {
        uint64_t v = value.get<uint64_t>();
        if (v > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) return std::nullopt;
        return static_cast<int64_t>(v);
    }
    if (value.is_number_integer()) return value.get<int64_t>();
    if (value.is_number()) {
        // 2^63 is exactly representable; anything at or above it does not fit.
        double d = value.get<double>();
        if (!std::isfinite(d) || d < -9223372036854775808.0 || d >= 9223372036854775808.0)
            return std::nullopt;
        return static_cast<int64_t>(d);
    }
    if (value.is_string()) return parse_iso8601(value.get<std::string>());
    return std::nullopt;
}

std::string identity_from_json(const nlohmann::json& value) {
    if (value.is_string()) return value.get<std::string>();
    if (value.is_number_unsigned()) return std::to_string(value.get<uint64_t>());
    if (value.is_number_integer()) return std::to_string(value.get<int64_t>());
    return "";
}

} // namespace chatlink

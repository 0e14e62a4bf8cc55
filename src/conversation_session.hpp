#pragma once
#include "connection_manager.hpp"
#include "event_loop.hpp"
#include "message_cache.hpp"
#include "protocol.hpp"
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace chatlink {

struct SessionConfig {
    int64_t ack_timeout_ms = 30000;
    int64_t mark_read_debounce_ms = 100;
};

// Everything a chat view renders for the active conversation.
struct SessionView {
    std::string chat_id;
    std::vector<ChatMessage> confirmed;
    std::vector<ChatMessage> pending;
    std::vector<ChatMessage> failed;
    std::vector<ChatMessage> all;
    bool is_loading = false;
    std::optional<std::string> error;
    bool has_more = true;
    ConnectionState connection_state = ConnectionState::Disconnected;

    bool empty() const { return confirmed.empty() && pending.empty() && failed.empty(); }
};

struct MessageCounts {
    size_t confirmed = 0;
    size_t pending = 0;
    size_t failed = 0;
    size_t total = 0;
};

// Binds one user's chat UI to the connection and the cache: optimistic
// sends with per-message delivery timers, inbound dispatch, and history
// paging for the active conversation.
class ConversationSession {
public:
    ConversationSession(ConnectionManager& connection, MessageCache& cache, EventLoop& loop,
                        std::string self_id, SessionConfig config = {});
    ~ConversationSession();

    ConversationSession(const ConversationSession&) = delete;
    ConversationSession& operator=(const ConversationSession&) = delete;

    // Switch the foreground conversation to the one with peer_id.
    void open_conversation(const std::string& peer_id);
    void close_conversation();

    // Returns the new message id, or nullopt for blank content / no conversation.
    std::optional<std::string> send(const std::string& content);

    // Resend a failed message with its original id.
    bool retry(const std::string& message_id);

    // Request the next older page. False when nothing can be requested.
    bool load_more_history();

    void mark_as_read();

    const std::string& self_id() const { return self_id_; }
    const std::string& active_chat_id() const { return chat_id_; }
    const std::string& active_peer() const { return peer_id_; }

    SessionView view();
    MessageCounts message_counts();
    std::optional<ChatMetadata> chat_metadata() const;

    // Called after anything the view shows may have changed.
    void set_view_listener(std::function<void(const SessionView&)> listener);

    size_t outstanding_deliveries() const { return delivery_timers_.size(); }

private:
    struct Delivery {
        TimerId timer;
        std::string chat_id;
    };

    // In-flight history request; reset to abort it.
    struct PageLoad {
        std::string chat_id;
        TimerId timeout;
    };

    void on_frame(const InboundFrame& frame);
    void handle(const DirectMessageFrame& dm);
    void handle(const HistoryPageFrame& page);
    void handle(const MessageAckFrame& ack);

    bool transmit(const ChatMessage& msg);
    void arm_delivery_timer(const std::string& chat_id, const std::string& message_id);
    void cancel_delivery_timer(const std::string& message_id);
    void abort_page_load();
    void schedule_mark_read();
    void cancel_mark_read();
    void refresh_view();

    ConnectionManager& connection_;
    MessageCache& cache_;
    EventLoop& loop_;
    std::string self_id_;
    SessionConfig config_;

    std::string peer_id_;
    std::string chat_id_;
    std::optional<std::string> error_;
    std::optional<PageLoad> page_load_;
    std::optional<TimerId> mark_read_timer_;
    std::unordered_map<std::string, Delivery> delivery_timers_;

    std::function<void(const SessionView&)> view_listener_;
    Unsubscribe unsubscribe_frames_;
    Unsubscribe unsubscribe_connection_;
    Unsubscribe unsubscribe_cache_;

    std::shared_ptr<bool> alive_ = std::make_shared<bool>(true);
};

} // namespace chatlink

#include "conversation_session.hpp"
#include "util.hpp"
#include <algorithm>
#include <iostream>

namespace chatlink {

namespace {

ChatMessage message_from_frame(const DirectMessageFrame& dm, const std::string& self_id,
                               int64_t now_ms) {
    ChatMessage msg;
    msg.id = dm.message_id;
    msg.from = dm.from;
    msg.to = dm.to;
    msg.content = dm.content;
    msg.incoming = dm.from != self_id;
    msg.timestamp = dm.timestamp.value_or(now_ms);
    msg.status = MessageStatus::Sent;
    return msg;
}

} // namespace

ConversationSession::ConversationSession(ConnectionManager& connection, MessageCache& cache,
                                         EventLoop& loop, std::string self_id,
                                         SessionConfig config)
    : connection_(connection), cache_(cache), loop_(loop),
      self_id_(std::move(self_id)), config_(config) {
    unsubscribe_frames_ = connection_.add_message_handler(
        [this](const InboundFrame& frame) { on_frame(frame); });
    unsubscribe_connection_ = connection_.add_connection_handler(
        [this](ConnectionState, const ConnectionEvent&) { refresh_view(); });
    unsubscribe_cache_ = cache_.add_observer([this](const std::string& chat_id) {
        if (!chat_id_.empty() && chat_id == chat_id_) refresh_view();
    });
}

ConversationSession::~ConversationSession() {
    unsubscribe_frames_();
    unsubscribe_connection_();
    unsubscribe_cache_();

    for (const auto& [id, delivery] : delivery_timers_) loop_.cancel(delivery.timer);
    delivery_timers_.clear();
    cancel_mark_read();
    if (page_load_) loop_.cancel(page_load_->timeout);
}

// ── Conversation switching ───────────────────────────────────

void ConversationSession::open_conversation(const std::string& peer_id) {
    std::string next = canonical_conversation_id(self_id_, peer_id);
    if (next.empty()) {
        std::cerr << "[session] cannot open conversation without both identities\n";
        return;
    }

    if (!chat_id_.empty() && chat_id_ != next) {
        abort_page_load();
        cancel_mark_read();
        cache_.clear_chat_memory(chat_id_);
    }

    peer_id_ = peer_id;
    chat_id_ = next;
    error_.reset();

    cache_.preload_chat(chat_id_);
    schedule_mark_read();
    refresh_view();
}

void ConversationSession::close_conversation() {
    abort_page_load();
    cancel_mark_read();
    peer_id_.clear();
    chat_id_.clear();
    error_.reset();
    refresh_view();
}

// ── Sending ──────────────────────────────────────────────────

bool ConversationSession::transmit(const ChatMessage& msg) {
    try {
        connection_.send_message(encode_direct_message(msg.from, msg.to, msg.content, msg.id));
        return true;
    } catch (const TransportError& e) {
        std::cerr << "[session] send of " << msg.id << " failed: " << e.what() << "\n";
        return false;
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "[session] could not encode " << msg.id << ": " << e.what() << "\n";
        return false;
    }
}

std::optional<std::string> ConversationSession::send(const std::string& content) {
    if (chat_id_.empty() || trim(content).empty()) return std::nullopt;

    ChatMessage msg;
    msg.id = generate_uuid();
    msg.from = self_id_;
    msg.to = peer_id_;
    msg.content = content;
    msg.incoming = false;
    msg.timestamp = loop_.now_ms();
    msg.status = MessageStatus::Pending;

    std::string chat_id = chat_id_;
    cache_.add_message(chat_id, msg);

    if (transmit(msg)) {
        arm_delivery_timer(chat_id, msg.id);
    } else {
        cache_.update_message_status(chat_id, msg.id, MessageStatus::Failed);
    }
    return msg.id;
}

bool ConversationSession::retry(const std::string& message_id) {
    if (chat_id_.empty()) return false;

    auto snap = cache_.get_all_messages(chat_id_);
    auto it = std::find_if(snap.failed.begin(), snap.failed.end(),
                           [&message_id](const ChatMessage& m) { return m.id == message_id; });
    if (it == snap.failed.end()) return false;

    std::string chat_id = chat_id_;
    ChatMessage msg = *it;
    cache_.update_message_status(chat_id, message_id, MessageStatus::Pending);

    if (transmit(msg)) {
        arm_delivery_timer(chat_id, message_id);
    } else {
        cache_.update_message_status(chat_id, message_id, MessageStatus::Failed);
    }
    return true;
}

void ConversationSession::arm_delivery_timer(const std::string& chat_id,
                                             const std::string& message_id) {
    cancel_delivery_timer(message_id);
    std::weak_ptr<bool> alive = alive_;
    TimerId timer = loop_.schedule(config_.ack_timeout_ms, [this, alive, chat_id, message_id]() {
        if (alive.expired()) return;
        delivery_timers_.erase(message_id);
        if (cache_.update_message_status(chat_id, message_id, MessageStatus::Failed)) {
            std::cerr << "[session] no acknowledgment for " << message_id << "\n";
        }
    });
    delivery_timers_[message_id] = Delivery{timer, chat_id};
}

void ConversationSession::cancel_delivery_timer(const std::string& message_id) {
    auto it = delivery_timers_.find(message_id);
    if (it == delivery_timers_.end()) return;
    loop_.cancel(it->second.timer);
    delivery_timers_.erase(it);
}

// ── Inbound dispatch ─────────────────────────────────────────

void ConversationSession::on_frame(const InboundFrame& frame) {
    std::visit([this](const auto& f) { handle(f); }, frame);
}

void ConversationSession::handle(const DirectMessageFrame& dm) {
    if (dm.message_id.empty()) return;
    if (dm.from != self_id_ && dm.to != self_id_) return;

    const std::string& other = dm.from == self_id_ ? dm.to : dm.from;
    std::string chat_id = canonical_conversation_id(self_id_, other);
    ChatMessage msg = message_from_frame(dm, self_id_, loop_.now_ms());
    bool incoming = msg.incoming;
    cache_.add_message(chat_id, std::move(msg));

    if (incoming && chat_id == chat_id_) schedule_mark_read();
}

void ConversationSession::handle(const MessageAckFrame& ack) {
    std::string chat_id;
    auto it = delivery_timers_.find(ack.message_id);
    if (it != delivery_timers_.end()) {
        chat_id = it->second.chat_id;
        loop_.cancel(it->second.timer);
        delivery_timers_.erase(it);
    } else {
        // Late ack: the timer already fired and the message sits in failed.
        chat_id = chat_id_;
    }
    if (chat_id.empty()) return;

    nlohmann::json patch = {{"ack_status", ack.status}};
    cache_.update_message_status(chat_id, ack.message_id, MessageStatus::Sent, patch);
}

void ConversationSession::handle(const HistoryPageFrame& page) {
    if (!page_load_) return;
    if (page_load_->chat_id != chat_id_) return;
    if (page.conversation_id && *page.conversation_id != page_load_->chat_id) return;

    std::string chat_id = page_load_->chat_id;
    loop_.cancel(page_load_->timeout);
    page_load_.reset();

    std::vector<ChatMessage> older;
    older.reserve(page.messages.size());
    int64_t now = loop_.now_ms();
    for (const auto& dm : page.messages) {
        older.push_back(message_from_frame(dm, self_id_, now));
    }
    std::stable_sort(older.begin(), older.end(),
                     [](const ChatMessage& a, const ChatMessage& b) {
                         return a.timestamp < b.timestamp;
                     });

    if (!older.empty()) cache_.add_messages(chat_id, std::move(older), true);
    cache_.update_pagination_state(chat_id, page.has_more, page.next_cursor);
    cache_.set_history_loading_state(chat_id, false);
    error_.reset();
    refresh_view();
}

// ── History paging ───────────────────────────────────────────

bool ConversationSession::load_more_history() {
    if (chat_id_.empty()) return false;

    auto pagination = cache_.get_pagination_state(chat_id_);
    if (!pagination.has_more || pagination.is_loading || page_load_) return false;

    std::string chat_id = chat_id_;
    cache_.set_history_loading_state(chat_id, true);
    try {
        connection_.send_message(encode_history_request(chat_id, pagination.next_cursor));
    } catch (const TransportError& e) {
        cache_.set_history_loading_state(chat_id, false);
        error_ = std::string("Failed to load history: ") + e.what();
        refresh_view();
        return false;
    }

    std::weak_ptr<bool> alive = alive_;
    TimerId timeout = loop_.schedule(config_.ack_timeout_ms, [this, alive, chat_id]() {
        if (alive.expired()) return;
        if (!page_load_ || page_load_->chat_id != chat_id) return;
        page_load_.reset();
        cache_.set_history_loading_state(chat_id, false);
        error_ = "History request timed out";
        refresh_view();
    });
    page_load_ = PageLoad{chat_id, timeout};
    error_.reset();
    refresh_view();
    return true;
}

void ConversationSession::abort_page_load() {
    if (!page_load_) return;
    loop_.cancel(page_load_->timeout);
    cache_.set_history_loading_state(page_load_->chat_id, false);
    page_load_.reset();
}

// ── Read state ───────────────────────────────────────────────

void ConversationSession::mark_as_read() {
    if (chat_id_.empty()) return;
    cancel_mark_read();
    cache_.mark_chat_as_read(chat_id_);
}

void ConversationSession::schedule_mark_read() {
    cancel_mark_read();
    std::weak_ptr<bool> alive = alive_;
    std::string chat_id = chat_id_;
    mark_read_timer_ = loop_.schedule(config_.mark_read_debounce_ms, [this, alive, chat_id]() {
        if (alive.expired()) return;
        mark_read_timer_.reset();
        if (chat_id == chat_id_) cache_.mark_chat_as_read(chat_id);
    });
}

void ConversationSession::cancel_mark_read() {
    if (mark_read_timer_) {
        loop_.cancel(*mark_read_timer_);
        mark_read_timer_.reset();
    }
}

// ── View ─────────────────────────────────────────────────────

SessionView ConversationSession::view() {
    SessionView v;
    v.chat_id = chat_id_;
    v.error = error_;
    v.connection_state = connection_.state();
    if (chat_id_.empty()) return v;

    auto snap = cache_.get_all_messages(chat_id_);
    v.all = snap.all();
    v.confirmed = std::move(snap.confirmed);
    v.pending = std::move(snap.pending);
    v.failed = std::move(snap.failed);

    auto pagination = cache_.get_pagination_state(chat_id_);
    v.is_loading = pagination.is_loading;
    v.has_more = pagination.has_more;
    return v;
}

MessageCounts ConversationSession::message_counts() {
    MessageCounts counts;
    if (chat_id_.empty()) return counts;
    auto snap = cache_.get_all_messages(chat_id_);
    counts.confirmed = snap.confirmed.size();
    counts.pending = snap.pending.size();
    counts.failed = snap.failed.size();
    counts.total = snap.total();
    return counts;
}

std::optional<ChatMetadata> ConversationSession::chat_metadata() const {
    if (chat_id_.empty()) return std::nullopt;
    return cache_.get_chat_metadata(chat_id_);
}

void ConversationSession::set_view_listener(std::function<void(const SessionView&)> listener) {
    view_listener_ = std::move(listener);
}

void ConversationSession::refresh_view() {
    if (!view_listener_) return;
    view_listener_(view());
}

} // namespace chatlink

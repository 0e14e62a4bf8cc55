#include "message_cache.hpp"
#include "util.hpp"
#include <algorithm>
#include <iostream>

namespace chatlink {

using json = nlohmann::json;

static constexpr int64_t kMillisPerDay = 24LL * 60 * 60 * 1000;

// ── JSON conversion ──────────────────────────────────────────

static json optional_string_to_json(const std::optional<std::string>& v) {
    return v ? json(*v) : json(nullptr);
}

static std::optional<std::string> optional_string_from_json(const json& obj, const char* key) {
    if (obj.contains(key) && obj[key].is_string()) return obj[key].get<std::string>();
    return std::nullopt;
}

static json metadata_to_json(const ChatMetadata& m) {
    return {
        {"lastAccessed", format_iso8601(m.last_accessed)},
        {"lastMessageTime", format_iso8601(m.last_message_time)},
        {"messageCount", m.message_count},
        {"unreadCount", m.unread_count},
        {"hasUnread", m.has_unread},
        {"isPinned", m.pinned},
        {"hasMore", m.has_more},
        {"nextCursor", optional_string_to_json(m.next_cursor)},
        {"historyLoaded", m.history_loaded}
    };
}

static ChatMetadata metadata_from_json(const json& j) {
    ChatMetadata m;
    if (j.contains("lastAccessed"))
        m.last_accessed = timestamp_from_json(j["lastAccessed"]).value_or(0);
    if (j.contains("lastMessageTime"))
        m.last_message_time = timestamp_from_json(j["lastMessageTime"]).value_or(0);
    m.message_count = j.value("messageCount", static_cast<size_t>(0));
    m.unread_count = j.value("unreadCount", 0u);
    m.has_unread = j.value("hasUnread", false);
    m.pinned = j.value("isPinned", false);
    m.has_more = j.value("hasMore", true);
    m.next_cursor = optional_string_from_json(j, "nextCursor");
    m.history_loaded = j.value("historyLoaded", false);
    return m;
}

static json messages_to_json(const std::vector<ChatMessage>& msgs) {
    json arr = json::array();
    for (const auto& m : msgs) arr.push_back(message_to_json(m));
    return arr;
}

static std::vector<ChatMessage> messages_from_json(const json& j, const char* key) {
    std::vector<ChatMessage> out;
    if (!j.contains(key) || !j[key].is_array()) return out;
    for (const auto& item : j[key]) {
        if (!item.is_object()) continue;
        out.push_back(message_from_json(item));
    }
    return out;
}

static bool contains_id(const std::vector<ChatMessage>& msgs, const std::string& id) {
    return std::any_of(msgs.begin(), msgs.end(),
                       [&id](const ChatMessage& m) { return m.id == id; });
}

std::vector<ChatMessage> MessageSnapshot::all() const {
    std::vector<ChatMessage> merged;
    merged.reserve(total());
    merged.insert(merged.end(), confirmed.begin(), confirmed.end());
    merged.insert(merged.end(), pending.begin(), pending.end());
    merged.insert(merged.end(), failed.begin(), failed.end());
    std::stable_sort(merged.begin(), merged.end(),
                     [](const ChatMessage& a, const ChatMessage& b) {
                         return a.timestamp < b.timestamp;
                     });
    return merged;
}

// ── Construction ─────────────────────────────────────────────

MessageCache::MessageCache(KvStore& store, EventLoop& loop, CacheOptions options)
    : store_(store), loop_(loop), options_(options) {
    load_metadata();
    if (remove_idle() > 0) save_metadata();
}

MessageCache::~MessageCache() {
    flush();
}

void MessageCache::load_metadata() {
    auto raw = store_.get(kMetadataKey);
    if (!raw) return;

    try {
        json j = json::parse(*raw);
        if (!j.is_object()) throw std::runtime_error("metadata is not an object");
        for (auto& [chat_id, value] : j.items()) {
            if (!value.is_object()) continue;
            metadata_[chat_id] = metadata_from_json(value);
        }
    } catch (const std::exception& e) {
        std::cerr << "[cache] Corrupt metadata, clearing cache: " << e.what() << "\n";
        metadata_.clear();
        store_.clear();
    }
}

std::optional<MessageCache::ChatRecord> MessageCache::load_chat(const std::string& chat_id) {
    auto raw = store_.get("chat_" + chat_id);
    if (!raw) return std::nullopt;

    try {
        json j = json::parse(*raw);
        if (!j.is_object()) throw std::runtime_error("record is not an object");
        ChatRecord rec;
        rec.chat_id = chat_id;
        rec.messages = messages_from_json(j, "messages");
        rec.pending = messages_from_json(j, "pendingMessages");
        rec.failed = messages_from_json(j, "failedMessages");
        if (j.contains("hasMore") && j["hasMore"].is_boolean())
            rec.has_more = j["hasMore"].get<bool>();
        rec.next_cursor = optional_string_from_json(j, "nextCursor");
        return rec;
    } catch (const std::exception& e) {
        std::cerr << "[cache] Corrupt record for chat " << chat_id << ": " << e.what() << "\n";
        recover_from_corruption();
        return std::nullopt;
    }
}

void MessageCache::recover_from_corruption() {
    std::cerr << "[cache] Clearing corrupted cache data\n";
    store_.clear();
    // Memory is authoritative: write back what we still hold.
    for (const auto& [chat_id, rec] : hot_) dirty_.insert(chat_id);
    metadata_dirty_ = true;
    flush();
}

MessageCache::ChatRecord* MessageCache::find_or_load(const std::string& chat_id) {
    auto it = hot_.find(chat_id);
    if (it == hot_.end()) {
        auto loaded = load_chat(chat_id);
        if (!loaded) return nullptr;
        it = hot_.emplace(chat_id, std::move(*loaded)).first;
        it->second.last_touch = ++touch_clock_;
        enforce_hot_limit(chat_id);
        return &it->second;
    }
    it->second.last_touch = ++touch_clock_;
    return &it->second;
}

MessageCache::ChatRecord& MessageCache::ensure_chat(const std::string& chat_id) {
    if (auto* rec = find_or_load(chat_id)) return *rec;
    ChatRecord fresh;
    fresh.chat_id = chat_id;
    fresh.last_touch = ++touch_clock_;
    auto& rec = hot_.emplace(chat_id, std::move(fresh)).first->second;
    enforce_hot_limit(chat_id);
    return rec;
}

void MessageCache::enforce_hot_limit(const std::string& keep) {
    // Flushing a victim may trigger emergency cleanup; it must not drop keep.
    protected_chat_ = keep;
    while (hot_.size() > options_.max_cached_chats) {
        auto victim = hot_.end();
        for (auto it = hot_.begin(); it != hot_.end(); ++it) {
            if (it->first == keep) continue;
            if (victim == hot_.end() || it->second.last_touch < victim->second.last_touch)
                victim = it;
        }
        if (victim == hot_.end()) break;
        std::string chat_id = victim->first;
        if (dirty_.count(chat_id)) save_chat(chat_id);
        hot_.erase(chat_id);
    }
    protected_chat_.clear();
}

// ── Metadata ─────────────────────────────────────────────────

ChatMetadata& MessageCache::metadata_for(const std::string& chat_id) {
    auto it = metadata_.find(chat_id);
    if (it == metadata_.end()) {
        it = metadata_.emplace(chat_id, ChatMetadata{}).first;
    }
    it->second.last_accessed = loop_.now_ms();
    metadata_dirty_ = true;
    schedule_flush();
    return it->second;
}

void MessageCache::touch(const std::string& chat_id) {
    metadata_for(chat_id);
}

ChatMetadata MessageCache::get_chat_metadata(const std::string& chat_id) const {
    auto it = metadata_.find(chat_id);
    if (it != metadata_.end()) return it->second;
    ChatMetadata fresh;
    fresh.last_accessed = loop_.now_ms();
    fresh.last_message_time = fresh.last_accessed;
    return fresh;
}

void MessageCache::set_pinned(const std::string& chat_id, bool pinned) {
    if (chat_id.empty()) return;
    metadata_for(chat_id).pinned = pinned;
    notify(chat_id);
}

std::vector<ConversationSummary> MessageCache::list_conversations() const {
    std::vector<ConversationSummary> out;
    out.reserve(metadata_.size());
    for (const auto& [chat_id, meta] : metadata_) out.push_back({chat_id, meta});
    std::stable_sort(out.begin(), out.end(),
                     [](const ConversationSummary& a, const ConversationSummary& b) {
                         return a.metadata.last_message_time > b.metadata.last_message_time;
                     });
    return out;
}

// ── Reads ────────────────────────────────────────────────────

std::vector<ChatMessage> MessageCache::get_messages(const std::string& chat_id) {
    if (chat_id.empty()) return {};
    auto* rec = find_or_load(chat_id);
    if (!rec) return {};
    touch(chat_id);
    return rec->messages;
}

MessageSnapshot MessageCache::get_all_messages(const std::string& chat_id) {
    MessageSnapshot snap;
    if (chat_id.empty()) return snap;
    auto* rec = find_or_load(chat_id);
    if (!rec) return snap;
    snap.confirmed = rec->messages;
    snap.pending = rec->pending;
    snap.failed = rec->failed;
    return snap;
}

// ── Writes ───────────────────────────────────────────────────

void MessageCache::normalize(ChatMessage& msg) {
    if (msg.id.empty()) {
        msg.id = "msg_" + std::to_string(loop_.now_ms()) + "_" + generate_id().substr(0, 9);
    }
    if (msg.timestamp == 0) msg.timestamp = loop_.now_ms();
}

void MessageCache::insert_confirmed(ChatRecord& rec, ChatMessage msg) {
    auto pos = std::upper_bound(rec.messages.begin(), rec.messages.end(), msg.timestamp,
                                [](int64_t ts, const ChatMessage& m) { return ts < m.timestamp; });
    rec.messages.insert(pos, std::move(msg));
    if (rec.messages.size() > options_.max_messages_per_chat) {
        size_t excess = rec.messages.size() - options_.max_messages_per_chat;
        rec.messages.erase(rec.messages.begin(),
                           rec.messages.begin() + static_cast<std::ptrdiff_t>(excess));
    }
}

bool MessageCache::add_message(const std::string& chat_id, ChatMessage msg) {
    if (chat_id.empty()) return false;
    normalize(msg);

    auto& rec = ensure_chat(chat_id);
    if (contains_id(rec.messages, msg.id) || contains_id(rec.pending, msg.id) ||
        contains_id(rec.failed, msg.id)) {
        return true;
    }

    bool incoming = msg.incoming;
    int64_t ts = msg.timestamp;
    switch (msg.status) {
        case MessageStatus::Pending: rec.pending.push_back(std::move(msg)); break;
        case MessageStatus::Failed:  rec.failed.push_back(std::move(msg)); break;
        case MessageStatus::Sent:    insert_confirmed(rec, std::move(msg)); break;
    }

    auto& meta = metadata_for(chat_id);
    meta.last_message_time = std::max(meta.last_message_time, ts);
    meta.message_count = rec.messages.size();
    if (incoming) {
        meta.has_unread = true;
        meta.unread_count += 1;
    }

    schedule_save(chat_id);
    notify(chat_id);
    return true;
}

bool MessageCache::add_messages(const std::string& chat_id, std::vector<ChatMessage> msgs,
                                bool prepend) {
    if (chat_id.empty() || msgs.empty()) return false;

    auto& rec = ensure_chat(chat_id);

    std::set<std::string> seen;
    for (const auto& m : rec.messages) seen.insert(m.id);
    for (const auto& m : rec.pending) seen.insert(m.id);
    for (const auto& m : rec.failed) seen.insert(m.id);

    std::vector<ChatMessage> fresh;
    int64_t newest = 0;
    for (auto& m : msgs) {
        normalize(m);
        if (!seen.insert(m.id).second) continue;
        newest = std::max(newest, m.timestamp);
        fresh.push_back(std::move(m));
    }
    if (fresh.empty()) return true;

    if (prepend) {
        rec.messages.insert(rec.messages.begin(), std::make_move_iterator(fresh.begin()),
                            std::make_move_iterator(fresh.end()));
    } else {
        rec.messages.insert(rec.messages.end(), std::make_move_iterator(fresh.begin()),
                            std::make_move_iterator(fresh.end()));
    }

    size_t limit = options_.max_messages_per_chat * 2;
    if (rec.messages.size() > limit) {
        size_t excess = rec.messages.size() - limit;
        rec.messages.erase(rec.messages.begin(),
                           rec.messages.begin() + static_cast<std::ptrdiff_t>(excess));
    }

    auto& meta = metadata_for(chat_id);
    meta.message_count = rec.messages.size();
    meta.last_message_time = std::max(meta.last_message_time, newest);

    schedule_save(chat_id);
    notify(chat_id);
    return true;
}

bool MessageCache::update_message_status(const std::string& chat_id,
                                         const std::string& message_id,
                                         MessageStatus status, const json& patch) {
    if (chat_id.empty() || message_id.empty()) return false;
    auto* rec = find_or_load(chat_id);
    if (!rec) return false;

    auto take = [&message_id](std::vector<ChatMessage>& bucket) -> std::optional<ChatMessage> {
        auto it = std::find_if(bucket.begin(), bucket.end(),
                               [&message_id](const ChatMessage& m) { return m.id == message_id; });
        if (it == bucket.end()) return std::nullopt;
        ChatMessage msg = std::move(*it);
        bucket.erase(it);
        return msg;
    };

    auto msg = take(rec->pending);
    if (!msg) msg = take(rec->failed);
    if (!msg) return false;

    apply_patch(*msg, patch);
    msg->status = status;
    switch (status) {
        case MessageStatus::Pending: rec->pending.push_back(std::move(*msg)); break;
        case MessageStatus::Failed:  rec->failed.push_back(std::move(*msg)); break;
        case MessageStatus::Sent:    insert_confirmed(*rec, std::move(*msg)); break;
    }

    metadata_for(chat_id).message_count = rec->messages.size();
    schedule_save(chat_id);
    notify(chat_id);
    return true;
}

// ── Pagination ───────────────────────────────────────────────

void MessageCache::set_history_loading_state(const std::string& chat_id, bool loading) {
    if (chat_id.empty()) return;
    ensure_chat(chat_id).is_loading_history = loading;
}

void MessageCache::update_pagination_state(const std::string& chat_id, bool has_more,
                                           const std::optional<std::string>& next_cursor) {
    if (chat_id.empty()) return;
    if (auto* rec = find_or_load(chat_id)) {
        rec->has_more = has_more;
        rec->next_cursor = next_cursor;
        schedule_save(chat_id);
    }
    auto& meta = metadata_for(chat_id);
    meta.has_more = has_more;
    meta.next_cursor = next_cursor;
    meta.history_loaded = !has_more;
}

PaginationState MessageCache::get_pagination_state(const std::string& chat_id) {
    PaginationState state;
    if (chat_id.empty()) return state;
    auto* rec = find_or_load(chat_id);
    auto meta_it = metadata_.find(chat_id);

    if (rec && rec->has_more) state.has_more = *rec->has_more;
    else if (meta_it != metadata_.end()) state.has_more = meta_it->second.has_more;

    if (rec && rec->next_cursor) state.next_cursor = rec->next_cursor;
    else if (meta_it != metadata_.end()) state.next_cursor = meta_it->second.next_cursor;

    state.is_loading = rec ? rec->is_loading_history : false;
    return state;
}

// ── Conversation lifecycle ───────────────────────────────────

void MessageCache::mark_chat_as_read(const std::string& chat_id) {
    if (chat_id.empty()) return;
    auto& meta = metadata_for(chat_id);
    meta.has_unread = false;
    meta.unread_count = 0;
    notify(chat_id);
}

void MessageCache::clear_chat_memory(const std::string& chat_id) {
    if (!hot_.count(chat_id)) return;
    save_chat(chat_id);
    hot_.erase(chat_id);
}

void MessageCache::preload_chat(const std::string& chat_id) {
    if (chat_id.empty() || hot_.count(chat_id)) return;
    find_or_load(chat_id);
}

CacheStats MessageCache::stats() {
    CacheStats s;
    s.memory_cache_size = hot_.size();
    s.total_chats = metadata_.size();
    s.storage_bytes = store_.usage_bytes();
    for (const auto& [chat_id, meta] : metadata_) {
        if (!s.oldest_access || meta.last_accessed < *s.oldest_access)
            s.oldest_access = meta.last_accessed;
        if (!s.newest_access || meta.last_accessed > *s.newest_access)
            s.newest_access = meta.last_accessed;
    }
    return s;
}

size_t MessageCache::remove_idle() {
    int64_t cutoff = loop_.now_ms() -
                     static_cast<int64_t>(options_.cleanup_threshold_days) * kMillisPerDay;
    std::vector<std::string> expired;
    for (const auto& [chat_id, meta] : metadata_) {
        if (meta.last_accessed < cutoff && !meta.pinned) expired.push_back(chat_id);
    }
    for (const auto& chat_id : expired) remove_chat(chat_id);
    if (!expired.empty()) {
        std::cerr << "[cache] Removed " << expired.size() << " idle conversation(s)\n";
    }
    return expired.size();
}

void MessageCache::cleanup() {
    remove_idle();
    save_metadata();
}

void MessageCache::clear_all() {
    hot_.clear();
    metadata_.clear();
    dirty_.clear();
    metadata_dirty_ = false;
    store_.clear();
}

void MessageCache::remove_chat(const std::string& chat_id) {
    store_.remove("chat_" + chat_id);
    metadata_.erase(chat_id);
    hot_.erase(chat_id);
    dirty_.erase(chat_id);
    metadata_dirty_ = true;
}

// ── Persistence ──────────────────────────────────────────────

void MessageCache::schedule_save(const std::string& chat_id) {
    dirty_.insert(chat_id);
    schedule_flush();
}

void MessageCache::schedule_flush() {
    if (flush_posted_) return;
    flush_posted_ = true;
    std::weak_ptr<bool> alive = alive_;
    loop_.post([this, alive]() {
        if (alive.expired()) return;
        flush_posted_ = false;
        flush();
    });
}

void MessageCache::flush() {
    std::set<std::string> pending;
    pending.swap(dirty_);
    for (const auto& chat_id : pending) save_chat(chat_id);
    if (metadata_dirty_) save_metadata();
}

void MessageCache::save_chat(const std::string& chat_id) {
    dirty_.erase(chat_id);
    auto it = hot_.find(chat_id);
    if (it == hot_.end()) return;
    const auto& rec = it->second;

    json j = {
        {"chatId", rec.chat_id},
        {"messages", messages_to_json(rec.messages)},
        {"pendingMessages", messages_to_json(rec.pending)},
        {"failedMessages", messages_to_json(rec.failed)},
        {"hasMore", rec.has_more ? json(*rec.has_more) : json(nullptr)},
        {"nextCursor", optional_string_to_json(rec.next_cursor)}
    };
    write_with_quota("chat_" + chat_id,
                     j.dump(-1, ' ', false, json::error_handler_t::replace), chat_id);
}

void MessageCache::save_metadata() {
    metadata_dirty_ = false;
    json j = json::object();
    for (const auto& [chat_id, meta] : metadata_) j[chat_id] = metadata_to_json(meta);
    write_with_quota(kMetadataKey, j.dump(-1, ' ', false, json::error_handler_t::replace), "");
}

void MessageCache::write_with_quota(const std::string& key, const std::string& value,
                                    const std::string& chat_id) {
    // Only conversation writes may evict; a metadata write never drops chats.
    bool may_evict = !chat_id.empty();
    try {
        if (may_evict && store_.usage_bytes() > options_.max_storage_bytes)
            emergency_cleanup(chat_id);
        store_.put(key, value);
        return;
    } catch (const StorageQuotaError& e) {
        std::cerr << "[cache] Storage quota exceeded writing " << key << ": " << e.what() << "\n";
        if (!may_evict) return;
    } catch (const std::runtime_error& e) {
        std::cerr << "[cache] Failed to write " << key << ": " << e.what() << "\n";
        return;
    }

    emergency_cleanup(chat_id);
    try {
        store_.put(key, value);
    } catch (const std::runtime_error& e) {
        std::cerr << "[cache] Dropping write of " << key << " after cleanup: " << e.what() << "\n";
    }
}

void MessageCache::emergency_cleanup(const std::string& keep) {
    std::vector<std::pair<int64_t, std::string>> by_access;
    for (const auto& [chat_id, meta] : metadata_) {
        if (chat_id == keep || chat_id == protected_chat_) continue;
        by_access.emplace_back(meta.last_accessed, chat_id);
    }
    std::sort(by_access.begin(), by_access.end());

    size_t total = metadata_.size();
    size_t to_remove = (total + 3) / 4;
    to_remove = std::min(to_remove, by_access.size());
    std::cerr << "[cache] Performing emergency cleanup of " << to_remove
              << " conversation(s)\n";
    for (size_t i = 0; i < to_remove; ++i) remove_chat(by_access[i].second);

    if (to_remove > 0 && !keep.empty()) {
        // Keep the stored metadata consistent with what was just dropped.
        json j = json::object();
        for (const auto& [chat_id, meta] : metadata_) j[chat_id] = metadata_to_json(meta);
        try {
            store_.put(kMetadataKey, j.dump(-1, ' ', false, json::error_handler_t::replace));
            metadata_dirty_ = false;
        } catch (const std::runtime_error& e) {
            std::cerr << "[cache] Failed to write metadata: " << e.what() << "\n";
        }
    }
}

// ── Observers ────────────────────────────────────────────────

Unsubscribe MessageCache::add_observer(CacheObserver observer) {
    uint64_t id = next_observer_id_++;
    observers_.push_back({id, std::move(observer)});
    std::weak_ptr<bool> alive = alive_;
    return [this, alive, id]() {
        if (alive.expired()) return;
        observers_.erase(std::remove_if(observers_.begin(), observers_.end(),
                                        [id](const ObserverEntry& o) { return o.id == id; }),
                         observers_.end());
    };
}

void MessageCache::notify(const std::string& chat_id) {
    auto snapshot = observers_;
    for (const auto& o : snapshot) {
        try {
            o.fn(chat_id);
        } catch (const std::exception& e) {
            std::cerr << "[cache] Observer threw: " << e.what() << "\n";
        }
    }
}

} // namespace chatlink

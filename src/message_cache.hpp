#pragma once
#include "event_loop.hpp"
#include "kv_store.hpp"
#include "message.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

namespace chatlink {

struct CacheOptions {
    size_t max_messages_per_chat = 100;
    size_t max_cached_chats = 30;
    size_t max_storage_bytes = 3 * 1024 * 1024;
    uint32_t cleanup_threshold_days = 30;
};

struct ChatMetadata {
    int64_t last_accessed = 0;      // epoch ms
    int64_t last_message_time = 0;  // epoch ms
    size_t message_count = 0;
    uint32_t unread_count = 0;
    bool has_unread = false;
    bool pinned = false;
    bool has_more = true;
    std::optional<std::string> next_cursor;
    bool history_loaded = false;
};

struct PaginationState {
    bool has_more = true;
    std::optional<std::string> next_cursor;
    bool is_loading = false;
};

// Point-in-time copy of one conversation's buckets.
struct MessageSnapshot {
    std::vector<ChatMessage> confirmed;
    std::vector<ChatMessage> pending;
    std::vector<ChatMessage> failed;

    // All three buckets merged, stably sorted by timestamp.
    std::vector<ChatMessage> all() const;
    size_t total() const { return confirmed.size() + pending.size() + failed.size(); }
    bool empty() const { return total() == 0; }
};

struct ConversationSummary {
    std::string chat_id;
    ChatMetadata metadata;
};

struct CacheStats {
    size_t memory_cache_size = 0;  // conversations in the hot tier
    size_t total_chats = 0;        // conversations with metadata
    size_t storage_bytes = 0;
    std::optional<int64_t> oldest_access;
    std::optional<int64_t> newest_access;
};

using CacheObserver = std::function<void(const std::string& chat_id)>;

// Per-conversation message store with an in-memory hot tier over a durable
// KvStore. Durable writes are deferred to the event loop; in-memory state is
// authoritative.
class MessageCache {
public:
    static constexpr const char* kNamespace = "msgcache_";
    static constexpr const char* kMetadataKey = "chat_metadata";

    MessageCache(KvStore& store, EventLoop& loop, CacheOptions options = {});
    ~MessageCache();

    MessageCache(const MessageCache&) = delete;
    MessageCache& operator=(const MessageCache&) = delete;

    // Confirmed messages, ascending by timestamp.
    std::vector<ChatMessage> get_messages(const std::string& chat_id);

    // Returns false only for an empty chat id. Duplicate ids are a no-op.
    bool add_message(const std::string& chat_id, ChatMessage msg);

    // History merge: ids already confirmed are skipped; no re-sort.
    bool add_messages(const std::string& chat_id, std::vector<ChatMessage> msgs,
                      bool prepend = true);

    // Move a pending or failed message into the bucket for status.
    bool update_message_status(const std::string& chat_id, const std::string& message_id,
                               MessageStatus status,
                               const nlohmann::json& patch = nlohmann::json::object());

    MessageSnapshot get_all_messages(const std::string& chat_id);

    void set_history_loading_state(const std::string& chat_id, bool loading);
    void update_pagination_state(const std::string& chat_id, bool has_more,
                                 const std::optional<std::string>& next_cursor);
    PaginationState get_pagination_state(const std::string& chat_id);

    void mark_chat_as_read(const std::string& chat_id);

    // Flush to the durable tier and drop from memory.
    void clear_chat_memory(const std::string& chat_id);

    // Hydrate the hot tier without touching metadata.
    void preload_chat(const std::string& chat_id);

    // Stored metadata, or fresh defaults for an unknown conversation.
    ChatMetadata get_chat_metadata(const std::string& chat_id) const;
    void set_pinned(const std::string& chat_id, bool pinned);

    // Newest activity first.
    std::vector<ConversationSummary> list_conversations() const;

    CacheStats stats();

    // Drop unpinned conversations idle longer than cleanup_threshold_days.
    void cleanup();

    void clear_all();

    // Write every dirty conversation and the metadata now.
    void flush();

    Unsubscribe add_observer(CacheObserver observer);

    bool is_in_memory(const std::string& chat_id) const { return hot_.count(chat_id) > 0; }
    const CacheOptions& options() const { return options_; }

private:
    struct ChatRecord {
        std::string chat_id;
        std::vector<ChatMessage> messages;
        std::vector<ChatMessage> pending;
        std::vector<ChatMessage> failed;
        std::optional<bool> has_more;
        std::optional<std::string> next_cursor;
        bool is_loading_history = false;
        uint64_t last_touch = 0;
    };

    void load_metadata();
    std::optional<ChatRecord> load_chat(const std::string& chat_id);
    ChatRecord* find_or_load(const std::string& chat_id);
    ChatRecord& ensure_chat(const std::string& chat_id);
    void enforce_hot_limit(const std::string& keep);

    ChatMetadata& metadata_for(const std::string& chat_id);
    void touch(const std::string& chat_id);

    void insert_confirmed(ChatRecord& rec, ChatMessage msg);
    void normalize(ChatMessage& msg);

    void schedule_save(const std::string& chat_id);
    void schedule_flush();
    void save_chat(const std::string& chat_id);
    void save_metadata();
    void write_with_quota(const std::string& key, const std::string& value,
                          const std::string& chat_id);
    void emergency_cleanup(const std::string& keep);
    void remove_chat(const std::string& chat_id);
    size_t remove_idle();
    void recover_from_corruption();

    void notify(const std::string& chat_id);

    KvStore& store_;
    EventLoop& loop_;
    CacheOptions options_;

    std::unordered_map<std::string, ChatRecord> hot_;
    std::map<std::string, ChatMetadata> metadata_;
    std::set<std::string> dirty_;
    bool metadata_dirty_ = false;
    bool flush_posted_ = false;
    uint64_t touch_clock_ = 0;
    std::string protected_chat_;

    struct ObserverEntry {
        uint64_t id;
        CacheObserver fn;
    };
    std::vector<ObserverEntry> observers_;
    uint64_t next_observer_id_ = 1;

    std::shared_ptr<bool> alive_ = std::make_shared<bool>(true);
};

} // namespace chatlink

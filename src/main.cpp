#include "app_context.hpp"
#include "config.hpp"
#include "conversation_session.hpp"
#include "util.hpp"
#include <unistd.h>
#include <atomic>
#include <csignal>
#include <cstring>
#include <iostream>
#include <string>
#include <unordered_map>

static std::atomic<bool> g_shutdown{false};

static void signal_handler(int /*sig*/) {
    g_shutdown.store(true);
}

static void print_usage() {
    std::cout << "Usage: chatlink [options]\n"
              << "\n"
              << "Options:\n"
              << "  --user ID            Identity to connect as (default: config user_id)\n"
              << "  --peer ID            Open the conversation with this user\n"
              << "  --url URL            Server base URL (ws:// or wss://)\n"
              << "  -h, --help           Show this help\n"
              << "\n"
              << "Interactive commands:\n"
              << "  /history             Load older messages\n"
              << "  /retry ID            Resend a failed message\n"
              << "  /status              Show connection and conversation state\n"
              << "  /reconnect           Force a fresh connection\n"
              << "  /disconnect          Close the connection\n"
              << "  /read                Mark the conversation as read\n"
              << "  /stats               Show cache statistics\n"
              << "  /cleanup             Drop idle cached conversations\n"
              << "  /peer ID             Switch conversation\n"
              << "  /help                Show available commands\n"
              << "  /quit, /exit         Exit\n"
              << "\n"
              << "Environment variables:\n"
              << "  CHATLINK_URL         Server base URL\n"
              << "  CHATLINK_USER_ID     Identity to connect as\n"
              << "  CHATLINK_STORE       Cache backend (sqlite, json, memory)\n"
              << "  CHATLINK_STORE_PATH  Cache file or directory\n";
}

namespace {

// Prints each message once, and again whenever its status changes.
class Transcript {
public:
    explicit Transcript(std::string self_id) : self_id_(std::move(self_id)) {}

    void render(const chatlink::SessionView& view) {
        if (view.chat_id != chat_id_) {
            chat_id_ = view.chat_id;
            shown_.clear();
        }
        for (const auto& msg : view.all) {
            auto it = shown_.find(msg.id);
            if (it != shown_.end() && it->second == msg.status) continue;
            bool update = it != shown_.end();
            shown_[msg.id] = msg.status;
            print(msg, update);
        }
        if (view.error && *view.error != last_error_) {
            std::cout << "! " << *view.error << "\n";
        }
        last_error_ = view.error.value_or("");
    }

private:
    void print(const chatlink::ChatMessage& msg, bool update) {
        std::string when = chatlink::format_iso8601(msg.timestamp);
        if (msg.incoming) {
            std::cout << "[" << when << "] " << msg.from << ": " << msg.content << "\n";
            return;
        }
        if (update) {
            std::cout << "  (" << msg.id << " " << chatlink::status_to_string(msg.status) << ")\n";
            return;
        }
        std::cout << "[" << when << "] " << self_id_ << ": " << msg.content;
        if (msg.status != chatlink::MessageStatus::Sent) {
            std::cout << "  (" << chatlink::status_to_string(msg.status) << ", id " << msg.id << ")";
        }
        std::cout << "\n";
    }

    std::string self_id_;
    std::string chat_id_;
    std::string last_error_;
    std::unordered_map<std::string, chatlink::MessageStatus> shown_;
};

void print_status(chatlink::AppContext& ctx, chatlink::ConversationSession& session) {
    auto& conn = *ctx.connection;
    std::cout << "Connection: " << chatlink::connection_state_name(conn.state()) << "\n"
              << "URL: " << conn.connection_url() << "\n"
              << "Reconnect attempts: " << conn.reconnect_attempts() << "\n";
    if (!conn.last_error().empty()) {
        std::cout << "Last error: " << conn.last_error() << "\n";
    }
    if (session.active_chat_id().empty()) {
        std::cout << "No conversation open.\n";
        return;
    }
    auto counts = session.message_counts();
    std::cout << "Conversation: " << session.active_chat_id() << "\n"
              << "Messages: " << counts.confirmed << " confirmed, "
              << counts.pending << " pending, " << counts.failed << " failed\n";
    if (auto meta = session.chat_metadata()) {
        std::cout << "Unread: " << meta->unread_count
                  << (meta->has_more ? " | older history available" : "") << "\n";
    }
}

void print_stats(chatlink::MessageCache& cache, const std::string& backend) {
    auto stats = cache.stats();
    std::cout << "Backend: " << backend << "\n"
              << "Conversations in memory: " << stats.memory_cache_size << "\n"
              << "Conversations stored: " << stats.total_chats << "\n"
              << "Storage used: " << stats.storage_bytes << " bytes\n";
    if (stats.oldest_access) {
        std::cout << "Oldest access: " << chatlink::format_iso8601(*stats.oldest_access) << "\n";
    }
    if (stats.newest_access) {
        std::cout << "Newest access: " << chatlink::format_iso8601(*stats.newest_access) << "\n";
    }
}

// Returns false when the user asked to quit.
bool handle_line(const std::string& raw, chatlink::AppContext& ctx,
                 chatlink::ConversationSession& session) {
    std::string line = chatlink::trim(raw);
    if (line.empty()) return true;

    if (line[0] != '/') {
        if (session.active_chat_id().empty()) {
            std::cout << "No conversation open. Use /peer ID first.\n";
        } else {
            session.send(line);
        }
        return true;
    }

    if (line == "/quit" || line == "/exit") {
        return false;
    } else if (line == "/status") {
        print_status(ctx, session);
    } else if (line == "/history") {
        if (!session.load_more_history()) {
            std::cout << "No more history to load.\n";
        }
    } else if (line.substr(0, 7) == "/retry ") {
        std::string id = chatlink::trim(line.substr(7));
        if (!session.retry(id)) {
            std::cout << "No failed message with id " << id << "\n";
        }
    } else if (line == "/reconnect") {
        ctx.connection->reconnect();
    } else if (line == "/disconnect") {
        ctx.connection->disconnect();
        std::cout << "Disconnected.\n";
    } else if (line == "/read") {
        session.mark_as_read();
    } else if (line == "/stats") {
        print_stats(*ctx.cache, ctx.store->backend_name());
    } else if (line == "/cleanup") {
        ctx.cache->cleanup();
        std::cout << "Cleanup done.\n";
    } else if (line.substr(0, 6) == "/peer ") {
        std::string peer = chatlink::trim(line.substr(6));
        session.open_conversation(peer);
        std::cout << "Conversation: " << session.active_chat_id() << "\n";
    } else if (line == "/help") {
        print_usage();
    } else {
        std::cout << "Unknown command: " << line << "\n";
    }
    return true;
}

} // namespace

int main(int argc, char* argv[]) try {
    std::string user_id;
    std::string peer_id;
    std::string url;

    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            print_usage();
            return 0;
        } else if (std::strcmp(argv[i], "--user") == 0 && i + 1 < argc) {
            user_id = argv[++i];
        } else if (std::strcmp(argv[i], "--peer") == 0 && i + 1 < argc) {
            peer_id = argv[++i];
        } else if (std::strcmp(argv[i], "--url") == 0 && i + 1 < argc) {
            url = argv[++i];
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage();
            return 1;
        }
    }

    auto config = chatlink::Config::load();
    if (!user_id.empty()) config.user_id = user_id;
    if (!url.empty()) config.connection.url = url;

    if (config.user_id.empty()) {
        std::cerr << "No user id. Pass --user ID or set CHATLINK_USER_ID.\n";
        return 1;
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    auto ctx = chatlink::AppContext::create(config);

    chatlink::SessionConfig session_config;
    session_config.ack_timeout_ms = config.session.ack_timeout_ms;
    session_config.mark_read_debounce_ms = config.session.mark_read_debounce_ms;
    chatlink::ConversationSession session(*ctx->connection, *ctx->cache, *ctx->loop,
                                          config.user_id, session_config);

    Transcript transcript(config.user_id);
    session.set_view_listener([&transcript](const chatlink::SessionView& view) {
        transcript.render(view);
    });

    auto unsubscribe = ctx->connection->add_connection_handler(
        [](chatlink::ConnectionState state, const chatlink::ConnectionEvent& ev) {
            std::cerr << "[connection] " << chatlink::connection_state_name(state);
            if (ev.close_code != 0) std::cerr << " (" << ev.close_code << ")";
            if (!ev.detail.empty()) std::cerr << ": " << ev.detail;
            std::cerr << "\n";
        });

    std::cout << "chatlink\n"
              << "User: " << config.user_id << " | Server: " << config.connection.url << "\n"
              << "Type /help for commands, /quit to exit.\n\n";

    if (!peer_id.empty()) session.open_conversation(peer_id);
    ctx->connection->set_identity(config.user_id);

    std::string input;
    ctx->loop->watch_fd(STDIN_FILENO, [&]() {
        char buf[1024];
        ssize_t n = ::read(STDIN_FILENO, buf, sizeof(buf));
        if (n <= 0) {
            // EOF (Ctrl+D)
            ctx->loop->unwatch_fd(STDIN_FILENO);
            g_shutdown.store(true);
            return;
        }
        input.append(buf, static_cast<size_t>(n));
        size_t pos;
        while ((pos = input.find('\n')) != std::string::npos) {
            std::string line = input.substr(0, pos);
            input.erase(0, pos + 1);
            if (!handle_line(line, *ctx, session)) {
                g_shutdown.store(true);
                return;
            }
        }
    });

    ctx->loop->run(g_shutdown);

    ctx->loop->unwatch_fd(STDIN_FILENO);
    unsubscribe();
    ctx->connection->disconnect();
    ctx->cache->flush();
    std::cerr << "[chatlink] Shutting down.\n";
    return 0;
} catch (const std::exception& e) {
    std::cerr << "Fatal error: " << e.what() << '\n';
    return 1;
}

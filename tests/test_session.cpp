#include <catch2/catch.hpp>
#include "conversation_session.hpp"
#include "manual_event_loop.hpp"
#include "mock_transport.hpp"
#include "store/memory_store.hpp"
#include <nlohmann/json.hpp>

using namespace chatlink;
using json = nlohmann::json;

// User "1" with the full stack wired over a MockTransport.
struct SessionFixture {
    ManualEventLoop loop;
    MemoryKvStore store;
    MessageCache cache{store, loop};
    MockTransport* transport = nullptr;
    std::unique_ptr<ConnectionManager> connection;
    std::unique_ptr<ConversationSession> session;

    SessionFixture() {
        auto t = std::make_unique<MockTransport>();
        transport = t.get();
        ConnectionConfig cfg;
        cfg.url = "ws://chat.test";
        connection = std::make_unique<ConnectionManager>(std::move(t), loop, cfg);
        session = std::make_unique<ConversationSession>(*connection, cache, loop, "1");
    }

    void go_online() {
        connection->set_identity(std::string("1"));
        transport->simulate_open();
    }

    void receive(const json& frame) { transport->simulate_text(frame.dump()); }

    void ack(const std::string& message_id) {
        receive({{"MessageAck", {{"message_id", message_id}, {"status", kAckPersisted}}}});
    }

    json last_sent() const { return json::parse(transport->sent.back()); }
};

static json direct_message(const std::string& from, const std::string& to,
                           const std::string& id, int64_t ts) {
    return {{"DirectMessage", {{"from", std::stoll(from)}, {"to", std::stoll(to)},
                               {"content", "text " + id}, {"message_id", id},
                               {"timestamp", ts}}}};
}

// ── Conversation switching ───────────────────────────────────────

TEST_CASE("ConversationSession: open_conversation derives the chat id", "[session]") {
    SessionFixture f;
    f.session->open_conversation("2");
    REQUIRE(f.session->active_chat_id() == "1_2");
    REQUIRE(f.session->active_peer() == "2");
    REQUIRE(f.session->view().chat_id == "1_2");
}

TEST_CASE("ConversationSession: no conversation means nothing to send", "[session]") {
    SessionFixture f;
    f.go_online();
    REQUIRE_FALSE(f.session->send("hello").has_value());
    REQUIRE(f.transport->sent.empty());
    REQUIRE(f.session->view().empty());
}

TEST_CASE("ConversationSession: blank content is not sent", "[session]") {
    SessionFixture f;
    f.go_online();
    f.session->open_conversation("2");
    REQUIRE_FALSE(f.session->send("   ").has_value());
    REQUIRE(f.transport->sent.empty());
}

// ── Delivery ─────────────────────────────────────────────────────

TEST_CASE("ConversationSession: send is optimistic and confirmed by ack", "[session]") {
    SessionFixture f;
    f.go_online();
    f.session->open_conversation("2");

    auto id = f.session->send("hello");
    REQUIRE(id.has_value());

    auto view = f.session->view();
    REQUIRE(view.pending.size() == 1);
    REQUIRE(view.pending[0].content == "hello");
    REQUIRE(f.session->outstanding_deliveries() == 1);

    json frame = f.last_sent();
    REQUIRE(frame["DirectMessage"]["message_id"] == *id);
    REQUIRE(frame["DirectMessage"]["from"] == 1);
    REQUIRE(frame["DirectMessage"]["to"] == 2);

    f.ack(*id);
    view = f.session->view();
    REQUIRE(view.pending.empty());
    REQUIRE(view.confirmed.size() == 1);
    REQUIRE(view.confirmed[0].extra["ack_status"] == kAckPersisted);
    REQUIRE(f.session->outstanding_deliveries() == 0);

    // The delivery timer is gone: nothing fails later
    f.loop.advance(60000);
    REQUIRE(f.session->view().failed.empty());
}

TEST_CASE("ConversationSession: non UTF-8 input is sent and times out normally", "[session]") {
    SessionFixture f;
    f.go_online();
    f.session->open_conversation("2");

    std::optional<std::string> id;
    REQUIRE_NOTHROW(id = f.session->send("caf\xe9"));
    REQUIRE(id.has_value());
    REQUIRE(f.transport->sent.size() == 1);
    REQUIRE(f.last_sent()["DirectMessage"]["content"] == "caf\xef\xbf\xbd");
    REQUIRE(f.session->outstanding_deliveries() == 1);

    REQUIRE_NOTHROW(f.loop.advance(31000));
    auto view = f.session->view();
    REQUIRE(view.pending.empty());
    REQUIRE(view.failed.size() == 1);
    REQUIRE(view.failed[0].id == *id);
}

TEST_CASE("ConversationSession: send while offline fails immediately", "[session]") {
    SessionFixture f;
    f.session->open_conversation("2");

    auto id = f.session->send("hello");
    REQUIRE(id.has_value());
    auto view = f.session->view();
    REQUIRE(view.failed.size() == 1);
    REQUIRE(view.failed[0].id == *id);
    REQUIRE(f.session->outstanding_deliveries() == 0);
}

TEST_CASE("ConversationSession: missing ack fails then retry keeps the id", "[session]") {
    SessionFixture f;
    f.go_online();
    f.session->open_conversation("2");

    auto id = f.session->send("hello");
    f.loop.advance(29999);
    REQUIRE(f.session->view().pending.size() == 1);
    f.loop.advance(1);
    REQUIRE(f.session->view().failed.size() == 1);
    REQUIRE(f.session->message_counts().failed == 1);

    REQUIRE(f.session->retry(*id));
    REQUIRE(f.transport->sent.size() == 2);
    REQUIRE(f.last_sent()["DirectMessage"]["message_id"] == *id);
    REQUIRE(f.session->view().pending.size() == 1);

    f.ack(*id);
    auto counts = f.session->message_counts();
    REQUIRE(counts.confirmed == 1);
    REQUIRE(counts.pending == 0);
    REQUIRE(counts.failed == 0);
    REQUIRE(counts.total == 1);
}

TEST_CASE("ConversationSession: retry of unknown id is refused", "[session]") {
    SessionFixture f;
    f.go_online();
    f.session->open_conversation("2");
    REQUIRE_FALSE(f.session->retry("nope"));
}

TEST_CASE("ConversationSession: late ack still confirms a failed message", "[session]") {
    SessionFixture f;
    f.go_online();
    f.session->open_conversation("2");

    auto id = f.session->send("hello");
    f.loop.advance(30000);
    REQUIRE(f.session->view().failed.size() == 1);

    f.ack(*id);
    auto view = f.session->view();
    REQUIRE(view.failed.empty());
    REQUIRE(view.confirmed.size() == 1);
}

TEST_CASE("ConversationSession: echo of an own message is not duplicated", "[session]") {
    SessionFixture f;
    f.go_online();
    f.session->open_conversation("2");

    auto id = f.session->send("hello");
    f.receive(direct_message("1", "2", *id, f.loop.now_ms()));

    auto view = f.session->view();
    REQUIRE(view.all.size() == 1);
    REQUIRE(view.pending.size() == 1);
}

// ── Inbound messages ─────────────────────────────────────────────

TEST_CASE("ConversationSession: incoming message is marked read after debounce", "[session]") {
    SessionFixture f;
    f.go_online();
    f.session->open_conversation("2");
    f.loop.advance(100);

    f.receive(direct_message("2", "1", "in1", f.loop.now_ms()));
    auto view = f.session->view();
    REQUIRE(view.confirmed.size() == 1);
    REQUIRE(view.confirmed[0].incoming);
    REQUIRE(f.cache.get_chat_metadata("1_2").unread_count == 1);

    f.loop.advance(100);
    REQUIRE(f.cache.get_chat_metadata("1_2").unread_count == 0);
}

TEST_CASE("ConversationSession: messages for other chats stay unread", "[session]") {
    SessionFixture f;
    f.go_online();
    f.session->open_conversation("2");

    f.receive(direct_message("3", "1", "other", f.loop.now_ms()));
    f.loop.advance(1000);

    REQUIRE(f.session->view().empty());
    REQUIRE(f.cache.get_messages("1_3").size() == 1);
    REQUIRE(f.cache.get_chat_metadata("1_3").unread_count == 1);
}

TEST_CASE("ConversationSession: frames for other users are ignored", "[session]") {
    SessionFixture f;
    f.go_online();
    f.receive(direct_message("5", "6", "x", f.loop.now_ms()));
    REQUIRE(f.cache.list_conversations().empty());
}

TEST_CASE("ConversationSession: mark_as_read clears unread now", "[session]") {
    SessionFixture f;
    f.go_online();
    f.receive(direct_message("2", "1", "in1", f.loop.now_ms()));
    f.session->open_conversation("2");
    REQUIRE(f.cache.get_chat_metadata("1_2").has_unread);

    f.session->mark_as_read();
    REQUIRE_FALSE(f.cache.get_chat_metadata("1_2").has_unread);
}

// ── History ──────────────────────────────────────────────────────

TEST_CASE("ConversationSession: history page is prepended in order", "[session]") {
    SessionFixture f;
    f.go_online();
    f.session->open_conversation("2");
    f.receive(direct_message("2", "1", "new", 5000));

    REQUIRE(f.session->load_more_history());
    REQUIRE(f.last_sent() == json{{"ChatHistory", {{"conversation_id", "1_2"}}}});
    REQUIRE(f.session->view().is_loading);
    REQUIRE_FALSE(f.session->load_more_history());

    json page = {{"ChatHistoryResponse", {
        {"conversation_id", "1_2"},
        {"messages", json::array({direct_message("1", "2", "h2", 2000)["DirectMessage"],
                                  direct_message("2", "1", "h1", 1000)["DirectMessage"]})},
        {"has_more", true},
        {"next_cursor", "h1"}
    }}};
    f.receive(page);

    auto view = f.session->view();
    REQUIRE_FALSE(view.is_loading);
    REQUIRE(view.has_more);
    REQUIRE(view.confirmed.size() == 3);
    REQUIRE(view.confirmed[0].id == "h1");
    REQUIRE(view.confirmed[1].id == "h2");
    REQUIRE(view.confirmed[2].id == "new");
    REQUIRE_FALSE(view.confirmed[1].incoming);

    // Next request carries the cursor
    REQUIRE(f.session->load_more_history());
    REQUIRE(f.last_sent()["ChatHistory"]["message_id"] == "h1");
}

TEST_CASE("ConversationSession: last page stops further requests", "[session]") {
    SessionFixture f;
    f.go_online();
    f.session->open_conversation("2");

    REQUIRE(f.session->load_more_history());
    f.receive({{"ChatHistoryResponse", {{"conversation_id", "1_2"},
                                        {"messages", json::array()},
                                        {"has_more", false}}}});

    REQUIRE_FALSE(f.session->view().has_more);
    REQUIRE_FALSE(f.session->load_more_history());
    REQUIRE(f.transport->sent.size() == 1);
}

TEST_CASE("ConversationSession: page for another conversation is ignored", "[session]") {
    SessionFixture f;
    f.go_online();
    f.session->open_conversation("2");
    REQUIRE(f.session->load_more_history());

    f.receive({{"ChatHistoryResponse", {
        {"conversation_id", "1_9"},
        {"messages", json::array({direct_message("9", "1", "x", 1000)["DirectMessage"]})},
        {"has_more", false}}}});

    auto view = f.session->view();
    REQUIRE(view.is_loading);
    REQUIRE(view.empty());
}

TEST_CASE("ConversationSession: history request times out", "[session]") {
    SessionFixture f;
    f.go_online();
    f.session->open_conversation("2");
    REQUIRE(f.session->load_more_history());

    f.loop.advance(30000);
    auto view = f.session->view();
    REQUIRE_FALSE(view.is_loading);
    REQUIRE(view.error == std::optional<std::string>("History request timed out"));

    // A later request is allowed again and clears the error
    REQUIRE(f.session->load_more_history());
    REQUIRE_FALSE(f.session->view().error.has_value());
}

TEST_CASE("ConversationSession: history while offline reports an error", "[session]") {
    SessionFixture f;
    f.session->open_conversation("2");

    REQUIRE_FALSE(f.session->load_more_history());
    auto view = f.session->view();
    REQUIRE_FALSE(view.is_loading);
    REQUIRE(view.error.has_value());
    REQUIRE(view.error->rfind("Failed to load history", 0) == 0);
}

TEST_CASE("ConversationSession: switching chats aborts paging and frees memory", "[session]") {
    SessionFixture f;
    f.go_online();
    f.session->open_conversation("2");
    f.receive(direct_message("2", "1", "a", 1000));
    REQUIRE(f.session->load_more_history());

    f.session->open_conversation("3");
    REQUIRE(f.session->active_chat_id() == "1_3");
    REQUIRE_FALSE(f.cache.is_in_memory("1_2"));
    REQUIRE_FALSE(f.cache.get_pagination_state("1_2").is_loading);

    // The stale page arrives after the switch
    f.receive({{"ChatHistoryResponse", {
        {"conversation_id", "1_2"},
        {"messages", json::array({direct_message("2", "1", "old", 500)["DirectMessage"]})},
        {"has_more", false}}}});
    REQUIRE(f.cache.get_messages("1_2").size() == 1);
    REQUIRE(f.session->view().empty());
}

// ── View and connection ──────────────────────────────────────────

TEST_CASE("ConversationSession: view listener follows changes", "[session]") {
    SessionFixture f;
    std::vector<SessionView> views;
    f.session->set_view_listener([&](const SessionView& v) { views.push_back(v); });

    f.go_online();
    f.session->open_conversation("2");
    size_t before = views.size();
    f.session->send("hi");

    REQUIRE(views.size() > before);
    REQUIRE(views.back().pending.size() == 1);
    REQUIRE(views.back().connection_state == ConnectionState::Connected);
}

TEST_CASE("ConversationSession: reconnects after an abnormal close", "[session]") {
    SessionFixture f;
    f.go_online();
    f.session->open_conversation("2");

    f.transport->simulate_close(kCloseAbnormal, "network down");
    REQUIRE(f.session->view().connection_state == ConnectionState::Disconnected);

    // Sends while down fail fast
    auto id = f.session->send("queued");
    REQUIRE(f.session->view().failed.size() == 1);

    f.loop.advance(1500);
    REQUIRE(f.transport->open_count() == 2);
    f.transport->simulate_open();
    REQUIRE(f.session->view().connection_state == ConnectionState::Connected);
    REQUIRE(f.connection->reconnect_attempts() == 0);

    REQUIRE(f.session->retry(*id));
    f.ack(*id);
    REQUIRE(f.session->view().confirmed.size() == 1);
}

TEST_CASE("ConversationSession: pending delivery survives a chat switch", "[session]") {
    SessionFixture f;
    f.go_online();
    f.session->open_conversation("2");
    auto id = f.session->send("hello");

    f.session->open_conversation("3");
    f.ack(*id);

    auto snap = f.cache.get_all_messages("1_2");
    REQUIRE(snap.pending.empty());
    REQUIRE(snap.confirmed.size() == 1);
}

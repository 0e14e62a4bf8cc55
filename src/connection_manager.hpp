#pragma once
#include "event_loop.hpp"
#include "protocol.hpp"
#include "transport.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace chatlink {

enum class ConnectionState { Disconnected, Connecting, Connected, Error };

const char* connection_state_name(ConnectionState state);

struct ConnectionConfig {
    std::string url = "ws://localhost:4001";
    int64_t base_reconnect_interval_ms = 1500;
    uint32_t max_reconnect_attempts = 5;
};

// Extra context handed to connection handlers with each state change.
struct ConnectionEvent {
    uint16_t close_code = 0;  // set for Disconnected caused by a socket close
    std::string detail;       // close reason or error text
};

using MessageHandler = std::function<void(const InboundFrame&)>;
using ConnectionHandler = std::function<void(ConnectionState, const ConnectionEvent&)>;

// Owns the single persistent connection for the current identity and
// recovers it with exponential backoff.
class ConnectionManager {
public:
    ConnectionManager(std::unique_ptr<Transport> transport, EventLoop& loop,
                      ConnectionConfig config);
    ~ConnectionManager();

    ConnectionManager(const ConnectionManager&) = delete;
    ConnectionManager& operator=(const ConnectionManager&) = delete;

    // Single-flight: no-op while Connecting or Connected.
    void connect();

    // Transmit one frame. Throws TransportError unless Connected.
    void send_message(const std::string& payload);
    void send_message(const nlohmann::json& payload);

    void disconnect();
    void reconnect();

    Unsubscribe add_message_handler(MessageHandler handler);
    Unsubscribe add_connection_handler(ConnectionHandler handler);

    // Identity becoming available while Disconnected connects automatically;
    // clearing it tears the connection down.
    void set_identity(std::optional<std::string> identity);
    const std::optional<std::string>& identity() const { return identity_; }

    // Environment notifications.
    void on_network_online();
    void on_network_offline();
    void on_visibility_changed(bool visible);

    ConnectionState state() const { return state_; }
    bool is_connected() const { return state_ == ConnectionState::Connected; }
    uint32_t reconnect_attempts() const { return reconnect_attempts_; }
    const std::string& last_error() const { return last_error_; }
    bool reconnect_pending() const { return reconnect_timer_.has_value(); }

    // URL the next attempt opens: <base>/ws?token=<identity>.
    std::string connection_url() const;

private:
    template <typename Handler>
    struct Registration {
        uint64_t id;
        Handler handler;
    };

    void set_state(ConnectionState state, const ConnectionEvent& event = {});
    void cancel_reconnect_timer();
    void hard_close();
    void schedule_reconnect();

    void handle_open(uint64_t gen);
    void handle_text(uint64_t gen, const std::string& text);
    void handle_error(uint64_t gen, const std::string& error);
    void handle_close(uint64_t gen, uint16_t code, const std::string& reason);

    std::unique_ptr<Transport> transport_;
    EventLoop& loop_;
    ConnectionConfig config_;

    std::optional<std::string> identity_;
    ConnectionState state_ = ConnectionState::Disconnected;
    std::string last_error_;
    uint32_t reconnect_attempts_ = 0;
    bool manual_close_ = false;
    bool socket_active_ = false;
    uint64_t generation_ = 0;
    std::optional<TimerId> reconnect_timer_;

    std::vector<Registration<MessageHandler>> message_handlers_;
    std::vector<Registration<ConnectionHandler>> connection_handlers_;
    uint64_t next_handler_id_ = 1;

    std::shared_ptr<bool> alive_ = std::make_shared<bool>(true);
};

} // namespace chatlink

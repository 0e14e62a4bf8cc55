#include "connection_manager.hpp"
#include "util.hpp"
#include <algorithm>
#include <iostream>

namespace chatlink {

const char* connection_state_name(ConnectionState state) {
    switch (state) {
        case ConnectionState::Disconnected: return "disconnected";
        case ConnectionState::Connecting:   return "connecting";
        case ConnectionState::Connected:    return "connected";
        case ConnectionState::Error:        return "error";
    }
    return "unknown";
}

ConnectionManager::ConnectionManager(std::unique_ptr<Transport> transport, EventLoop& loop,
                                     ConnectionConfig config)
    : transport_(std::move(transport)), loop_(loop), config_(std::move(config)) {}

ConnectionManager::~ConnectionManager() {
    cancel_reconnect_timer();
    hard_close();
}

std::string ConnectionManager::connection_url() const {
    std::string base = config_.url;
    if (!base.empty() && base.back() == '/') base.pop_back();
    return base + "/ws?token=" + url_encode(identity_.value_or(""));
}

// ── Subscriptions ─────────────────────────────────────────────

Unsubscribe ConnectionManager::add_message_handler(MessageHandler handler) {
    uint64_t id = next_handler_id_++;
    message_handlers_.push_back({id, std::move(handler)});
    std::weak_ptr<bool> alive = alive_;
    return [this, alive, id]() {
        if (alive.expired()) return;
        auto& v = message_handlers_;
        v.erase(std::remove_if(v.begin(), v.end(),
                               [id](const auto& r) { return r.id == id; }),
                v.end());
    };
}

Unsubscribe ConnectionManager::add_connection_handler(ConnectionHandler handler) {
    uint64_t id = next_handler_id_++;
    connection_handlers_.push_back({id, std::move(handler)});
    std::weak_ptr<bool> alive = alive_;
    return [this, alive, id]() {
        if (alive.expired()) return;
        auto& v = connection_handlers_;
        v.erase(std::remove_if(v.begin(), v.end(),
                               [id](const auto& r) { return r.id == id; }),
                v.end());
    };
}

void ConnectionManager::set_state(ConnectionState state, const ConnectionEvent& event) {
    state_ = state;

    // Snapshot so handlers may subscribe/unsubscribe during delivery.
    auto snapshot = connection_handlers_;
    std::weak_ptr<bool> alive = alive_;
    for (const auto& reg : snapshot) {
        try {
            reg.handler(state, event);
        } catch (const std::exception& e) {
            std::cerr << "[connection] connection handler threw: " << e.what() << "\n";
        }
        if (alive.expired()) return;
    }
}

// ── Lifecycle ─────────────────────────────────────────────────

void ConnectionManager::connect() {
    if (state_ == ConnectionState::Connecting || state_ == ConnectionState::Connected) return;

    if (!identity_) {
        last_error_ = "User ID is required for connection";
        if (state_ != ConnectionState::Disconnected)
            set_state(ConnectionState::Disconnected, {0, last_error_});
        return;
    }

    manual_close_ = false;
    cancel_reconnect_timer();
    hard_close();
    last_error_.clear();
    set_state(ConnectionState::Connecting);
    if (state_ != ConnectionState::Connecting) return; // a handler intervened

    uint64_t gen = ++generation_;
    std::weak_ptr<bool> alive = alive_;
    TransportCallbacks cb;
    cb.on_open = [this, alive, gen]() {
        if (!alive.expired()) handle_open(gen);
    };
    cb.on_text = [this, alive, gen](const std::string& text) {
        if (!alive.expired()) handle_text(gen, text);
    };
    cb.on_error = [this, alive, gen](const std::string& error) {
        if (!alive.expired()) handle_error(gen, error);
    };
    cb.on_close = [this, alive, gen](uint16_t code, const std::string& reason) {
        if (!alive.expired()) handle_close(gen, code, reason);
    };

    socket_active_ = true;
    try {
        transport_->open(connection_url(), std::move(cb));
    } catch (const TransportError& e) {
        std::cerr << "[connection] failed to open connection: " << e.what() << "\n";
        socket_active_ = false;
        ++generation_;
        last_error_ = "Failed to create WebSocket connection";
        set_state(ConnectionState::Error, {0, e.what()});
        if (identity_ && !manual_close_ && state_ == ConnectionState::Error)
            schedule_reconnect();
    }
}

void ConnectionManager::disconnect() {
    manual_close_ = true;
    cancel_reconnect_timer();
    hard_close();
    reconnect_attempts_ = 0;
    set_state(ConnectionState::Disconnected);
}

void ConnectionManager::reconnect() {
    manual_close_ = false;
    cancel_reconnect_timer();
    hard_close();
    reconnect_attempts_ = 0;
    state_ = ConnectionState::Disconnected;
    connect();
}

void ConnectionManager::send_message(const std::string& payload) {
    if (state_ != ConnectionState::Connected || !transport_->is_open())
        throw TransportError("WebSocket is not connected");
    if (!transport_->send_text(payload))
        throw TransportError("failed to write frame");
}

void ConnectionManager::send_message(const nlohmann::json& payload) {
    if (payload.is_string()) {
        send_message(payload.get<std::string>());
        return;
    }
    send_message(payload.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));
}

void ConnectionManager::set_identity(std::optional<std::string> identity) {
    if (identity && identity->empty()) identity.reset();
    if (identity == identity_) return;

    bool had_identity = identity_.has_value();
    identity_ = std::move(identity);

    if (!identity_) {
        cancel_reconnect_timer();
        hard_close();
        reconnect_attempts_ = 0;
        if (state_ != ConnectionState::Disconnected) set_state(ConnectionState::Disconnected);
        return;
    }

    // A live connection authenticated as someone else must be replaced.
    if (had_identity && (socket_active_ || reconnect_timer_)) {
        reconnect();
        return;
    }
    if (state_ == ConnectionState::Disconnected) connect();
}

void ConnectionManager::on_network_online() {
    if (state_ == ConnectionState::Disconnected && identity_) reconnect();
}

void ConnectionManager::on_network_offline() {
    cancel_reconnect_timer();
    hard_close();
    if (state_ != ConnectionState::Disconnected) set_state(ConnectionState::Disconnected);
}

void ConnectionManager::on_visibility_changed(bool visible) {
    if (visible && state_ == ConnectionState::Disconnected && identity_) reconnect();
}

// ── Internals ─────────────────────────────────────────────────

void ConnectionManager::cancel_reconnect_timer() {
    if (reconnect_timer_) {
        loop_.cancel(*reconnect_timer_);
        reconnect_timer_.reset();
    }
}

void ConnectionManager::hard_close() {
    // Callbacks still queued for the old socket become no-ops.
    ++generation_;
    if (socket_active_) {
        socket_active_ = false;
        transport_->close(kCloseNormal);
    }
}

void ConnectionManager::schedule_reconnect() {
    uint32_t next = reconnect_attempts_ + 1;
    if (next <= config_.max_reconnect_attempts) {
        int64_t delay = config_.base_reconnect_interval_ms * (int64_t{1} << reconnect_attempts_);
        cancel_reconnect_timer();
        std::weak_ptr<bool> alive = alive_;
        reconnect_timer_ = loop_.schedule(delay, [this, alive]() {
            if (alive.expired()) return;
            reconnect_timer_.reset();
            if (!socket_active_ && !manual_close_) connect();
        });
        std::cerr << "[connection] reconnecting in " << delay << "ms (attempt "
                  << next << "/" << config_.max_reconnect_attempts << ")\n";
    } else {
        last_error_ = "Maximum reconnection attempts reached";
        std::cerr << "[connection] " << last_error_ << "\n";
        set_state(ConnectionState::Error, {0, last_error_});
    }
    reconnect_attempts_ = next;
}

void ConnectionManager::handle_open(uint64_t gen) {
    if (gen != generation_) return;
    reconnect_attempts_ = 0;
    last_error_.clear();
    set_state(ConnectionState::Connected);
}

void ConnectionManager::handle_text(uint64_t gen, const std::string& text) {
    if (gen != generation_) return;

    std::string error;
    auto frame = parse_inbound_frame(text, &error);
    if (!frame) {
        std::cerr << "[connection] dropping invalid frame: " << error << "\n";
        return;
    }

    auto snapshot = message_handlers_;
    std::weak_ptr<bool> alive = alive_;
    for (const auto& reg : snapshot) {
        try {
            reg.handler(*frame);
        } catch (const std::exception& e) {
            std::cerr << "[connection] message handler threw: " << e.what() << "\n";
        }
        if (alive.expired()) return;
    }
}

void ConnectionManager::handle_error(uint64_t gen, const std::string& error) {
    if (gen != generation_) return;
    std::cerr << "[connection] transport error: " << error << "\n";
    last_error_ = "WebSocket connection error";
    set_state(ConnectionState::Error, {0, error});
}

void ConnectionManager::handle_close(uint64_t gen, uint16_t code, const std::string& reason) {
    if (gen != generation_) return;
    socket_active_ = false;
    ++generation_;

    set_state(ConnectionState::Disconnected, {code, reason});

    if (manual_close_ || code == kCloseNormal) return;
    if (!identity_) return;
    if (socket_active_ || state_ != ConnectionState::Disconnected) return; // handler reconnected
    schedule_reconnect();
}

} // namespace chatlink

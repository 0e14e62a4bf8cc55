// WebSocket client using POSIX sockets + OpenSSL.
#include "websocket.hpp"
#include "util.hpp"

#include <openssl/ssl.h>
#include <openssl/err.h>
#include <openssl/rand.h>

#include <sys/socket.h>
#include <sys/time.h>
#include <netdb.h>
#include <fcntl.h>
#include <poll.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <iostream>

namespace chatlink {

// ── URL parsing ────────────────────────────────────────────────

WsUrl parse_ws_url(const std::string& url) {
    WsUrl result{};
    size_t scheme_end = url.find("://");
    if (scheme_end == std::string::npos)
        throw TransportError("websocket: invalid URL: " + url);

    std::string scheme = to_lower(url.substr(0, scheme_end));
    if (scheme == "wss") {
        result.tls = true;
    } else if (scheme != "ws") {
        throw TransportError("websocket: unsupported scheme: " + scheme);
    }

    size_t host_start = scheme_end + 3;
    size_t path_start = url.find_first_of("/?", host_start);
    std::string host_port = (path_start == std::string::npos)
        ? url.substr(host_start)
        : url.substr(host_start, path_start - host_start);

    if (path_start == std::string::npos) {
        result.path = "/";
    } else if (url[path_start] == '?') {
        result.path = "/" + url.substr(path_start);
    } else {
        result.path = url.substr(path_start);
    }

    size_t colon = host_port.rfind(':');
    if (colon != std::string::npos && host_port.find(']') == std::string::npos) {
        result.host = host_port.substr(0, colon);
        result.port = host_port.substr(colon + 1);
    } else {
        result.host = host_port;
        result.port = result.tls ? "443" : "80";
    }
    if (result.host.empty())
        throw TransportError("websocket: missing host in URL: " + url);
    return result;
}

// ── RAII socket (TCP + optional TLS) ──────────────────────────

struct WebSocketTransport::Socket {
    int      fd  = -1;
    SSL_CTX* ctx = nullptr;
    SSL*     ssl = nullptr;

    Socket() = default;
    ~Socket() {
        if (ssl) { SSL_shutdown(ssl); SSL_free(ssl); }
        if (ctx) SSL_CTX_free(ctx);
        if (fd >= 0) ::close(fd);
    }
    Socket(const Socket&)            = delete;
    Socket& operator=(const Socket&) = delete;

    // Blocking connect + TLS handshake. Returns an error description, empty on success.
    std::string connect(const WsUrl& url, long timeout_secs) {
        struct addrinfo hints{};
        hints.ai_family   = AF_UNSPEC;
        hints.ai_socktype = SOCK_STREAM;

        struct addrinfo* res = nullptr;
        int gai = getaddrinfo(url.host.c_str(), url.port.c_str(), &hints, &res);
        if (gai != 0)
            return "cannot resolve " + url.host + ": " + gai_strerror(gai);

        bool connected = false;
        for (auto* ai = res; ai && !connected; ai = ai->ai_next) {
            fd = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
            if (fd < 0) continue;

            int flags = fcntl(fd, F_GETFL, 0);
            fcntl(fd, F_SETFL, flags | O_NONBLOCK);

            int rc = ::connect(fd, ai->ai_addr, ai->ai_addrlen);
            if (rc == 0) {
                fcntl(fd, F_SETFL, flags);
                connected = true;
            } else if (errno == EINPROGRESS) {
                struct pollfd pfd{fd, POLLOUT, 0};
                rc = ::poll(&pfd, 1, static_cast<int>(timeout_secs * 1000));
                if (rc > 0) {
                    int err = 0;
                    socklen_t elen = sizeof(err);
                    getsockopt(fd, SOL_SOCKET, SO_ERROR, &err, &elen);
                    if (err == 0) {
                        fcntl(fd, F_SETFL, flags);
                        connected = true;
                    }
                }
            }
            if (!connected) { ::close(fd); fd = -1; }
        }
        freeaddrinfo(res);
        if (!connected) return "cannot connect to " + url.host + ":" + url.port;

        set_socket_timeout(timeout_secs);

        if (url.tls) {
            ctx = SSL_CTX_new(TLS_client_method());
            if (!ctx) return "SSL_CTX_new failed";
            SSL_CTX_set_verify(ctx, SSL_VERIFY_PEER, nullptr);
            SSL_CTX_set_default_verify_paths(ctx);
            SSL_CTX_set_min_proto_version(ctx, TLS1_2_VERSION);

            ssl = SSL_new(ctx);
            if (!ssl) return "SSL_new failed";
            SSL_set_fd(ssl, fd);
            SSL_set_tlsext_host_name(ssl, url.host.c_str()); // SNI

            if (SSL_connect(ssl) != 1) {
                char buf[256];
                ERR_error_string_n(ERR_get_error(), buf, sizeof(buf));
                return std::string("TLS handshake failed: ") + buf;
            }
        }
        return {};
    }

    void set_nonblocking() {
        int flags = fcntl(fd, F_GETFL, 0);
        fcntl(fd, F_SETFL, flags | O_NONBLOCK);
    }

    // >0 bytes read, 0 on EOF, -1 on error, -2 when no data is available yet.
    ssize_t read_some(char* buf, size_t len) {
        if (ssl) {
            int n = SSL_read(ssl, buf, static_cast<int>(len));
            if (n > 0) return n;
            int err = SSL_get_error(ssl, n);
            if (err == SSL_ERROR_ZERO_RETURN) return 0;
            if (err == SSL_ERROR_WANT_READ || err == SSL_ERROR_WANT_WRITE) return -2;
            if (err == SSL_ERROR_SYSCALL && n == 0) return 0;
            if (err == SSL_ERROR_SYSCALL && (errno == EAGAIN || errno == EWOULDBLOCK))
                return -2;
            return -1;
        }
        ssize_t n = ::recv(fd, buf, len, 0);
        if (n >= 0) return n;
        if (errno == EAGAIN || errno == EWOULDBLOCK) return -2;
        if (errno == EINTR) return -2;
        return -1;
    }

    // Write everything, waiting for writability when the kernel buffer is full.
    bool write_all(const char* buf, size_t len) {
        while (len > 0) {
            ssize_t n;
            bool want_write = false;
            if (ssl) {
                int rc = SSL_write(ssl, buf, static_cast<int>(len));
                if (rc <= 0) {
                    int err = SSL_get_error(ssl, rc);
                    if (err != SSL_ERROR_WANT_WRITE && err != SSL_ERROR_WANT_READ)
                        return false;
                    want_write = true;
                    n = 0;
                } else {
                    n = rc;
                }
            } else {
                n = ::send(fd, buf, len, MSG_NOSIGNAL);
                if (n < 0) {
                    if (errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR)
                        return false;
                    want_write = true;
                    n = 0;
                }
            }
            if (want_write) {
                struct pollfd pfd{fd, POLLOUT, 0};
                if (::poll(&pfd, 1, 5000) <= 0) return false;
                continue;
            }
            buf += n;
            len -= static_cast<size_t>(n);
        }
        return true;
    }

private:
    void set_socket_timeout(long secs) {
        struct timeval tv{secs, 0};
        setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
        setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
    }
};

// ── Handshake ──────────────────────────────────────────────────

static std::array<uint8_t, 4> random_mask() {
    std::array<uint8_t, 4> mask{};
    if (RAND_bytes(mask.data(), static_cast<int>(mask.size())) != 1) {
        uint64_t fallback = epoch_millis();
        for (size_t i = 0; i < mask.size(); ++i)
            mask[i] = static_cast<uint8_t>(fallback >> (i * 8));
    }
    return mask;
}

static std::string random_key() {
    unsigned char raw[16];
    if (RAND_bytes(raw, sizeof(raw)) != 1)
        throw TransportError("websocket: RAND_bytes failed");
    return base64_encode(raw, sizeof(raw));
}

static std::string build_upgrade_request(const WsUrl& url, const std::string& key) {
    std::string host = url.host;
    bool default_port = (url.tls && url.port == "443") || (!url.tls && url.port == "80");
    if (!default_port) host += ":" + url.port;

    std::string req;
    req += "GET " + url.path + " HTTP/1.1\r\n";
    req += "Host: " + host + "\r\n";
    req += "Upgrade: websocket\r\n";
    req += "Connection: Upgrade\r\n";
    req += "Sec-WebSocket-Key: " + key + "\r\n";
    req += "Sec-WebSocket-Version: 13\r\n";
    req += "User-Agent: chatlink/0.1\r\n\r\n";
    return req;
}

// Validate the 101 response. Returns an error description, empty on success.
static std::string check_upgrade_response(const std::string& head, const std::string& key) {
    auto lines = split(head, '\n');
    if (lines.empty()) return "empty handshake response";

    std::string status_line = trim(lines[0]);
    auto parts = split(status_line, ' ');
    if (parts.size() < 2 || parts[1] != "101")
        return "handshake rejected: " + status_line;

    std::string accept;
    bool upgrade_ok = false;
    for (size_t i = 1; i < lines.size(); ++i) {
        std::string line = trim(lines[i]);
        size_t colon = line.find(':');
        if (colon == std::string::npos) continue;
        std::string name = to_lower(trim(line.substr(0, colon)));
        std::string value = trim(line.substr(colon + 1));
        if (name == "sec-websocket-accept") accept = value;
        else if (name == "upgrade" && to_lower(value) == "websocket") upgrade_ok = true;
    }
    if (!upgrade_ok) return "handshake missing Upgrade: websocket";
    if (accept != websocket_accept_key(key)) return "handshake Sec-WebSocket-Accept mismatch";
    return {};
}

// ── WebSocketTransport ─────────────────────────────────────────

WebSocketTransport::WebSocketTransport(PollEventLoop& loop, long connect_timeout_seconds)
    : loop_(loop), connect_timeout_(connect_timeout_seconds) {}

WebSocketTransport::~WebSocketTransport() {
    *alive_ = false;
    teardown();
}

bool WebSocketTransport::still_current(uint64_t gen) const {
    return gen == generation_;
}

void WebSocketTransport::post_failure(const std::string& error, uint16_t code,
                                      const std::string& reason) {
    std::weak_ptr<bool> alive = alive_;
    uint64_t gen = generation_;
    TransportCallbacks cb = callbacks_;
    loop_.post([this, alive, gen, cb, error, code, reason]() {
        if (alive.expired() || !still_current(gen)) return;
        if (!error.empty() && cb.on_error) cb.on_error(error);
        if (alive.expired() || !still_current(gen)) return;
        if (cb.on_close) cb.on_close(code, reason);
    });
}

void WebSocketTransport::open(const std::string& url, TransportCallbacks callbacks) {
    teardown();
    ++generation_;
    callbacks_ = std::move(callbacks);
    parser_ = WsFrameParser();
    assembler_.reset();

    WsUrl parsed = parse_ws_url(url);
    std::string key = random_key();

    auto sock = std::make_unique<Socket>();
    std::string err = sock->connect(parsed, connect_timeout_);
    if (!err.empty()) {
        std::cerr << "[websocket] " << err << "\n";
        post_failure(err, kCloseAbnormal, err);
        return;
    }

    std::string request = build_upgrade_request(parsed, key);
    if (!sock->write_all(request.data(), request.size())) {
        post_failure("failed to send upgrade request", kCloseAbnormal, "");
        return;
    }

    std::string received;
    size_t head_end = std::string::npos;
    char buf[4096];
    while (head_end == std::string::npos) {
        ssize_t n = sock->read_some(buf, sizeof(buf));
        if (n <= 0) {
            std::string msg = (n == -2) ? "handshake timed out" : "connection closed during handshake";
            std::cerr << "[websocket] " << msg << "\n";
            post_failure(msg, kCloseAbnormal, msg);
            return;
        }
        received.append(buf, static_cast<size_t>(n));
        head_end = received.find("\r\n\r\n");
        if (received.size() > 64 * 1024 && head_end == std::string::npos) {
            post_failure("handshake response too large", kCloseAbnormal, "");
            return;
        }
    }

    err = check_upgrade_response(received.substr(0, head_end), key);
    if (!err.empty()) {
        std::cerr << "[websocket] " << err << "\n";
        post_failure(err, kCloseAbnormal, err);
        return;
    }

    std::string leftover = received.substr(head_end + 4);
    if (!leftover.empty()) parser_.feed(leftover.data(), leftover.size());

    sock->set_nonblocking();
    int fd = sock->fd;
    socket_ = std::move(sock);

    std::weak_ptr<bool> alive = alive_;
    uint64_t gen = generation_;
    loop_.watch_fd(fd, [this, alive, gen]() {
        if (alive.expired() || !still_current(gen)) return;
        on_readable();
    });

    loop_.post([this, alive, gen]() {
        if (alive.expired() || !still_current(gen)) return;
        if (callbacks_.on_open) callbacks_.on_open();
        if (alive.expired() || !still_current(gen)) return;
        // Frames that arrived together with the handshake response.
        if (parser_.buffered() > 0) on_readable();
    });
}

void WebSocketTransport::on_readable() {
    if (!socket_) return;
    uint64_t gen = generation_;
    std::weak_ptr<bool> alive = alive_;

    // Frames are parsed as bytes arrive, so at most one partial frame is buffered.
    if (!drain_frames()) return;

    char buf[16384];
    bool eof = false;
    while (true) {
        ssize_t n = socket_->read_some(buf, sizeof(buf));
        if (n > 0) {
            parser_.feed(buf, static_cast<size_t>(n));
            if (!drain_frames()) return;
            continue;
        }
        if (n == 0) eof = true;
        if (n == -1) {
            TransportCallbacks cb = callbacks_;
            teardown();
            if (cb.on_error) cb.on_error("socket read failed");
            if (alive.expired() || !still_current(gen)) return;
            if (cb.on_close) cb.on_close(kCloseAbnormal, "socket read failed");
            return;
        }
        break;
    }

    if (eof && socket_) {
        TransportCallbacks cb = callbacks_;
        teardown();
        if (cb.on_close) cb.on_close(kCloseAbnormal, "connection closed by peer");
    }
}

bool WebSocketTransport::drain_frames() {
    uint64_t gen = generation_;
    std::weak_ptr<bool> alive = alive_;
    try {
        while (auto frame = parser_.next()) {
            if (!handle_frame(*frame)) return false;
            if (alive.expired() || !still_current(gen)) return false;
        }
        return true;
    } catch (const WsProtocolError& e) {
        std::cerr << "[websocket] protocol error: " << e.what() << "\n";
        TransportCallbacks cb = callbacks_;
        if (socket_ && !write_frame(WsOpcode::Close, encode_close_payload(1002, "protocol error")))
            std::cerr << "[websocket] could not send close frame\n";
        teardown();
        if (cb.on_error) cb.on_error(std::string("protocol error: ") + e.what());
        if (alive.expired() || !still_current(gen)) return false;
        if (cb.on_close) cb.on_close(kCloseAbnormal, e.what());
        return false;
    }
}

bool WebSocketTransport::handle_frame(WsFrame& frame) {
    switch (frame.opcode) {
    case WsOpcode::Text:
    case WsOpcode::Binary:
    case WsOpcode::Continuation: {
        auto message = assembler_.add(frame);
        if (message && message->opcode == WsOpcode::Text && callbacks_.on_text)
            callbacks_.on_text(message->payload);
        return true;
    }

    case WsOpcode::Ping:
        if (!write_frame(WsOpcode::Pong, frame.payload)) {
            TransportCallbacks cb = callbacks_;
            uint64_t gen = generation_;
            teardown();
            if (cb.on_error) cb.on_error("socket write failed");
            if (still_current(gen) && cb.on_close) cb.on_close(kCloseAbnormal, "socket write failed");
            return false;
        }
        return true;

    case WsOpcode::Pong:
        return true;

    case WsOpcode::Close: {
        uint16_t code = 0;
        std::string reason;
        decode_close_payload(frame.payload, code, reason);
        if (!write_frame(WsOpcode::Close,
                         encode_close_payload(code == 1005 ? kCloseNormal : code, "")))
            std::cerr << "[websocket] could not echo close frame\n";
        TransportCallbacks cb = callbacks_;
        teardown();
        if (cb.on_close) cb.on_close(code, reason);
        return false;
    }
    }
    return true;
}

bool WebSocketTransport::write_frame(WsOpcode opcode, const std::string& payload) {
    if (!socket_) return false;
    std::string wire = encode_ws_frame(opcode, payload, random_mask());
    return socket_->write_all(wire.data(), wire.size());
}

bool WebSocketTransport::send_text(const std::string& text) {
    if (!socket_) return false;
    if (!write_frame(WsOpcode::Text, text)) {
        std::cerr << "[websocket] write failed\n";
        post_failure("socket write failed", kCloseAbnormal, "socket write failed");
        teardown();
        return false;
    }
    return true;
}

void WebSocketTransport::close(uint16_t code) {
    if (socket_ && !write_frame(WsOpcode::Close, encode_close_payload(code, "")))
        std::cerr << "[websocket] could not send close frame\n";
    teardown();
    // Invalidate anything already posted for this connection.
    ++generation_;
}

bool WebSocketTransport::is_open() const {
    return socket_ != nullptr;
}

void WebSocketTransport::teardown() {
    if (!socket_) return;
    loop_.unwatch_fd(socket_->fd);
    socket_.reset();
    assembler_.reset();
}

} // namespace chatlink

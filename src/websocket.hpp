#pragma once
#include "event_loop.hpp"
#include "transport.hpp"
#include "ws_frame.hpp"
#include <memory>
#include <string>

namespace chatlink {

struct WsUrl {
    bool tls = false;
    std::string host;
    std::string port;
    std::string path; // includes leading / and query string
};

// Parse ws:// or wss:// URLs. Throws TransportError on anything else.
WsUrl parse_ws_url(const std::string& url);

// RFC 6455 client over POSIX sockets + OpenSSL. The TCP connect, TLS
// handshake and HTTP upgrade run synchronously inside open() (bounded by
// connect_timeout_seconds); afterwards the socket is non-blocking and
// driven by the PollEventLoop.
class WebSocketTransport : public Transport {
public:
    explicit WebSocketTransport(PollEventLoop& loop, long connect_timeout_seconds = 10);
    ~WebSocketTransport() override;

    WebSocketTransport(const WebSocketTransport&) = delete;
    WebSocketTransport& operator=(const WebSocketTransport&) = delete;

    void open(const std::string& url, TransportCallbacks callbacks) override;
    bool send_text(const std::string& text) override;
    void close(uint16_t code = kCloseNormal) override;
    bool is_open() const override;

private:
    struct Socket;

    void on_readable();
    // Parses buffered frames; false once the connection is gone.
    bool drain_frames();
    // Returns false once the connection is gone (callbacks may have closed it).
    bool handle_frame(WsFrame& frame);
    bool write_frame(WsOpcode opcode, const std::string& payload);
    void teardown();
    // Deliver on_error (if non-empty) and on_close on the next loop turn.
    void post_failure(const std::string& error, uint16_t code, const std::string& reason);
    bool still_current(uint64_t gen) const;

    PollEventLoop& loop_;
    long connect_timeout_;
    std::unique_ptr<Socket> socket_;
    TransportCallbacks callbacks_;
    WsFrameParser parser_;
    WsMessageAssembler assembler_;
    uint64_t generation_ = 0;
    std::shared_ptr<bool> alive_ = std::make_shared<bool>(true);
};

} // namespace chatlink

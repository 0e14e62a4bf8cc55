#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

namespace chatlink {

enum class WsOpcode : uint8_t {
    Continuation = 0x0,
    Text         = 0x1,
    Binary       = 0x2,
    Close        = 0x8,
    Ping         = 0x9,
    Pong         = 0xA,
};

struct WsFrame {
    bool fin = true;
    WsOpcode opcode = WsOpcode::Text;
    std::string payload;
};

class WsProtocolError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Encode a client frame (RFC 6455 requires client frames to be masked).
std::string encode_ws_frame(WsOpcode opcode, const std::string& payload,
                            const std::array<uint8_t, 4>& mask, bool fin = true);

// Close frame payload: 2-byte big-endian code followed by a UTF-8 reason.
std::string encode_close_payload(uint16_t code, const std::string& reason);
void decode_close_payload(const std::string& payload, uint16_t& code, std::string& reason);

// Sec-WebSocket-Accept value expected for a given Sec-WebSocket-Key.
std::string websocket_accept_key(const std::string& client_key);

// Incremental frame decoder for bytes received from the server.
class WsFrameParser {
public:
    explicit WsFrameParser(size_t max_payload = 16 * 1024 * 1024)
        : max_payload_(max_payload) {}

    void feed(const char* data, size_t len) { buffer_.append(data, len); }

    // Next complete frame, or nullopt if more bytes are needed.
    // Throws WsProtocolError on reserved bits, bad opcodes or oversize frames.
    std::optional<WsFrame> next();

    size_t buffered() const { return buffer_.size(); }
    size_t max_payload() const { return max_payload_; }

private:
    std::string buffer_;
    size_t max_payload_;
};

// Joins data frames (Text/Binary plus Continuations) into whole messages,
// bounding the total size of a fragmented message.
class WsMessageAssembler {
public:
    explicit WsMessageAssembler(size_t max_message = 16 * 1024 * 1024)
        : max_message_(max_message) {}

    // Returns the complete message once its final fragment arrives. The
    // result carries the opcode of the first fragment.
    std::optional<WsFrame> add(WsFrame& frame);

    bool in_message() const { return in_message_; }
    void reset();

private:
    std::string buffer_;
    WsOpcode opcode_ = WsOpcode::Text;
    bool in_message_ = false;
    size_t max_message_;
};

} // namespace chatlink

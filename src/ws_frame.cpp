#include "ws_frame.hpp"
#include "util.hpp"

#include <openssl/sha.h>

namespace chatlink {

static constexpr const char* kWebSocketGuid = "258EAFA5-E914-47DA-95CA-C5AB0DC85B11";

std::string encode_ws_frame(WsOpcode opcode, const std::string& payload,
                            const std::array<uint8_t, 4>& mask, bool fin) {
    std::string out;
    out.reserve(payload.size() + 14);

    out.push_back(static_cast<char>((fin ? 0x80 : 0x00) | static_cast<uint8_t>(opcode)));

    uint64_t len = payload.size();
    if (len < 126) {
        out.push_back(static_cast<char>(0x80 | len));
    } else if (len <= 0xFFFF) {
        out.push_back(static_cast<char>(0x80 | 126));
        out.push_back(static_cast<char>((len >> 8) & 0xFF));
        out.push_back(static_cast<char>(len & 0xFF));
    } else {
        out.push_back(static_cast<char>(0x80 | 127));
        for (int shift = 56; shift >= 0; shift -= 8) {
            out.push_back(static_cast<char>((len >> shift) & 0xFF));
        }
    }

    for (uint8_t b : mask) out.push_back(static_cast<char>(b));
    for (size_t i = 0; i < payload.size(); ++i) {
        out.push_back(static_cast<char>(static_cast<uint8_t>(payload[i]) ^ mask[i % 4]));
    }
    return out;
}

std::string encode_close_payload(uint16_t code, const std::string& reason) {
    std::string out;
    out.push_back(static_cast<char>((code >> 8) & 0xFF));
    out.push_back(static_cast<char>(code & 0xFF));
    out += reason;
    return out;
}

void decode_close_payload(const std::string& payload, uint16_t& code, std::string& reason) {
    if (payload.size() < 2) {
        code = 1005; // no status received
        reason.clear();
        return;
    }
    code = static_cast<uint16_t>((static_cast<uint8_t>(payload[0]) << 8) |
                                 static_cast<uint8_t>(payload[1]));
    reason = payload.substr(2);
}

std::string websocket_accept_key(const std::string& client_key) {
    std::string input = client_key + kWebSocketGuid;
    unsigned char hash[SHA_DIGEST_LENGTH];
    SHA1(reinterpret_cast<const unsigned char*>(input.data()), input.size(), hash);
    return base64_encode(hash, SHA_DIGEST_LENGTH);
}

std::optional<WsFrame> WsFrameParser::next() {
    if (buffer_.size() < 2) return std::nullopt;

    auto byte = [this](size_t i) { return static_cast<uint8_t>(buffer_[i]); };

    uint8_t b0 = byte(0);
    uint8_t b1 = byte(1);
    if (b0 & 0x70) throw WsProtocolError("reserved bits set");

    uint8_t op = b0 & 0x0F;
    bool control = op >= 0x8;
    if (!(op <= 0x2 || (op >= 0x8 && op <= 0xA)))
        throw WsProtocolError("unknown opcode " + std::to_string(op));

    bool masked = (b1 & 0x80) != 0;
    uint64_t len = b1 & 0x7F;
    size_t pos = 2;

    if (len == 126) {
        if (buffer_.size() < 4) return std::nullopt;
        len = (static_cast<uint64_t>(byte(2)) << 8) | byte(3);
        pos = 4;
    } else if (len == 127) {
        if (buffer_.size() < 10) return std::nullopt;
        len = 0;
        for (size_t i = 2; i < 10; ++i) len = (len << 8) | byte(i);
        pos = 10;
    }

    if (control && (len > 125 || !(b0 & 0x80)))
        throw WsProtocolError("invalid control frame");
    if (len > max_payload_)
        throw WsProtocolError("frame exceeds " + std::to_string(max_payload_) + " bytes");

    std::array<uint8_t, 4> mask{};
    if (masked) {
        if (buffer_.size() < pos + 4) return std::nullopt;
        for (size_t i = 0; i < 4; ++i) mask[i] = byte(pos + i);
        pos += 4;
    }

    if (buffer_.size() < pos + len) return std::nullopt;

    WsFrame frame;
    frame.fin = (b0 & 0x80) != 0;
    frame.opcode = static_cast<WsOpcode>(op);
    frame.payload = buffer_.substr(pos, static_cast<size_t>(len));
    if (masked) {
        for (size_t i = 0; i < frame.payload.size(); ++i) {
            frame.payload[i] = static_cast<char>(
                static_cast<uint8_t>(frame.payload[i]) ^ mask[i % 4]);
        }
    }
    buffer_.erase(0, pos + static_cast<size_t>(len));
    return frame;
}

// ── Message reassembly ───────────────────────────────────────

std::optional<WsFrame> WsMessageAssembler::add(WsFrame& frame) {
    if (frame.opcode == WsOpcode::Continuation) {
        if (!in_message_) throw WsProtocolError("unexpected continuation frame");
        if (frame.payload.size() > max_message_ - buffer_.size())
            throw WsProtocolError("message exceeds " + std::to_string(max_message_) + " bytes");
        buffer_ += frame.payload;
    } else {
        if (in_message_) throw WsProtocolError("new message inside fragmented message");
        if (frame.payload.size() > max_message_)
            throw WsProtocolError("message exceeds " + std::to_string(max_message_) + " bytes");
        if (frame.fin) return std::move(frame);
        in_message_ = true;
        opcode_ = frame.opcode;
        buffer_ = std::move(frame.payload);
    }
    if (!frame.fin) return std::nullopt;

    WsFrame message;
    message.opcode = opcode_;
    message.payload = std::move(buffer_);
    reset();
    return message;
}

void WsMessageAssembler::reset() {
    buffer_.clear();
    in_message_ = false;
    opcode_ = WsOpcode::Text;
}

} // namespace chatlink

#include <catch2/catch.hpp>
#include "websocket.hpp"
#include "ws_frame.hpp"

using namespace chatlink;

static const std::array<uint8_t, 4> kMask = {0x37, 0xfa, 0x21, 0x3d};

// Server frames are unmasked.
static std::string server_frame(uint8_t first_byte, const std::string& payload) {
    std::string out;
    out.push_back(static_cast<char>(first_byte));
    if (payload.size() < 126) {
        out.push_back(static_cast<char>(payload.size()));
    } else {
        out.push_back(static_cast<char>(126));
        out.push_back(static_cast<char>((payload.size() >> 8) & 0xFF));
        out.push_back(static_cast<char>(payload.size() & 0xFF));
    }
    return out + payload;
}

// ── Encoding ─────────────────────────────────────────────────────

TEST_CASE("encode_ws_frame: RFC 6455 masked Hello example", "[ws]") {
    std::string frame = encode_ws_frame(WsOpcode::Text, "Hello", kMask);
    const unsigned char expected[] = {0x81, 0x85, 0x37, 0xfa, 0x21, 0x3d,
                                      0x7f, 0x9f, 0x4d, 0x51, 0x58};
    REQUIRE(frame == std::string(reinterpret_cast<const char*>(expected), sizeof(expected)));
}

TEST_CASE("encode_ws_frame: 16-bit extended length", "[ws]") {
    std::string payload(300, 'x');
    std::string frame = encode_ws_frame(WsOpcode::Text, payload, kMask);
    REQUIRE(static_cast<uint8_t>(frame[1]) == (0x80 | 126));
    REQUIRE(static_cast<uint8_t>(frame[2]) == 0x01);
    REQUIRE(static_cast<uint8_t>(frame[3]) == 0x2C);
    REQUIRE(frame.size() == 4 + 4 + 300);
}

TEST_CASE("encode_ws_frame: fin bit cleared for fragments", "[ws]") {
    std::string frame = encode_ws_frame(WsOpcode::Text, "part", kMask, false);
    REQUIRE(static_cast<uint8_t>(frame[0]) == 0x01);
}

TEST_CASE("close payload: code and reason", "[ws]") {
    std::string payload = encode_close_payload(1000, "bye");
    uint16_t code = 0;
    std::string reason;
    decode_close_payload(payload, code, reason);
    REQUIRE(code == 1000);
    REQUIRE(reason == "bye");

    decode_close_payload("", code, reason);
    REQUIRE(code == 1005);
    REQUIRE(reason.empty());
}

TEST_CASE("websocket_accept_key: RFC 6455 example", "[ws]") {
    REQUIRE(websocket_accept_key("dGhlIHNhbXBsZSBub25jZQ==") == "s3pPLMBiX21USd5w7xU7X0HkVp0=");
}

// ── Parsing ──────────────────────────────────────────────────────

TEST_CASE("WsFrameParser: unmasked text frame", "[ws]") {
    WsFrameParser parser;
    std::string bytes = server_frame(0x81, "Hello");
    parser.feed(bytes.data(), bytes.size());

    auto frame = parser.next();
    REQUIRE(frame.has_value());
    REQUIRE(frame->fin);
    REQUIRE(frame->opcode == WsOpcode::Text);
    REQUIRE(frame->payload == "Hello");
    REQUIRE(parser.buffered() == 0);
    REQUIRE_FALSE(parser.next().has_value());
}

TEST_CASE("WsFrameParser: waits for the rest of a split frame", "[ws]") {
    WsFrameParser parser;
    std::string bytes = server_frame(0x81, std::string(200, 'a'));

    parser.feed(bytes.data(), 3);
    REQUIRE_FALSE(parser.next().has_value());
    parser.feed(bytes.data() + 3, 50);
    REQUIRE_FALSE(parser.next().has_value());
    parser.feed(bytes.data() + 53, bytes.size() - 53);

    auto frame = parser.next();
    REQUIRE(frame.has_value());
    REQUIRE(frame->payload.size() == 200);
}

TEST_CASE("WsFrameParser: several frames in one read", "[ws]") {
    WsFrameParser parser;
    std::string bytes = server_frame(0x01, "Hel") + server_frame(0x89, "p") +
                        server_frame(0x80, "lo");
    parser.feed(bytes.data(), bytes.size());

    auto a = parser.next();
    auto b = parser.next();
    auto c = parser.next();
    REQUIRE((a && b && c));
    REQUIRE_FALSE(a->fin);
    REQUIRE(b->opcode == WsOpcode::Ping);
    REQUIRE(c->opcode == WsOpcode::Continuation);
    REQUIRE(a->payload + c->payload == "Hello");
}

TEST_CASE("WsFrameParser: unmasks masked frames", "[ws]") {
    WsFrameParser parser;
    std::string bytes = encode_ws_frame(WsOpcode::Text, "Hello", kMask);
    parser.feed(bytes.data(), bytes.size());
    auto frame = parser.next();
    REQUIRE(frame.has_value());
    REQUIRE(frame->payload == "Hello");
}

TEST_CASE("WsFrameParser: protocol violations throw", "[ws]") {
    SECTION("reserved bits") {
        WsFrameParser parser;
        std::string bytes = server_frame(0xC1, "x");
        parser.feed(bytes.data(), bytes.size());
        REQUIRE_THROWS_AS(parser.next(), WsProtocolError);
    }
    SECTION("unknown opcode") {
        WsFrameParser parser;
        std::string bytes = server_frame(0x83, "x");
        parser.feed(bytes.data(), bytes.size());
        REQUIRE_THROWS_AS(parser.next(), WsProtocolError);
    }
    SECTION("fragmented control frame") {
        WsFrameParser parser;
        std::string bytes = server_frame(0x09, "x");
        parser.feed(bytes.data(), bytes.size());
        REQUIRE_THROWS_AS(parser.next(), WsProtocolError);
    }
    SECTION("oversize payload") {
        WsFrameParser parser(16);
        std::string bytes = server_frame(0x81, std::string(17, 'x'));
        parser.feed(bytes.data(), bytes.size());
        REQUIRE_THROWS_AS(parser.next(), WsProtocolError);
    }
}

// ── URLs ─────────────────────────────────────────────────────────

static WsFrame data_frame(WsOpcode opcode, const std::string& payload, bool fin) {
    WsFrame f;
    f.opcode = opcode;
    f.payload = payload;
    f.fin = fin;
    return f;
}

TEST_CASE("WsMessageAssembler: joins fragments into one message", "[ws]") {
    WsMessageAssembler assembler;

    auto first = data_frame(WsOpcode::Text, "Hel", false);
    REQUIRE_FALSE(assembler.add(first).has_value());
    REQUIRE(assembler.in_message());

    auto last = data_frame(WsOpcode::Continuation, "lo", true);
    auto message = assembler.add(last);
    REQUIRE(message.has_value());
    REQUIRE(message->opcode == WsOpcode::Text);
    REQUIRE(message->payload == "Hello");
    REQUIRE_FALSE(assembler.in_message());

    auto single = data_frame(WsOpcode::Binary, "xy", true);
    message = assembler.add(single);
    REQUIRE(message->opcode == WsOpcode::Binary);
    REQUIRE(message->payload == "xy");
}

TEST_CASE("WsMessageAssembler: total size of a fragmented message is bounded", "[ws]") {
    WsMessageAssembler assembler(8);

    auto first = data_frame(WsOpcode::Text, "12345", false);
    REQUIRE_FALSE(assembler.add(first).has_value());
    auto middle = data_frame(WsOpcode::Continuation, "678", false);
    REQUIRE_FALSE(assembler.add(middle).has_value());
    auto over = data_frame(WsOpcode::Continuation, "9", true);
    REQUIRE_THROWS_AS(assembler.add(over), WsProtocolError);

    assembler.reset();
    auto big = data_frame(WsOpcode::Text, "123456789", true);
    REQUIRE_THROWS_AS(assembler.add(big), WsProtocolError);
}

TEST_CASE("WsMessageAssembler: fragment ordering violations throw", "[ws]") {
    WsMessageAssembler assembler;
    auto stray = data_frame(WsOpcode::Continuation, "x", true);
    REQUIRE_THROWS_AS(assembler.add(stray), WsProtocolError);

    auto first = data_frame(WsOpcode::Text, "a", false);
    REQUIRE_FALSE(assembler.add(first).has_value());
    auto interleaved = data_frame(WsOpcode::Text, "b", true);
    REQUIRE_THROWS_AS(assembler.add(interleaved), WsProtocolError);
}

TEST_CASE("parse_ws_url: ws defaults", "[ws]") {
    WsUrl u = parse_ws_url("ws://localhost:4001/ws?token=7");
    REQUIRE_FALSE(u.tls);
    REQUIRE(u.host == "localhost");
    REQUIRE(u.port == "4001");
    REQUIRE(u.path == "/ws?token=7");
}

TEST_CASE("parse_ws_url: wss default port and root path", "[ws]") {
    WsUrl u = parse_ws_url("wss://chat.example.com");
    REQUIRE(u.tls);
    REQUIRE(u.port == "443");
    REQUIRE(u.path == "/");
}

TEST_CASE("parse_ws_url: query without path", "[ws]") {
    WsUrl u = parse_ws_url("ws://host?token=1");
    REQUIRE(u.host == "host");
    REQUIRE(u.port == "80");
    REQUIRE(u.path == "/?token=1");
}

TEST_CASE("parse_ws_url: rejects other schemes", "[ws]") {
    REQUIRE_THROWS_AS(parse_ws_url("http://host/ws"), TransportError);
    REQUIRE_THROWS_AS(parse_ws_url("ws://"), TransportError);
    REQUIRE_THROWS_AS(parse_ws_url("host:4001"), TransportError);
}

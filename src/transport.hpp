#pragma once
#include <cstdint>
#include <functional>
#include <stdexcept>
#include <string>

namespace chatlink {

// WebSocket close codes used by the client.
constexpr uint16_t kCloseNormal   = 1000;
constexpr uint16_t kCloseGoingAway = 1001;
constexpr uint16_t kCloseAbnormal = 1006;

// Raised on send paths when the connection cannot carry the frame.
class TransportError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct TransportCallbacks {
    std::function<void()> on_open;
    std::function<void(const std::string& text)> on_text;
    // Transport-level failure; always followed by on_close.
    std::function<void(const std::string& error)> on_error;
    std::function<void(uint16_t code, const std::string& reason)> on_close;
};

// A single bidirectional text-frame connection (injectable for testing).
// Callbacks are always delivered from the event loop, never from inside
// open(), send_text() or close().
class Transport {
public:
    virtual ~Transport() = default;

    // Start connecting to url. Throws TransportError if the attempt cannot start.
    virtual void open(const std::string& url, TransportCallbacks callbacks) = 0;

    // Send one text frame. Returns false if the connection is not open or the write failed.
    virtual bool send_text(const std::string& text) = 0;

    // Tear the connection down. No further callbacks are delivered for it.
    virtual void close(uint16_t code = kCloseNormal) = 0;

    virtual bool is_open() const = 0;
};

} // namespace chatlink

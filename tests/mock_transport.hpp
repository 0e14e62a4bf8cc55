#pragma once
#include "transport.hpp"
#include <string>
#include <vector>

namespace chatlink {

// Scripted Transport. Tests drive the socket side with simulate_*().
class MockTransport : public Transport {
public:
    std::vector<std::string> opened_urls;
    std::vector<std::string> sent;
    std::vector<uint16_t> close_codes;
    bool fail_next_open = false;
    bool fail_sends = false;

    void open(const std::string& url, TransportCallbacks callbacks) override {
        opened_urls.push_back(url);
        if (fail_next_open) {
            fail_next_open = false;
            throw TransportError("connection refused");
        }
        callbacks_ = std::move(callbacks);
        connecting_ = true;
        open_ = false;
    }

    bool send_text(const std::string& text) override {
        if (!open_ || fail_sends) return false;
        sent.push_back(text);
        return true;
    }

    void close(uint16_t code) override {
        close_codes.push_back(code);
        connecting_ = false;
        open_ = false;
        callbacks_ = {};
    }

    bool is_open() const override { return open_; }

    bool connecting() const { return connecting_; }
    size_t open_count() const { return opened_urls.size(); }

    void simulate_open() {
        connecting_ = false;
        open_ = true;
        if (callbacks_.on_open) callbacks_.on_open();
    }

    void simulate_text(const std::string& text) {
        auto cb = callbacks_.on_text;
        if (cb) cb(text);
    }

    void simulate_error(const std::string& error) {
        auto cb = callbacks_.on_error;
        if (cb) cb(error);
    }

    void simulate_close(uint16_t code, const std::string& reason = "") {
        connecting_ = false;
        open_ = false;
        auto cb = std::move(callbacks_.on_close);
        callbacks_ = {};
        if (cb) cb(code, reason);
    }

private:
    TransportCallbacks callbacks_;
    bool connecting_ = false;
    bool open_ = false;
};

} // namespace chatlink

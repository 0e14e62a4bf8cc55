#pragma once
#include "event_loop.hpp"
#include <algorithm>
#include <deque>
#include <map>
#include <optional>
#include <vector>

namespace chatlink {

// Deterministic EventLoop: time only moves when a test calls advance().
class ManualEventLoop : public EventLoop {
public:
    explicit ManualEventLoop(int64_t start_ms = 1700000000000) : now_(start_ms) {}

    int64_t now_ms() const override { return now_; }

    TimerId schedule(int64_t delay_ms, Task task) override {
        TimerId id = next_id_++;
        int64_t delay = std::max<int64_t>(delay_ms, 0);
        timers_.emplace(id, Timer{now_ + delay, std::move(task)});
        scheduled_delays.push_back(delay);
        return id;
    }

    bool cancel(TimerId id) override { return timers_.erase(id) > 0; }

    void post(Task task) override { posted_.push_back(std::move(task)); }

    // Drain posted tasks, including ones posted while draining.
    void run_posted() {
        while (!posted_.empty()) {
            Task task = std::move(posted_.front());
            posted_.pop_front();
            task();
        }
    }

    // Move the clock forward by ms, firing due timers in due order.
    void advance(int64_t ms) {
        int64_t target = now_ + ms;
        run_posted();
        for (;;) {
            auto it = earliest();
            if (it == timers_.end() || it->second.due > target) break;
            now_ = it->second.due;
            Task task = std::move(it->second.task);
            timers_.erase(it);
            task();
            run_posted();
        }
        now_ = target;
    }

    // Jump the wall clock without firing anything.
    void set_now(int64_t ms) { now_ = ms; }

    size_t pending_timers() const { return timers_.size(); }
    size_t pending_posts() const { return posted_.size(); }

    // Milliseconds until the next timer fires.
    std::optional<int64_t> next_timer_in() const {
        auto it = earliest();
        if (it == timers_.end()) return std::nullopt;
        return it->second.due - now_;
    }

    // Delay passed to every schedule() call, in call order.
    std::vector<int64_t> scheduled_delays;

private:
    struct Timer {
        int64_t due;
        Task task;
    };

    std::map<TimerId, Timer>::iterator earliest() {
        auto best = timers_.end();
        for (auto it = timers_.begin(); it != timers_.end(); ++it) {
            if (best == timers_.end() || it->second.due < best->second.due) best = it;
        }
        return best;
    }

    std::map<TimerId, Timer>::const_iterator earliest() const {
        auto best = timers_.end();
        for (auto it = timers_.begin(); it != timers_.end(); ++it) {
            if (best == timers_.end() || it->second.due < best->second.due) best = it;
        }
        return best;
    }

    int64_t now_;
    TimerId next_id_ = 1;
    std::map<TimerId, Timer> timers_;
    std::deque<Task> posted_;
};

} // namespace chatlink

#pragma once
#include <atomic>
#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <unordered_map>

namespace chatlink {

using Task = std::function<void()>;
using TimerId = uint64_t;

// Removes the registration it was returned for. Safe to call more than once
// and after the owner is gone.
using Unsubscribe = std::function<void()>;

// Single-threaded scheduler every service runs on. Timers, posted tasks and
// socket callbacks never run concurrently with each other.
class EventLoop {
public:
    virtual ~EventLoop() = default;

    // Wall-clock time in epoch milliseconds (used for message/metadata timestamps).
    virtual int64_t now_ms() const = 0;

    // Run task once after delay_ms. Returns an id usable with cancel().
    virtual TimerId schedule(int64_t delay_ms, Task task) = 0;

    // Cancel a pending timer. Returns false if the id is unknown or already fired.
    virtual bool cancel(TimerId id) = 0;

    // Run task on the next loop turn, after the current callback returns.
    virtual void post(Task task) = 0;
};

// poll(2)-driven loop with fd watches, used by the CLI and the WebSocket transport.
class PollEventLoop : public EventLoop {
public:
    int64_t now_ms() const override;
    TimerId schedule(int64_t delay_ms, Task task) override;
    bool cancel(TimerId id) override;
    void post(Task task) override;

    // Invoke on_readable whenever fd polls readable (or hung up).
    void watch_fd(int fd, Task on_readable);
    void unwatch_fd(int fd);

    // One iteration: posted tasks, fd readiness (waiting at most max_wait_ms), due timers.
    void run_once(int64_t max_wait_ms);

    // Loop until stop becomes true.
    void run(const std::atomic<bool>& stop);

    size_t pending_timers() const { return timers_.size(); }

private:
    using Clock = std::chrono::steady_clock;

    struct Timer {
        Clock::time_point due;
        Task task;
    };

    void run_posted();
    void run_due_timers();
    int64_t ms_until_next_timer() const;

    std::unordered_map<TimerId, Timer> timers_;
    std::map<int, Task> watches_;
    std::deque<Task> posted_;
    TimerId next_timer_id_ = 1;
};

} // namespace chatlink

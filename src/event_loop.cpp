#include "event_loop.hpp"
#include "util.hpp"

#include <poll.h>

#include <algorithm>
#include <cerrno>
#include <iostream>
#include <vector>

namespace chatlink {

int64_t PollEventLoop::now_ms() const {
    return epoch_millis();
}

TimerId PollEventLoop::schedule(int64_t delay_ms, Task task) {
    TimerId id = next_timer_id_++;
    auto due = Clock::now() + std::chrono::milliseconds(std::max<int64_t>(delay_ms, 0));
    timers_.emplace(id, Timer{due, std::move(task)});
    return id;
}

bool PollEventLoop::cancel(TimerId id) {
    return timers_.erase(id) > 0;
}

void PollEventLoop::post(Task task) {
    posted_.push_back(std::move(task));
}

void PollEventLoop::watch_fd(int fd, Task on_readable) {
    watches_[fd] = std::move(on_readable);
}

void PollEventLoop::unwatch_fd(int fd) {
    watches_.erase(fd);
}

void PollEventLoop::run_posted() {
    // Tasks posted while draining run on the next turn.
    std::deque<Task> batch;
    batch.swap(posted_);
    for (auto& task : batch) {
        task();
    }
}

int64_t PollEventLoop::ms_until_next_timer() const {
    if (timers_.empty()) return -1;
    auto now = Clock::now();
    auto next = Clock::time_point::max();
    for (const auto& [id, timer] : timers_) {
        next = std::min(next, timer.due);
    }
    if (next <= now) return 0;
    return std::chrono::duration_cast<std::chrono::milliseconds>(next - now).count() + 1;
}

void PollEventLoop::run_due_timers() {
    auto now = Clock::now();
    std::vector<std::pair<Clock::time_point, TimerId>> due;
    for (const auto& [id, timer] : timers_) {
        if (timer.due <= now) due.emplace_back(timer.due, id);
    }
    std::sort(due.begin(), due.end());

    for (const auto& [when, id] : due) {
        auto it = timers_.find(id);
        if (it == timers_.end()) continue; // cancelled by an earlier timer
        Task task = std::move(it->second.task);
        timers_.erase(it);
        task();
    }
}

void PollEventLoop::run_once(int64_t max_wait_ms) {
    run_posted();

    int64_t wait = max_wait_ms;
    int64_t next_timer = ms_until_next_timer();
    if (next_timer >= 0 && next_timer < wait) wait = next_timer;
    if (!posted_.empty()) wait = 0;

    std::vector<pollfd> fds;
    fds.reserve(watches_.size());
    for (const auto& [fd, task] : watches_) {
        fds.push_back(pollfd{fd, POLLIN, 0});
    }

    int ret = ::poll(fds.data(), static_cast<nfds_t>(fds.size()), static_cast<int>(wait));
    if (ret < 0 && errno != EINTR) {
        std::cerr << "[loop] poll failed: errno " << errno << "\n";
    }

    if (ret > 0) {
        for (const auto& p : fds) {
            if (!(p.revents & (POLLIN | POLLHUP | POLLERR))) continue;
            // A previous callback may have unwatched this fd.
            auto it = watches_.find(p.fd);
            if (it == watches_.end()) continue;
            Task task = it->second;
            task();
        }
    }

    run_due_timers();
}

void PollEventLoop::run(const std::atomic<bool>& stop) {
    while (!stop.load()) {
        run_once(1000);
    }
}

} // namespace chatlink

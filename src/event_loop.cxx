/*
    TapeVM - A debuggable brainfuck VM
    Event loop implementation
    Published under the GNU AGPL-3.0-or-later license
*/
// SPDX-License-Identifier: AGPL-3.0-or-later
#include "tapevm/scheduler.hxx"

#include <utility>

namespace tapevm {

using std::chrono::milliseconds;

EventLoop::EventLoop(Clock clock, milliseconds frameInterval)
    : clock_(clock), frameInterval_(frameInterval) {}

milliseconds EventLoop::nowLocked() const {
    if (clock_ == Clock::Simulated) return simulated_;
    return std::chrono::duration_cast<milliseconds>(std::chrono::steady_clock::now() - start_);
}

milliseconds EventLoop::now() const {
    std::lock_guard lock(mutex_);
    return nowLocked();
}

TaskId EventLoop::addTimer(milliseconds delay, Task task, bool repeat) {
    TaskId id;
    {
        std::lock_guard lock(mutex_);
        id = nextId_++;
        timers_.emplace(id, Timer{nowLocked() + delay, delay,
                                  std::make_shared<Task>(std::move(task)), repeat});
    }
    wake_.notify_all();
    return id;
}

void EventLoop::removeTimer(TaskId id) {
    std::lock_guard lock(mutex_);
    timers_.erase(id);
}

TaskId EventLoop::setInterval(milliseconds period, Task task) {
    if (period < milliseconds(1)) period = milliseconds(1);
    return addTimer(period, std::move(task), true);
}

void EventLoop::clearInterval(TaskId id) { removeTimer(id); }

TaskId EventLoop::requestFrame(Task task) { return addTimer(frameInterval_, std::move(task), false); }

void EventLoop::cancelFrame(TaskId id) { removeTimer(id); }

void EventLoop::post(Task task) {
    {
        std::lock_guard lock(mutex_);
        posted_.push_back(std::move(task));
    }
    wake_.notify_all();
}

bool EventLoop::idle() const {
    std::lock_guard lock(mutex_);
    return posted_.empty() && timers_.empty();
}

bool EventLoop::runOnce() {
    std::unique_lock lock(mutex_);
    if (!posted_.empty()) {
        std::deque<Task> batch;
        batch.swap(posted_);
        lock.unlock();
        for (auto& task : batch) task();
        return true;
    }
    if (timers_.empty()) return false;

    // Earliest due timer; map order breaks ties by creation.
    auto next = timers_.begin();
    for (auto it = timers_.begin(); it != timers_.end(); ++it) {
        if (it->second.due < next->second.due) next = it;
    }
    const TaskId id = next->first;
    const milliseconds due = next->second.due;
    if (clock_ == Clock::Simulated) {
        if (simulated_ < due) simulated_ = due;
    } else if (nowLocked() < due) {
        wake_.wait_until(lock, start_ + due, [this] { return !posted_.empty() || quit_; });
        // Woken early; the caller loops back and picks up whatever arrived.
        if (nowLocked() < due) return true;
    }

    auto it = timers_.find(id);
    if (it == timers_.end()) return true;
    auto task = it->second.task;
    if (it->second.repeat) {
        it->second.due += it->second.period;
    } else {
        timers_.erase(it);
    }
    lock.unlock();
    (*task)();
    return true;
}

bool EventLoop::waitForWork(milliseconds timeout) {
    std::unique_lock lock(mutex_);
    return wake_.wait_for(lock, timeout, [this] { return !posted_.empty() || !timers_.empty(); });
}

bool EventLoop::runUntil(const std::function<bool()>& done, std::size_t maxIterations,
                         milliseconds idleWait) {
    for (std::size_t i = 0; i < maxIterations; ++i) {
        if (done()) return true;
        if (!runOnce() && (idleWait.count() == 0 || !waitForWork(idleWait))) break;
    }
    return done();
}

void EventLoop::run() {
    for (;;) {
        {
            std::lock_guard lock(mutex_);
            if (quit_) {
                quit_ = false;
                return;
            }
        }
        if (!runOnce()) {
            std::unique_lock lock(mutex_);
            wake_.wait(lock, [this] { return quit_ || !posted_.empty() || !timers_.empty(); });
        }
    }
}

void EventLoop::quit() {
    {
        std::lock_guard lock(mutex_);
        quit_ = true;
    }
    wake_.notify_all();
}

}  // namespace tapevm

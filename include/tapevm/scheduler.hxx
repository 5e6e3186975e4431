/*
    TapeVM - A debuggable brainfuck VM
    Host scheduler and event loop
    Published under the GNU AGPL-3.0-or-later license
*/
// SPDX-License-Identifier: AGPL-3.0-or-later
#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>

#include "tapevm.hxx"

namespace tapevm {

using TaskId = std::uint64_t;

/// @brief Cooperative host scheduler the engines yield to.
///
/// Interval and frame callbacks run on the scheduler's thread. post() may be called from any thread.
class Scheduler {
   public:
    using Task = std::function<void()>;

    virtual ~Scheduler() = default;

    virtual TaskId setInterval(std::chrono::milliseconds period, Task task) = 0;
    virtual void clearInterval(TaskId id) = 0;
    /// One-shot callback at the next display refresh.
    virtual TaskId requestFrame(Task task) = 0;
    virtual void cancelFrame(TaskId id) = 0;
    virtual void post(Task task) = 0;
};

class EventLoop final : public Scheduler {
   public:
    enum class Clock : std::uint8_t { Real, Simulated };

    explicit EventLoop(Clock clock = Clock::Real,
                       std::chrono::milliseconds frameInterval =
                           std::chrono::milliseconds(TAPEVM_FRAME_INTERVAL_MS));
    EventLoop(const EventLoop&) = delete;
    EventLoop& operator=(const EventLoop&) = delete;

    TaskId setInterval(std::chrono::milliseconds period, Task task) override;
    void clearInterval(TaskId id) override;
    TaskId requestFrame(Task task) override;
    void cancelFrame(TaskId id) override;
    void post(Task task) override;

    /// Runs every posted task, or else the next due timer. Returns false when there is nothing to
    /// run at all. With the real clock this sleeps until the timer is due or a task is posted.
    bool runOnce();
    /// Runs until done() holds or nothing is left to run. When idle, waits up to idleWait for
    /// work posted from another thread before giving up. Returns done().
    bool runUntil(const std::function<bool()>& done, std::size_t maxIterations = SIZE_MAX,
                  std::chrono::milliseconds idleWait = std::chrono::milliseconds(0));
    /// Runs until quit(), waiting for posted work when idle.
    void run();
    void quit();

    bool idle() const;
    std::chrono::milliseconds now() const;

   private:
    struct Timer {
        std::chrono::milliseconds due;
        std::chrono::milliseconds period;
        std::shared_ptr<Task> task;
        bool repeat;
    };

    TaskId addTimer(std::chrono::milliseconds delay, Task task, bool repeat);
    void removeTimer(TaskId id);
    bool waitForWork(std::chrono::milliseconds timeout);
    std::chrono::milliseconds nowLocked() const;

    const Clock clock_;
    const std::chrono::milliseconds frameInterval_;
    const std::chrono::steady_clock::time_point start_ = std::chrono::steady_clock::now();
    std::chrono::milliseconds simulated_{0};

    mutable std::mutex mutex_;
    std::condition_variable wake_;
    std::deque<Task> posted_;
    std::map<TaskId, Timer> timers_;
    TaskId nextId_ = 1;
    bool quit_ = false;
};

}  // namespace tapevm

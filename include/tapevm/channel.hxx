/*
    TapeVM - A debuggable brainfuck VM
    Buffered message channel
    Published under the GNU AGPL-3.0-or-later license
*/
// SPDX-License-Identifier: AGPL-3.0-or-later
#pragma once

#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <utility>

namespace tapevm {

/// @brief Ordered, lossless channel that holds messages until the receiver is ready.
///
/// send() queues while the channel is closed. open() flushes the queue in order and from then on
/// delivers directly to the sink. The sink must not call back into the channel.
template <typename Message>
class BufferedChannel {
   public:
    using Sink = std::function<void(Message)>;

    explicit BufferedChannel(Sink sink) : sink(std::move(sink)) {}

    void send(Message message) {
        std::lock_guard lock(mutex);
        if (!ready) {
            pending.push_back(std::move(message));
            return;
        }
        sink(std::move(message));
    }

    void open() {
        std::lock_guard lock(mutex);
        while (!pending.empty()) {
            sink(std::move(pending.front()));
            pending.pop_front();
        }
        ready = true;
    }

    void close() {
        std::lock_guard lock(mutex);
        ready = false;
    }

    bool isOpen() const {
        std::lock_guard lock(mutex);
        return ready;
    }

    std::size_t queued() const {
        std::lock_guard lock(mutex);
        return pending.size();
    }

   private:
    Sink sink;
    std::deque<Message> pending;
    mutable std::mutex mutex;
    bool ready = false;
};

}  // namespace tapevm

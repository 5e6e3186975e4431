/*
    TapeVM - A debuggable brainfuck VM
    Engine control surface and published state
    Published under the GNU AGPL-3.0-or-later license
*/
// SPDX-License-Identifier: AGPL-3.0-or-later
#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "tapevm.hxx"
#include "tapevm/debug_bridge.hxx"
#include "tapevm/source_map.hxx"
#include "tapevm/tape.hxx"

namespace tapevm {

enum class ExecutionMode : std::uint8_t { Normal, Turbo };

enum class RunState : std::uint8_t { Idle, Running, Paused, WaitingForInput, Stopped };

struct Metrics {
    std::uint64_t operations = 0;
    double seconds = 0.0;
    ExecutionMode mode = ExecutionMode::Normal;
};

/// @brief Externally observable engine snapshot, published after every state-affecting operation.
///
/// `tape` points at the publishing engine's tape and is only valid for the duration of the
/// observer callback.
struct ExecutionState {
    const Tape* tape = nullptr;
    std::size_t pointer = 0;
    bool isRunning = false;
    bool isPaused = false;
    bool isStopped = false;
    bool isWaitingForInput = false;
    std::string output;
    BreakpointSet breakpoints;
    SourceBreakpointMap sourceBreakpoints;
    std::shared_ptr<const SourceMap> sourceMap;
    Position position;
    std::optional<Position> sourcePosition;
    // Innermost macro first.
    std::vector<MacroFrame> macroContext;
    std::optional<Metrics> lastRun;
    ExecutionMode mode = ExecutionMode::Normal;
    unsigned laneCount = TAPEVM_DEFAULT_LANE_COUNT;

    RunState runState() const {
        if (isStopped) return RunState::Stopped;
        if (isWaitingForInput) return RunState::WaitingForInput;
        if (isPaused) return RunState::Paused;
        if (isRunning) return RunState::Running;
        return RunState::Idle;
    }
};

struct SparsePattern {
    std::size_t start = 4;
    std::size_t step = 8;
    std::size_t count = 1024;
};

// Memory-mapped output device: a 0 -> 1 edge on the flag cell publishes the sparse cells.
struct VmOutputConfig {
    std::size_t outCellIndex = 0;
    std::size_t outFlagCellIndex = 0;
    SparsePattern pattern;
};

struct VmOutputEvent {
    std::size_t pointer = 0;
    std::vector<std::size_t> indices;
    std::vector<std::uint32_t> values;
};

/// Everything needed to continue a session on another engine.
struct SessionState {
    EngineConfig config;
    std::vector<std::string> program;
    Tape tape{1, TAPEVM_DEFAULT_CELL_WIDTH};
    Position position;
    std::string output;
    // Directly set breakpoints; source breakpoints carry their own targets.
    BreakpointSet breakpoints;
    SourceBreakpointMap sourceBreakpoints;
    std::shared_ptr<const SourceMap> sourceMap;
    std::optional<VmOutputConfig> vmOutput;
    std::optional<Metrics> lastRun;
    // Breakpoint already reported at `position`; not hit again when execution continues.
    std::optional<Position> pausedAt;
    bool isStopped = false;
    bool isWaitingForInput = false;
};

using StateObserver = std::function<void(const ExecutionState&)>;
using PositionObserver = std::function<void(const Position&)>;
using VmOutputObserver = std::function<void(const VmOutputEvent&)>;
using SubscriptionId = std::uint64_t;

/// Observer registry that tolerates (un)subscription from inside a notification.
template <typename Observer>
class ObserverList {
   public:
    SubscriptionId add(SubscriptionId id, Observer observer) {
        entries.push_back(std::make_unique<Entry>(Entry{id, std::move(observer), true}));
        return id;
    }

    bool remove(SubscriptionId id) {
        for (auto it = entries.begin(); it != entries.end(); ++it) {
            Entry& entry = **it;
            if (entry.id != id || !entry.active) continue;
            // An observer being notified must outlive its own call.
            if (depth) {
                entry.active = false;
                dirty = true;
            } else {
                entries.erase(it);
            }
            return true;
        }
        return false;
    }

    template <typename... Args>
    void notify(const Args&... args) {
        ++depth;
        // Index loop: observers may subscribe while being notified.
        for (std::size_t i = 0; i < entries.size(); ++i) {
            Entry& entry = *entries[i];
            if (entry.active) entry.observer(args...);
        }
        if (--depth == 0 && dirty) {
            std::erase_if(entries, [](const auto& e) { return !e->active; });
            dirty = false;
        }
    }

    bool empty() const { return entries.empty(); }

   private:
    struct Entry {
        SubscriptionId id;
        Observer observer;
        bool active;
    };

    std::vector<std::unique_ptr<Entry>> entries;
    unsigned depth = 0;
    bool dirty = false;
};

/// @brief Control surface shared by the in-process interpreter, the worker proxy and the facade.
///
/// Configuration setters throw ConfigError and leave the engine untouched on invalid input.
/// Protocol violations (input while not waiting, resume while not paused) return false.
class Engine {
   public:
    virtual ~Engine() = default;

    virtual void setProgram(std::vector<std::string> lines) = 0;
    virtual void reset() = 0;
    /// Executes one instruction. Returns whether more of the program remains.
    /// An engine that executes asynchronously returns true once the step request is accepted;
    /// the outcome arrives with the next state notification.
    virtual bool step() = 0;
    virtual void run(std::chrono::milliseconds delay) = 0;
    virtual void runSmooth() = 0;
    virtual void runImmediately() = 0;
    virtual void runTurbo() = 0;
    virtual void resumeTurbo() = 0;
    virtual void pause() = 0;
    virtual bool resume() = 0;
    virtual void stop() = 0;
    virtual void runFromPosition(const Position& p) = 0;
    virtual void stepToPosition(const Position& p) = 0;

    virtual bool toggleBreakpoint(const Position& p) = 0;
    virtual SourceToggle toggleSourceBreakpoint(const Position& source) = 0;
    virtual bool hasBreakpointAt(const Position& p) const = 0;
    virtual bool hasSourceBreakpointAt(const Position& source) const = 0;
    virtual void clearBreakpoints() = 0;
    virtual void setSourceMap(std::shared_ptr<const SourceMap> map) = 0;

    virtual void setTapeSize(std::size_t size) = 0;
    virtual void setCellWidthBits(unsigned bits) = 0;
    virtual void setLaneCount(unsigned count) = 0;
    virtual void setIncrement(std::uint32_t increment) = 0;
    virtual bool provideInput(std::uint32_t code) = 0;
    /// Replaces the tape with `cells` (prefix, reduced mod 2^cellWidth) and resets position/output.
    virtual void loadSnapshot(const std::vector<std::uint32_t>& cells, std::size_t pointer,
                              unsigned cellWidth, std::size_t tapeSize) = 0;
    virtual void setVmOutputConfig(std::optional<VmOutputConfig> config) = 0;

    virtual SubscriptionId subscribe(StateObserver observer) = 0;
    virtual SubscriptionId subscribePosition(PositionObserver observer) = 0;
    virtual SubscriptionId subscribeVmOutput(VmOutputObserver observer) = 0;
    virtual void unsubscribe(SubscriptionId id) = 0;

    virtual const ExecutionState& state() const = 0;
    virtual EngineConfig config() const = 0;

    /// Captures the session and halts any active strategy on this engine.
    virtual SessionState exportSession() = 0;
    virtual void importSession(SessionState session) = 0;
};

}  // namespace tapevm

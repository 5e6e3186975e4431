/*
    TapeVM - A debuggable brainfuck VM
    In-process execution engine
    Published under the GNU AGPL-3.0-or-later license
*/
// SPDX-License-Identifier: AGPL-3.0-or-later
#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "tapevm.hxx"
#include "tapevm/debug_bridge.hxx"
#include "tapevm/engine.hxx"
#include "tapevm/program.hxx"
#include "tapevm/scheduler.hxx"
#include "tapevm/tape.hxx"

namespace tapevm {

/// @brief Single-session interpreter owning its tape, program index and published state.
///
/// Every strategy runs cooperatively on the given scheduler's thread. Instances share nothing, so
/// any number of them may coexist.
class Interpreter final : public Engine {
   public:
    explicit Interpreter(Scheduler& scheduler, EngineConfig config = {});
    ~Interpreter() override;
    Interpreter(const Interpreter&) = delete;
    Interpreter& operator=(const Interpreter&) = delete;

    void setProgram(std::vector<std::string> lines) override;
    void reset() override;
    bool step() override;
    void run(std::chrono::milliseconds delay) override;
    void runSmooth() override;
    void runImmediately() override;
    void runTurbo() override;
    void resumeTurbo() override;
    void pause() override;
    bool resume() override;
    void stop() override;
    void runFromPosition(const Position& p) override;
    void stepToPosition(const Position& p) override;

    bool toggleBreakpoint(const Position& p) override;
    SourceToggle toggleSourceBreakpoint(const Position& source) override;
    bool hasBreakpointAt(const Position& p) const override { return debug_.hasBreakpointAt(p); }
    bool hasSourceBreakpointAt(const Position& source) const override {
        return debug_.hasSourceBreakpointAt(source);
    }
    void clearBreakpoints() override;
    void setSourceMap(std::shared_ptr<const SourceMap> map) override;
    /// Replaces the expanded breakpoint set without touching source breakpoints.
    void setBreakpoints(BreakpointSet breakpoints);

    void setTapeSize(std::size_t size) override;
    void setCellWidthBits(unsigned bits) override;
    void setLaneCount(unsigned count) override;
    void setIncrement(std::uint32_t increment) override;
    bool provideInput(std::uint32_t code) override;
    void loadSnapshot(const std::vector<std::uint32_t>& cells, std::size_t pointer,
                      unsigned cellWidth, std::size_t tapeSize) override;
    void setVmOutputConfig(std::optional<VmOutputConfig> config) override;
    /// Moves the program counter without executing anything.
    void setPosition(const Position& p);

    SubscriptionId subscribe(StateObserver observer) override;
    SubscriptionId subscribePosition(PositionObserver observer) override;
    SubscriptionId subscribeVmOutput(VmOutputObserver observer) override;
    void unsubscribe(SubscriptionId id) override;

    const ExecutionState& state() const override { return state_; }
    EngineConfig config() const override { return config_; }
    const Tape& tape() const { return tape_; }
    const ProgramIndex& program() const { return program_; }

    SessionState exportSession() override;
    void importSession(SessionState session) override;

   private:
    enum class Strategy : std::uint8_t { None, Interval, Frame, Immediate, Turbo };
    enum class TurboExit : std::uint8_t { End, Yield, Input, Marker, Breakpoint };

    bool stepOnce();
    void moveTo(const Position& p);
    bool pauseIfBreakpoint(const Position& p);
    void beginRun(Strategy strategy, ExecutionMode mode);
    void releaseTimers();
    void finish();
    void finalizeMetrics();
    void publish();
    void checkVmOutput();
    void emitVmOutput(std::size_t pointer);
    void reportMissingMatch(const Position& p) const;

    void frameTick();
    void postImmediate();
    void immediateBatch();
    void postTurbo();
    void turboBatch();
    void refreshBreakMask(const CompiledProgram& compiled);
    template <typename CellT>
    TurboExit runOps(std::vector<CellT>& cells, const CompiledProgram& compiled,
                     std::size_t& index, std::size_t skipBreakAt);

    Scheduler& scheduler_;
    EngineConfig config_;
    Tape tape_;
    ProgramIndex program_;
    DebugBridge debug_;
    ExecutionState state_;

    std::optional<Position> lastPaused_;
    Strategy strategy_ = Strategy::None;
    std::optional<TaskId> interval_;
    std::optional<TaskId> frame_;
    // Bumped whenever the active strategy is released so stale posted batches do nothing.
    std::uint64_t generation_ = 0;
    std::shared_ptr<int> alive_ = std::make_shared<int>(0);

    std::optional<VmOutputConfig> vmOutput_;
    std::uint32_t lastFlag_ = 0;

    std::uint64_t operations_ = 0;
    std::chrono::steady_clock::time_point started_;
    bool metricsOpen_ = false;

    std::vector<std::uint8_t> breakMask_;
    std::uint64_t maskVersion_ = 0;
    std::uint64_t maskProgram_ = 0;
    std::uint64_t programVersion_ = 1;

    ObserverList<StateObserver> stateObservers_;
    ObserverList<PositionObserver> positionObservers_;
    ObserverList<VmOutputObserver> vmOutputObservers_;
    SubscriptionId nextSubscription_ = 1;
};

}  // namespace tapevm

/*
    TapeVM - A debuggable brainfuck VM
    Engine-switching execution facade
    Published under the GNU AGPL-3.0-or-later license
*/
// SPDX-License-Identifier: AGPL-3.0-or-later
#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "tapevm.hxx"
#include "tapevm/engine.hxx"
#include "tapevm/interpreter.hxx"
#include "tapevm/scheduler.hxx"
#include "tapevm/worker.hxx"

namespace tapevm {

enum class EngineKind : std::uint8_t { Local, Worker };

enum class RunMode : std::uint8_t { Interval, Smooth, Immediate, Turbo, TurboResume };

/// Engine a run mode must execute on, or none when the current engine may keep it.
constexpr std::optional<EngineKind> requiredEngine(RunMode mode, bool workerEnabled) {
    switch (mode) {
        case RunMode::Interval:
        case RunMode::Smooth:
            return EngineKind::Local;
        case RunMode::Turbo:
        case RunMode::TurboResume:
            if (workerEnabled) return EngineKind::Worker;
            return std::nullopt;
        case RunMode::Immediate:
            return std::nullopt;
    }
    return std::nullopt;
}

const char* toString(EngineKind kind);

/// @brief Single control surface over an in-process interpreter and an optional worker engine.
///
/// Observers registered here survive engine switches. The session (tape, position, output,
/// breakpoints, configuration, source map) moves with every switch.
class ExecutionFacade final : public Engine {
   public:
    explicit ExecutionFacade(Scheduler& scheduler, EngineConfig config = {},
                             bool useWorker = true);
    ~ExecutionFacade() override;
    ExecutionFacade(const ExecutionFacade&) = delete;
    ExecutionFacade& operator=(const ExecutionFacade&) = delete;

    EngineKind activeKind() const { return active_; }
    Engine& active();
    const Engine& active() const;

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
    bool hasBreakpointAt(const Position& p) const override;
    bool hasSourceBreakpointAt(const Position& source) const override;
    void clearBreakpoints() override;
    void setSourceMap(std::shared_ptr<const SourceMap> map) override;

    void setTapeSize(std::size_t size) override;
    void setCellWidthBits(unsigned bits) override;
    void setLaneCount(unsigned count) override;
    void setIncrement(std::uint32_t increment) override;
    bool provideInput(std::uint32_t code) override;
    void loadSnapshot(const std::vector<std::uint32_t>& cells, std::size_t pointer,
                      unsigned cellWidth, std::size_t tapeSize) override;
    void setVmOutputConfig(std::optional<VmOutputConfig> config) override;

    SubscriptionId subscribe(StateObserver observer) override;
    SubscriptionId subscribePosition(PositionObserver observer) override;
    SubscriptionId subscribeVmOutput(VmOutputObserver observer) override;
    void unsubscribe(SubscriptionId id) override;

    const ExecutionState& state() const override { return active().state(); }
    EngineConfig config() const override { return active().config(); }

    SessionState exportSession() override { return active().exportSession(); }
    void importSession(SessionState session) override;

   private:
    void select(RunMode mode);
    void switchTo(EngineKind kind);
    void attach();
    void detach();

    Scheduler& scheduler_;
    const bool useWorker_;
    EngineKind active_ = EngineKind::Local;
    std::unique_ptr<Interpreter> local_;
    std::unique_ptr<WorkerEngine> worker_;

    ObserverList<StateObserver> stateObservers_;
    ObserverList<PositionObserver> positionObservers_;
    ObserverList<VmOutputObserver> vmOutputObservers_;
    SubscriptionId nextSubscription_ = 1;
    // Forwarding subscriptions held on the active engine.
    std::vector<SubscriptionId> forwarding_;
};

}  // namespace tapevm

/*
    TapeVM - A debuggable brainfuck VM
    Worker-thread engine reached by message passing
    Published under the GNU AGPL-3.0-or-later license
*/
// SPDX-License-Identifier: AGPL-3.0-or-later
#pragma once

#include <cstddef>
#include <cstdint>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <variant>
#include <vector>

#include "tapevm.hxx"
#include "tapevm/channel.hxx"
#include "tapevm/debug_bridge.hxx"
#include "tapevm/engine.hxx"
#include "tapevm/scheduler.hxx"
#include "tapevm/tape.hxx"

namespace tapevm {

class Interpreter;

namespace worker {

// Host -> worker.
struct SetProgram {
    std::vector<std::string> lines;
};
struct Reset {};
struct Step {};
struct RunTurbo {};
struct ResumeTurbo {};
struct Pause {};
struct Resume {};
struct Stop {};
struct SetBreakpoints {
    BreakpointSet breakpoints;
};
struct SetPosition {
    Position position;
    bool stepAfter = false;
};
struct Configure {
    EngineConfig config;
};
struct ProvideInput {
    std::uint32_t code;
};
struct LoadSnapshot {
    std::vector<std::uint32_t> cells;
    std::size_t pointer;
    unsigned cellWidth;
    std::size_t tapeSize;
};
struct SetVmOutputConfig {
    std::optional<VmOutputConfig> config;
};
struct Import {
    SessionState session;
};
struct Export {
    std::shared_ptr<std::promise<SessionState>> reply;
};
struct Shutdown {};

using Request = std::variant<SetProgram, Reset, Step, RunTurbo, ResumeTurbo, Pause, Resume, Stop,
                             SetBreakpoints, SetPosition, Configure, ProvideInput, LoadSnapshot,
                             SetVmOutputConfig, Import, Export, Shutdown>;

// Worker -> host.
struct StateUpdate {
    std::size_t pointer = 0;
    bool isRunning = false;
    bool isPaused = false;
    bool isStopped = false;
    bool isWaitingForInput = false;
    std::string output;
    Position position;
    std::optional<Metrics> lastRun;
    ExecutionMode mode = ExecutionMode::Normal;
    // Sent only while not actively running.
    std::optional<Tape> tape;
};

}  // namespace worker

/// @brief Engine whose interpreter runs on a dedicated thread with its own event loop.
///
/// The host side keeps a mirror of the published state, the breakpoint sets and the source map;
/// the worker only ever sees value messages. Requests issued before the worker signals readiness are
/// queued and delivered in order. Replies are posted to the host scheduler, which must outlive this
/// object.
class WorkerEngine final : public Engine {
   public:
    explicit WorkerEngine(Scheduler& host, EngineConfig config = {});
    ~WorkerEngine() override;
    WorkerEngine(const WorkerEngine&) = delete;
    WorkerEngine& operator=(const WorkerEngine&) = delete;

    bool ready() const { return ready_; }

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

    const ExecutionState& state() const override { return state_; }
    EngineConfig config() const override { return config_; }

    SessionState exportSession() override;
    void importSession(SessionState session) override;

   private:
    void send(worker::Request request);
    void workerMain(EngineConfig config);
    void handle(worker::Request& request);
    void publishFromWorker();

    void onReady();
    void onState(worker::StateUpdate update);
    void onVmOutput(const VmOutputEvent& event);
    void syncBreakpoints();
    void configure();
    void publish();
    void track(const Position& p);
    // The mirror assumes a request took effect until the worker's next reply says otherwise.
    void expectIdle();
    void expectRunning();

    Scheduler& host_;
    std::shared_ptr<int> alive_ = std::make_shared<int>(0);
    bool ready_ = false;

    // Host-side mirror.
    EngineConfig config_;
    DebugBridge debug_;
    Tape tape_;
    ExecutionState state_;
    ObserverList<StateObserver> stateObservers_;
    ObserverList<PositionObserver> positionObservers_;
    ObserverList<VmOutputObserver> vmOutputObservers_;
    SubscriptionId nextSubscription_ = 1;

    // Set on the worker thread before the channel opens; used only from there afterwards.
    EventLoop* loop_ = nullptr;
    Interpreter* engine_ = nullptr;

    BufferedChannel<worker::Request> channel_;
    std::thread thread_;
};

}  // namespace tapevm

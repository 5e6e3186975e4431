/*
    TapeVM - A debuggable brainfuck VM
    Engine-switching execution facade
    Published under the GNU AGPL-3.0-or-later license
*/
// SPDX-License-Identifier: AGPL-3.0-or-later
#include "tapevm/facade.hxx"

#include <utility>

namespace tapevm {

const char* toString(EngineKind kind) {
    switch (kind) {
        case EngineKind::Local:
            return "local";
        case EngineKind::Worker:
            return "worker";
    }
    return "unknown";
}

ExecutionFacade::ExecutionFacade(Scheduler& scheduler, EngineConfig config, bool useWorker)
    : scheduler_(scheduler),
      useWorker_(useWorker),
      local_(std::make_unique<Interpreter>(scheduler, config)) {
    attach();
}

ExecutionFacade::~ExecutionFacade() { detach(); }

Engine& ExecutionFacade::active() {
    if (active_ == EngineKind::Worker) return *worker_;
    return *local_;
}

const Engine& ExecutionFacade::active() const {
    if (active_ == EngineKind::Worker) return *worker_;
    return *local_;
}

void ExecutionFacade::attach() {
    Engine& engine = active();
    forwarding_.push_back(
        engine.subscribe([this](const ExecutionState& s) { stateObservers_.notify(s); }));
    forwarding_.push_back(
        engine.subscribePosition([this](const Position& p) { positionObservers_.notify(p); }));
    forwarding_.push_back(engine.subscribeVmOutput(
        [this](const VmOutputEvent& e) { vmOutputObservers_.notify(e); }));
}

void ExecutionFacade::detach() {
    Engine& engine = active();
    for (auto id : forwarding_) engine.unsubscribe(id);
    forwarding_.clear();
}

void ExecutionFacade::switchTo(EngineKind kind) {
    if (kind == active_) return;
    SessionState session = active().exportSession();
    detach();
    if (kind == EngineKind::Worker && !worker_) {
        worker_ = std::make_unique<WorkerEngine>(scheduler_, session.config);
    }
    active_ = kind;
    attach();
    active().importSession(std::move(session));
}

void ExecutionFacade::select(RunMode mode) {
    if (auto kind = requiredEngine(mode, useWorker_)) switchTo(*kind);
}

SubscriptionId ExecutionFacade::subscribe(StateObserver observer) {
    return stateObservers_.add(nextSubscription_++, std::move(observer));
}

SubscriptionId ExecutionFacade::subscribePosition(PositionObserver observer) {
    return positionObservers_.add(nextSubscription_++, std::move(observer));
}

SubscriptionId ExecutionFacade::subscribeVmOutput(VmOutputObserver observer) {
    return vmOutputObservers_.add(nextSubscription_++, std::move(observer));
}

void ExecutionFacade::unsubscribe(SubscriptionId id) {
    if (stateObservers_.remove(id)) return;
    if (positionObservers_.remove(id)) return;
    vmOutputObservers_.remove(id);
}

// Mode-selecting operations.

void ExecutionFacade::run(std::chrono::milliseconds delay) {
    select(RunMode::Interval);
    active().run(delay);
}

void ExecutionFacade::runSmooth() {
    select(RunMode::Smooth);
    active().runSmooth();
}

void ExecutionFacade::runImmediately() {
    select(RunMode::Immediate);
    active().runImmediately();
}

void ExecutionFacade::runTurbo() {
    select(RunMode::Turbo);
    active().runTurbo();
}

void ExecutionFacade::resumeTurbo() {
    select(RunMode::TurboResume);
    active().resumeTurbo();
}

void ExecutionFacade::runFromPosition(const Position& p) {
    select(RunMode::Smooth);
    active().runFromPosition(p);
}

// Everything else goes to whichever engine is active.

void ExecutionFacade::setProgram(std::vector<std::string> lines) {
    active().setProgram(std::move(lines));
}
void ExecutionFacade::reset() { active().reset(); }
bool ExecutionFacade::step() { return active().step(); }
void ExecutionFacade::pause() { active().pause(); }
bool ExecutionFacade::resume() { return active().resume(); }
void ExecutionFacade::stop() { active().stop(); }
void ExecutionFacade::stepToPosition(const Position& p) { active().stepToPosition(p); }

bool ExecutionFacade::toggleBreakpoint(const Position& p) { return active().toggleBreakpoint(p); }
SourceToggle ExecutionFacade::toggleSourceBreakpoint(const Position& source) {
    return active().toggleSourceBreakpoint(source);
}
bool ExecutionFacade::hasBreakpointAt(const Position& p) const {
    return active().hasBreakpointAt(p);
}
bool ExecutionFacade::hasSourceBreakpointAt(const Position& source) const {
    return active().hasSourceBreakpointAt(source);
}
void ExecutionFacade::clearBreakpoints() { active().clearBreakpoints(); }
void ExecutionFacade::setSourceMap(std::shared_ptr<const SourceMap> map) {
    active().setSourceMap(std::move(map));
}

void ExecutionFacade::setTapeSize(std::size_t size) { active().setTapeSize(size); }
void ExecutionFacade::setCellWidthBits(unsigned bits) { active().setCellWidthBits(bits); }
void ExecutionFacade::setLaneCount(unsigned count) { active().setLaneCount(count); }
void ExecutionFacade::setIncrement(std::uint32_t increment) { active().setIncrement(increment); }
bool ExecutionFacade::provideInput(std::uint32_t code) { return active().provideInput(code); }
void ExecutionFacade::loadSnapshot(const std::vector<std::uint32_t>& cells, std::size_t pointer,
                                   unsigned cellWidth, std::size_t tapeSize) {
    active().loadSnapshot(cells, pointer, cellWidth, tapeSize);
}
void ExecutionFacade::setVmOutputConfig(std::optional<VmOutputConfig> config) {
    active().setVmOutputConfig(std::move(config));
}

void ExecutionFacade::importSession(SessionState session) {
    active().importSession(std::move(session));
}

}  // namespace tapevm

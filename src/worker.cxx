/*
    TapeVM - A debuggable brainfuck VM
    Worker-thread engine reached by message passing
    Published under the GNU AGPL-3.0-or-later license
*/
// SPDX-License-Identifier: AGPL-3.0-or-later
#include "tapevm/worker.hxx"

#include <exception>
#include <iostream>
#include <type_traits>
#include <utility>

#include "tapevm/interpreter.hxx"

namespace tapevm {

namespace {
EngineConfig validated(EngineConfig config) {
    validate(config);
    return config;
}
}  // namespace

WorkerEngine::WorkerEngine(Scheduler& host, EngineConfig config)
    : host_(host),
      config_(validated(config)),
      tape_(config_.tapeSize, config_.cellWidth),
      channel_([this](worker::Request request) {
          loop_->post([this, request = std::move(request)]() mutable { handle(request); });
      }),
      thread_([this, config] { workerMain(config); }) {
    state_.tape = &tape_;
    state_.laneCount = config_.laneCount;
}

WorkerEngine::~WorkerEngine() {
    send(worker::Shutdown{});
    if (thread_.joinable()) thread_.join();
}

void WorkerEngine::send(worker::Request request) { channel_.send(std::move(request)); }

// ---------------------------------------------------------------------------------------------
// Worker thread

void WorkerEngine::workerMain(EngineConfig config) {
    EventLoop loop;
    Interpreter engine(loop, config);
    const std::weak_ptr<int> token = alive_;

    engine.subscribe([this](const ExecutionState&) { publishFromWorker(); });
    engine.subscribeVmOutput([this, token](const VmOutputEvent& event) {
        host_.post([this, token, event] {
            if (!token.expired()) onVmOutput(event);
        });
    });

    loop_ = &loop;
    engine_ = &engine;
    channel_.open();
    host_.post([this, token] {
        if (!token.expired()) onReady();
    });
    loop.run();
    channel_.close();
    engine_ = nullptr;
    loop_ = nullptr;
}

void WorkerEngine::publishFromWorker() {
    const ExecutionState& s = engine_->state();
    worker::StateUpdate update;
    update.pointer = s.pointer;
    update.isRunning = s.isRunning;
    update.isPaused = s.isPaused;
    update.isStopped = s.isStopped;
    update.isWaitingForInput = s.isWaitingForInput;
    update.output = s.output;
    update.position = s.position;
    update.lastRun = s.lastRun;
    update.mode = s.mode;
    if (!s.isRunning || s.isPaused) update.tape = engine_->tape();

    const std::weak_ptr<int> token = alive_;
    host_.post([this, token, update = std::move(update)]() mutable {
        if (!token.expired()) onState(std::move(update));
    });
}

void WorkerEngine::handle(worker::Request& request) {
    try {
        std::visit(
            [this](auto& msg) {
                using T = std::decay_t<decltype(msg)>;
                if constexpr (std::is_same_v<T, worker::SetProgram>) {
                    engine_->setProgram(std::move(msg.lines));
                } else if constexpr (std::is_same_v<T, worker::Reset>) {
                    engine_->reset();
                } else if constexpr (std::is_same_v<T, worker::Step>) {
                    engine_->step();
                } else if constexpr (std::is_same_v<T, worker::RunTurbo>) {
                    engine_->runTurbo();
                } else if constexpr (std::is_same_v<T, worker::ResumeTurbo>) {
                    engine_->resumeTurbo();
                } else if constexpr (std::is_same_v<T, worker::Pause>) {
                    engine_->pause();
                } else if constexpr (std::is_same_v<T, worker::Resume>) {
                    engine_->resume();
                } else if constexpr (std::is_same_v<T, worker::Stop>) {
                    engine_->stop();
                } else if constexpr (std::is_same_v<T, worker::SetBreakpoints>) {
                    engine_->setBreakpoints(std::move(msg.breakpoints));
                } else if constexpr (std::is_same_v<T, worker::SetPosition>) {
                    if (msg.stepAfter) {
                        engine_->stepToPosition(msg.position);
                    } else {
                        engine_->setPosition(msg.position);
                    }
                } else if constexpr (std::is_same_v<T, worker::Configure>) {
                    const EngineConfig current = engine_->config();
                    if (msg.config.tapeSize != current.tapeSize ||
                        msg.config.cellWidth != current.cellWidth) {
                        engine_->loadSnapshot({}, 0, msg.config.cellWidth, msg.config.tapeSize);
                    }
                    if (msg.config.laneCount != current.laneCount) {
                        engine_->setLaneCount(msg.config.laneCount);
                    }
                    if (msg.config.increment != current.increment) {
                        engine_->setIncrement(msg.config.increment);
                    }
                } else if constexpr (std::is_same_v<T, worker::ProvideInput>) {
                    engine_->provideInput(msg.code);
                } else if constexpr (std::is_same_v<T, worker::LoadSnapshot>) {
                    engine_->loadSnapshot(msg.cells, msg.pointer, msg.cellWidth, msg.tapeSize);
                } else if constexpr (std::is_same_v<T, worker::SetVmOutputConfig>) {
                    engine_->setVmOutputConfig(std::move(msg.config));
                } else if constexpr (std::is_same_v<T, worker::Import>) {
                    engine_->importSession(std::move(msg.session));
                } else if constexpr (std::is_same_v<T, worker::Export>) {
                    try {
                        msg.reply->set_value(engine_->exportSession());
                    } catch (const std::exception&) {
                        msg.reply->set_exception(std::current_exception());
                    }
                } else if constexpr (std::is_same_v<T, worker::Shutdown>) {
                    loop_->quit();
                }
            },
            request);
    } catch (const std::exception& e) {
        std::cerr << "ERROR: worker: " << e.what() << std::endl;
    }
}

// ---------------------------------------------------------------------------------------------
// Host side

void WorkerEngine::onReady() { ready_ = true; }

void WorkerEngine::onState(worker::StateUpdate update) {
    if (update.tape) tape_ = std::move(*update.tape);
    tape_.setPointer(update.pointer);
    state_.isRunning = update.isRunning;
    state_.isPaused = update.isPaused;
    state_.isStopped = update.isStopped;
    state_.isWaitingForInput = update.isWaitingForInput;
    state_.output = std::move(update.output);
    state_.lastRun = update.lastRun;
    state_.mode = update.mode;
    if (update.position != state_.position) {
        track(update.position);
        positionObservers_.notify(update.position);
    }
    publish();
}

void WorkerEngine::onVmOutput(const VmOutputEvent& event) { vmOutputObservers_.notify(event); }

void WorkerEngine::track(const Position& p) {
    state_.position = p;
    if (debug_.sourceMap()) {
        debug_.track(p);
        state_.sourcePosition = debug_.currentSourcePosition();
        state_.macroContext = debug_.macroContext();
    }
}

void WorkerEngine::expectIdle() {
    state_.isRunning = false;
    state_.isPaused = false;
    state_.isStopped = false;
    state_.isWaitingForInput = false;
    publish();
}

void WorkerEngine::expectRunning() {
    state_.isRunning = true;
    state_.isPaused = false;
    state_.isWaitingForInput = false;
    publish();
}

void WorkerEngine::publish() {
    state_.tape = &tape_;
    state_.pointer = tape_.pointer();
    stateObservers_.notify(state_);
}

void WorkerEngine::syncBreakpoints() {
    state_.breakpoints = debug_.breakpoints();
    state_.sourceBreakpoints = debug_.sourceBreakpoints();
    send(worker::SetBreakpoints{debug_.breakpoints()});
    publish();
}

void WorkerEngine::configure() { send(worker::Configure{config_}); }

SubscriptionId WorkerEngine::subscribe(StateObserver observer) {
    return stateObservers_.add(nextSubscription_++, std::move(observer));
}

SubscriptionId WorkerEngine::subscribePosition(PositionObserver observer) {
    return positionObservers_.add(nextSubscription_++, std::move(observer));
}

SubscriptionId WorkerEngine::subscribeVmOutput(VmOutputObserver observer) {
    return vmOutputObservers_.add(nextSubscription_++, std::move(observer));
}

void WorkerEngine::unsubscribe(SubscriptionId id) {
    if (stateObservers_.remove(id)) return;
    if (positionObservers_.remove(id)) return;
    vmOutputObservers_.remove(id);
}

void WorkerEngine::setProgram(std::vector<std::string> lines) {
    send(worker::SetProgram{std::move(lines)});
    expectIdle();
}

void WorkerEngine::reset() {
    send(worker::Reset{});
    expectIdle();
}

bool WorkerEngine::step() {
    if (state_.isStopped) {
        std::cerr << "warning: program has finished; reset before stepping" << std::endl;
        return false;
    }
    send(worker::Step{});
    return true;
}

void WorkerEngine::run(std::chrono::milliseconds) {
    std::cerr << "warning: worker engine only runs in turbo mode" << std::endl;
    resumeTurbo();
}

void WorkerEngine::runSmooth() {
    std::cerr << "warning: worker engine only runs in turbo mode" << std::endl;
    resumeTurbo();
}

void WorkerEngine::runImmediately() { resumeTurbo(); }

void WorkerEngine::runTurbo() {
    send(worker::RunTurbo{});
    state_.isStopped = false;
    expectRunning();
}

void WorkerEngine::resumeTurbo() {
    send(worker::ResumeTurbo{});
    // A finished program stays finished and a pending read keeps waiting; the worker warns.
    if (!state_.isStopped && !state_.isWaitingForInput) expectRunning();
}

void WorkerEngine::pause() { send(worker::Pause{}); }

bool WorkerEngine::resume() {
    if (!state_.isRunning || !state_.isPaused) {
        std::cerr << "warning: resume requested while not paused" << std::endl;
        return false;
    }
    if (state_.isWaitingForInput) {
        std::cerr << "warning: cannot resume while waiting for input" << std::endl;
        return false;
    }
    send(worker::Resume{});
    return true;
}

void WorkerEngine::stop() { send(worker::Stop{}); }

void WorkerEngine::runFromPosition(const Position& p) {
    send(worker::Reset{});
    send(worker::SetPosition{p, false});
    send(worker::ResumeTurbo{});
    state_.isStopped = false;
    expectRunning();
}

void WorkerEngine::stepToPosition(const Position& p) { send(worker::SetPosition{p, true}); }

bool WorkerEngine::toggleBreakpoint(const Position& p) {
    const bool set = debug_.toggleBreakpoint(p);
    syncBreakpoints();
    return set;
}

SourceToggle WorkerEngine::toggleSourceBreakpoint(const Position& source) {
    const SourceToggle result = debug_.toggleSourceBreakpoint(source);
    if (result != SourceToggle::NoCode) syncBreakpoints();
    return result;
}

void WorkerEngine::clearBreakpoints() {
    debug_.clearAll();
    syncBreakpoints();
}

void WorkerEngine::setSourceMap(std::shared_ptr<const SourceMap> map) {
    debug_.setSourceMap(std::move(map));
    state_.sourceMap = debug_.sourceMap();
    state_.sourcePosition.reset();
    state_.macroContext.clear();
    track(state_.position);
    publish();
}

void WorkerEngine::setTapeSize(std::size_t size) {
    validateTapeSize(size, config_.cellWidth);
    config_.tapeSize = size;
    configure();
}

void WorkerEngine::setCellWidthBits(unsigned bits) {
    validateCellWidth(bits);
    validateTapeSize(config_.tapeSize, bits);
    config_.cellWidth = bits;
    configure();
}

void WorkerEngine::setLaneCount(unsigned count) {
    validateLaneCount(count);
    config_.laneCount = count;
    state_.laneCount = count;
    configure();
    publish();
}

void WorkerEngine::setIncrement(std::uint32_t increment) {
    if (increment == 0) throw ConfigError("Increment must be positive");
    config_.increment = increment;
    configure();
}

bool WorkerEngine::provideInput(std::uint32_t code) {
    if (!state_.isWaitingForInput) {
        std::cerr << "warning: input provided while not waiting for input" << std::endl;
        return false;
    }
    // Consumed here so a second call before the worker replies is rejected.
    state_.isWaitingForInput = false;
    send(worker::ProvideInput{code});
    return true;
}

void WorkerEngine::loadSnapshot(const std::vector<std::uint32_t>& cells, std::size_t pointer,
                                unsigned cellWidth, std::size_t tapeSize) {
    validateCellWidth(cellWidth);
    validateTapeSize(tapeSize, cellWidth);
    if (cells.size() > tapeSize) {
        throw ConfigError("Snapshot holds " + std::to_string(cells.size()) +
                          " cells but the tape has " + std::to_string(tapeSize));
    }
    config_.tapeSize = tapeSize;
    config_.cellWidth = cellWidth;
    send(worker::LoadSnapshot{cells, pointer, cellWidth, tapeSize});
}

void WorkerEngine::setVmOutputConfig(std::optional<VmOutputConfig> config) {
    send(worker::SetVmOutputConfig{std::move(config)});
}

SessionState WorkerEngine::exportSession() {
    auto reply = std::make_shared<std::promise<SessionState>>();
    auto future = reply->get_future();
    send(worker::Export{reply});
    SessionState session = future.get();
    session.config = config_;
    session.breakpoints = debug_.directBreakpoints();
    session.sourceBreakpoints = debug_.sourceBreakpoints();
    session.sourceMap = debug_.sourceMap();
    state_.isRunning = false;
    return session;
}

void WorkerEngine::importSession(SessionState session) {
    validate(session.config);
    config_ = session.config;
    debug_.assign(session.breakpoints, std::move(session.sourceBreakpoints));
    debug_.setSourceMap(std::move(session.sourceMap));

    tape_ = session.tape;
    state_ = ExecutionState{};
    state_.output = session.output;
    state_.breakpoints = debug_.breakpoints();
    state_.sourceBreakpoints = debug_.sourceBreakpoints();
    state_.sourceMap = debug_.sourceMap();
    state_.laneCount = config_.laneCount;
    state_.lastRun = session.lastRun;
    state_.isStopped = session.isStopped;
    state_.isWaitingForInput = session.isWaitingForInput;
    state_.isPaused = session.isWaitingForInput;
    track(session.position);

    // The source map stays on this side of the channel; the worker only sees expanded positions.
    session.breakpoints = debug_.breakpoints();
    session.sourceMap.reset();
    session.sourceBreakpoints.clear();
    send(worker::Import{std::move(session)});
    positionObservers_.notify(state_.position);
    publish();
}

}  // namespace tapevm

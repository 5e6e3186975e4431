/*
    TapeVM - A debuggable brainfuck VM
    In-process execution engine
    Published under the GNU AGPL-3.0-or-later license
*/
// SPDX-License-Identifier: AGPL-3.0-or-later
#include "tapevm/interpreter.hxx"

#include <iostream>
#include <utility>

namespace tapevm {

namespace {
constexpr std::size_t npos = CompiledProgram::npos;

EngineConfig validated(EngineConfig config) {
    validate(config);
    return config;
}
}  // namespace

Interpreter::Interpreter(Scheduler& scheduler, EngineConfig config)
    : scheduler_(scheduler), config_(validated(config)), tape_(config_.tapeSize, config_.cellWidth) {
    state_.tape = &tape_;
    state_.laneCount = config_.laneCount;
}

Interpreter::~Interpreter() { releaseTimers(); }

// ---------------------------------------------------------------------------------------------
// Publication

void Interpreter::publish() {
    state_.tape = &tape_;
    state_.pointer = tape_.pointer();
    stateObservers_.notify(state_);
}

void Interpreter::moveTo(const Position& p) {
    state_.position = p;
    if (debug_.sourceMap()) {
        debug_.track(p);
        state_.sourcePosition = debug_.currentSourcePosition();
        state_.macroContext = debug_.macroContext();
    }
    positionObservers_.notify(p);
}

void Interpreter::setPosition(const Position& p) {
    moveTo(p);
    publish();
}

SubscriptionId Interpreter::subscribe(StateObserver observer) {
    return stateObservers_.add(nextSubscription_++, std::move(observer));
}

SubscriptionId Interpreter::subscribePosition(PositionObserver observer) {
    return positionObservers_.add(nextSubscription_++, std::move(observer));
}

SubscriptionId Interpreter::subscribeVmOutput(VmOutputObserver observer) {
    return vmOutputObservers_.add(nextSubscription_++, std::move(observer));
}

void Interpreter::unsubscribe(SubscriptionId id) {
    if (stateObservers_.remove(id)) return;
    if (positionObservers_.remove(id)) return;
    vmOutputObservers_.remove(id);
}

// ---------------------------------------------------------------------------------------------
// Lifecycle

void Interpreter::setProgram(std::vector<std::string> lines) {
    program_.rebuild(std::move(lines));
    ++programVersion_;
    reset();
}

void Interpreter::reset() {
    releaseTimers();
    tape_.resize(config_.tapeSize, config_.cellWidth);

    ExecutionState fresh;
    fresh.breakpoints = debug_.breakpoints();
    fresh.sourceBreakpoints = debug_.sourceBreakpoints();
    fresh.sourceMap = debug_.sourceMap();
    fresh.laneCount = config_.laneCount;
    state_ = std::move(fresh);
    debug_.clearTracking();

    lastPaused_.reset();
    operations_ = 0;
    metricsOpen_ = false;
    lastFlag_ = 0;
    moveTo({0, 0});
    publish();
}

void Interpreter::releaseTimers() {
    if (interval_) scheduler_.clearInterval(*interval_);
    if (frame_) scheduler_.cancelFrame(*frame_);
    interval_.reset();
    frame_.reset();
    strategy_ = Strategy::None;
    ++generation_;
}

void Interpreter::beginRun(Strategy strategy, ExecutionMode mode) {
    releaseTimers();
    strategy_ = strategy;
    state_.mode = mode;
    state_.isRunning = true;
    state_.isPaused = state_.isWaitingForInput;
    state_.isStopped = false;
    operations_ = 0;
    started_ = std::chrono::steady_clock::now();
    metricsOpen_ = true;
}

void Interpreter::finalizeMetrics() {
    if (!metricsOpen_) return;
    metricsOpen_ = false;
    const std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - started_;
    state_.lastRun = Metrics{operations_, elapsed.count(), state_.mode};
}

void Interpreter::finish() {
    releaseTimers();
    state_.isRunning = false;
    state_.isPaused = false;
    state_.isWaitingForInput = false;
    state_.isStopped = true;
    finalizeMetrics();
    publish();
}

void Interpreter::stop() { finish(); }

void Interpreter::pause() {
    state_.isPaused = true;
    publish();
}

bool Interpreter::resume() {
    if (!state_.isRunning || !state_.isPaused) {
        std::cerr << "warning: resume requested while not paused" << std::endl;
        return false;
    }
    if (state_.isWaitingForInput) {
        std::cerr << "warning: cannot resume while waiting for input" << std::endl;
        return false;
    }
    state_.isPaused = false;
    publish();
    if (strategy_ == Strategy::Immediate) postImmediate();
    if (strategy_ == Strategy::Turbo) postTurbo();
    return true;
}

// ---------------------------------------------------------------------------------------------
// Stepping

bool Interpreter::pauseIfBreakpoint(const Position& p) {
    if (lastPaused_ && *lastPaused_ != p) lastPaused_.reset();
    if (lastPaused_ == p || !debug_.hasBreakpointAt(p)) return false;
    const auto ch = program_.charAt(p);
    if (!ch || !isInstruction(*ch)) return false;
    lastPaused_ = p;
    state_.isPaused = true;
    return true;
}

void Interpreter::reportMissingMatch(const Position& p) const {
    std::cerr << "ERROR: no matching bracket for jump at " << toString(p) << std::endl;
}

bool Interpreter::step() {
    if (state_.isStopped) {
        std::cerr << "warning: program has finished; reset before stepping" << std::endl;
        return false;
    }
    return stepOnce();
}

bool Interpreter::stepOnce() {
    if (state_.isStopped) return false;
    if (state_.isWaitingForInput) {
        publish();
        return true;
    }

    // Skip comments, line terminators and in-code breakpoint markers until an instruction.
    Position pos = state_.position;
    char op = 0;
    for (;;) {
        const auto ch = program_.charAt(pos);
        if (ch && isInstruction(*ch)) {
            op = *ch;
            break;
        }
        if (ch == kBreakpointMarker) {
            if (!program_.next(pos)) {
                finish();
                return false;
            }
            moveTo(pos);
            state_.isPaused = true;
            publish();
            return true;
        }
        const bool more = ch == kLineTerminator ? program_.nextLine(pos) : program_.next(pos);
        if (!more) {
            finish();
            return false;
        }
    }
    if (pos != state_.position) moveTo(pos);

    if (pauseIfBreakpoint(pos)) {
        publish();
        return true;
    }
    if (!metricsOpen_) {
        started_ = std::chrono::steady_clock::now();
        metricsOpen_ = true;
    }

    switch (op) {
        case '>':
            tape_.advance(1);
            break;
        case '<':
            tape_.advance(-1);
            break;
        case '+':
            tape_.write(std::uint64_t{tape_.read()} + config_.increment);
            break;
        case '-':
            tape_.write(std::uint64_t{tape_.read()} + tape_.mask());
            break;
        case '[':
            if (tape_.read() == 0) {
                if (auto match = program_.matchOf(pos)) {
                    pos = *match;
                } else {
                    reportMissingMatch(pos);
                }
            }
            break;
        case ']':
            if (tape_.read() != 0) {
                if (auto match = program_.matchOf(pos)) {
                    pos = *match;
                } else {
                    reportMissingMatch(pos);
                }
            }
            break;
        case '.':
            appendCodePoint(state_.output, tape_.read());
            break;
        case ',':
            state_.isWaitingForInput = true;
            state_.isPaused = true;
            publish();
            return true;
        default:
            break;
    }
    ++operations_;
    checkVmOutput();

    if (!program_.next(pos)) {
        finish();
        return false;
    }
    moveTo(pos);
    // Look ahead: pause before the next instruction is consumed.
    pauseIfBreakpoint(pos);
    publish();
    return true;
}

bool Interpreter::provideInput(std::uint32_t code) {
    if (!state_.isWaitingForInput) {
        std::cerr << "warning: input provided while not waiting for input" << std::endl;
        return false;
    }
    tape_.write(code);
    state_.isWaitingForInput = false;
    state_.isPaused = false;
    ++operations_;
    checkVmOutput();

    Position pos = state_.position;
    if (!program_.next(pos)) {
        finish();
        return true;
    }
    moveTo(pos);
    publish();
    if (state_.isRunning) {
        if (strategy_ == Strategy::Immediate) postImmediate();
        if (strategy_ == Strategy::Turbo) postTurbo();
    }
    return true;
}

void Interpreter::runFromPosition(const Position& p) {
    reset();
    moveTo(p);
    runSmooth();
}

void Interpreter::stepToPosition(const Position& p) {
    state_.isStopped = false;
    state_.isWaitingForInput = false;
    moveTo(p);
    lastPaused_ = p;
    stepOnce();
}

// ---------------------------------------------------------------------------------------------
// Timed strategies

void Interpreter::run(std::chrono::milliseconds delay) {
    if (state_.isStopped) {
        std::cerr << "warning: program has finished; reset before running" << std::endl;
        return;
    }
    beginRun(Strategy::Interval, ExecutionMode::Normal);
    interval_ = scheduler_.setInterval(delay, [this] {
        if (!state_.isRunning || state_.isPaused) return;
        stepOnce();
    });
    publish();
}

void Interpreter::runSmooth() {
    if (state_.isStopped) {
        std::cerr << "warning: program has finished; reset before running" << std::endl;
        return;
    }
    beginRun(Strategy::Frame, ExecutionMode::Normal);
    frame_ = scheduler_.requestFrame([this] { frameTick(); });
    publish();
}

void Interpreter::frameTick() {
    frame_.reset();
    if (!state_.isRunning || strategy_ != Strategy::Frame) return;
    if (!state_.isPaused && !stepOnce()) return;
    // The frame loop stays alive while paused.
    if (state_.isRunning && strategy_ == Strategy::Frame && !frame_) {
        frame_ = scheduler_.requestFrame([this] { frameTick(); });
    }
}

void Interpreter::runImmediately() {
    if (state_.isStopped) {
        std::cerr << "warning: program has finished; reset before running" << std::endl;
        return;
    }
    beginRun(Strategy::Immediate, ExecutionMode::Normal);
    publish();
    postImmediate();
}

void Interpreter::postImmediate() {
    const std::uint64_t generation = ++generation_;
    scheduler_.post([this, token = std::weak_ptr<int>(alive_), generation] {
        if (token.expired() || generation != generation_) return;
        immediateBatch();
    });
}

void Interpreter::immediateBatch() {
    for (std::size_t i = 0; i < config_.immediateBatch; ++i) {
        if (!state_.isRunning || state_.isPaused || strategy_ != Strategy::Immediate) return;
        if (!stepOnce()) return;
    }
    if (state_.isRunning && !state_.isPaused && strategy_ == Strategy::Immediate) postImmediate();
}

// ---------------------------------------------------------------------------------------------
// Turbo

void Interpreter::runTurbo() {
    releaseTimers();
    state_.output.clear();
    state_.lastRun.reset();
    state_.isWaitingForInput = false;
    state_.isStopped = false;
    lastPaused_.reset();
    moveTo({0, 0});
    beginRun(Strategy::Turbo, ExecutionMode::Turbo);
    publish();
    postTurbo();
}

void Interpreter::resumeTurbo() {
    if (state_.isStopped) {
        std::cerr << "warning: program has finished; reset before resuming" << std::endl;
        return;
    }
    beginRun(Strategy::Turbo, ExecutionMode::Turbo);
    publish();
    postTurbo();
}

void Interpreter::postTurbo() {
    const std::uint64_t generation = ++generation_;
    scheduler_.post([this, token = std::weak_ptr<int>(alive_), generation] {
        if (token.expired() || generation != generation_) return;
        turboBatch();
    });
}

void Interpreter::refreshBreakMask(const CompiledProgram& compiled) {
    if (maskProgram_ == programVersion_ && maskVersion_ == debug_.version() &&
        breakMask_.size() == compiled.size()) {
        return;
    }
    breakMask_.assign(compiled.size(), 0);
    if (!debug_.empty()) {
        for (std::size_t i = 0; i < compiled.size(); ++i) {
            const Operation& op = compiled.ops[i];
            if (isInstruction(op.opcode) && debug_.hasBreakpointAt(op.position)) breakMask_[i] = 1;
        }
    }
    maskProgram_ = programVersion_;
    maskVersion_ = debug_.version();
}

template <typename CellT>
Interpreter::TurboExit Interpreter::runOps(std::vector<CellT>& cells,
                                           const CompiledProgram& compiled, std::size_t& index,
                                           std::size_t skipBreakAt) {
    const auto& ops = compiled.ops;
    const auto& jumps = compiled.jumps;
    const std::size_t count = ops.size();
    const std::size_t size = cells.size();
    const CellT inc = static_cast<CellT>(config_.increment);
    const std::size_t budget = config_.turboBatch;
    const bool watchFlag = vmOutput_ && vmOutput_->outFlagCellIndex < size;
    const std::size_t flagIndex = watchFlag ? vmOutput_->outFlagCellIndex : 0;

    std::size_t ptr = tape_.pointer();
    std::size_t executed = 0;
    TurboExit exit = TurboExit::End;

    while (index < count) {
        if (executed == budget) [[unlikely]] {
            exit = TurboExit::Yield;
            break;
        }
        if (breakMask_[index] && index != skipBreakAt) [[unlikely]] {
            exit = TurboExit::Breakpoint;
            break;
        }
        skipBreakAt = npos;
        const char op = ops[index].opcode;
        if (op == ',') {
            exit = TurboExit::Input;
            break;
        }
        if (op == kBreakpointMarker) {
            ++index;
            exit = TurboExit::Marker;
            break;
        }
        switch (op) {
            case '>':
                ptr = ptr + 1 == size ? 0 : ptr + 1;
                break;
            case '<':
                ptr = ptr == 0 ? size - 1 : ptr - 1;
                break;
            case '+':
                cells[ptr] = static_cast<CellT>(cells[ptr] + inc);
                break;
            case '-':
                cells[ptr] = static_cast<CellT>(cells[ptr] - 1);
                break;
            case '[':
                if (cells[ptr] == 0) {
                    if (jumps[index] != npos) [[likely]] {
                        index = jumps[index];
                    } else {
                        reportMissingMatch(ops[index].position);
                    }
                }
                break;
            case ']':
                if (cells[ptr] != 0) {
                    if (jumps[index] != npos) [[likely]] {
                        index = jumps[index];
                    } else {
                        reportMissingMatch(ops[index].position);
                    }
                }
                break;
            case '.':
                appendCodePoint(state_.output, cells[ptr]);
                break;
            default:
                break;
        }
        ++executed;
        ++index;
        if (watchFlag) {
            const std::uint32_t flag = cells[flagIndex];
            if (flag == 1 && lastFlag_ == 0) emitVmOutput(ptr);
            lastFlag_ = flag;
        }
    }

    tape_.setPointer(ptr);
    operations_ += executed;
    return exit;
}

void Interpreter::turboBatch() {
    if (!state_.isRunning || state_.isPaused || strategy_ != Strategy::Turbo) return;

    const CompiledProgram& compiled = program_.flatten();
    refreshBreakMask(compiled);

    // Resume from wherever the program counter is; stepping may have moved it since the last batch.
    std::size_t index = compiled.indexAtOrAfter(state_.position);
    if (lastPaused_ && *lastPaused_ != state_.position) lastPaused_.reset();
    std::size_t skip = npos;
    if (lastPaused_ && index < compiled.size() && compiled.ops[index].position == *lastPaused_) {
        skip = index;
    }

    const TurboExit exit =
        tape_.visit([&](auto& cells) { return runOps(cells, compiled, index, skip); });

    switch (exit) {
        case TurboExit::End:
            if (compiled.size()) moveTo(compiled.ops.back().position);
            finish();
            return;
        case TurboExit::Yield:
            moveTo(compiled.ops[index].position);
            publish();
            postTurbo();
            return;
        case TurboExit::Input:
            moveTo(compiled.ops[index].position);
            state_.isWaitingForInput = true;
            state_.isPaused = true;
            publish();
            return;
        case TurboExit::Marker:
            if (index >= compiled.size()) {
                moveTo(compiled.ops.back().position);
                finish();
                return;
            }
            moveTo(compiled.ops[index].position);
            state_.isPaused = true;
            publish();
            return;
        case TurboExit::Breakpoint:
            moveTo(compiled.ops[index].position);
            lastPaused_ = compiled.ops[index].position;
            state_.isPaused = true;
            publish();
            return;
    }
}

// ---------------------------------------------------------------------------------------------
// VM output device

void Interpreter::setVmOutputConfig(std::optional<VmOutputConfig> config) {
    vmOutput_ = std::move(config);
    lastFlag_ = 0;
    if (vmOutput_ && vmOutput_->outFlagCellIndex < tape_.size()) {
        lastFlag_ = tape_.read(vmOutput_->outFlagCellIndex);
    }
}

void Interpreter::checkVmOutput() {
    if (!vmOutput_ || vmOutput_->outFlagCellIndex >= tape_.size()) return;
    const std::uint32_t flag = tape_.read(vmOutput_->outFlagCellIndex);
    if (flag == 1 && lastFlag_ == 0) emitVmOutput(tape_.pointer());
    lastFlag_ = flag;
}

void Interpreter::emitVmOutput(std::size_t pointer) {
    if (vmOutputObservers_.empty()) return;
    VmOutputEvent event;
    event.pointer = pointer;
    const SparsePattern& pattern = vmOutput_->pattern;
    for (std::size_t i = 0; i < pattern.count; ++i) {
        const std::size_t index = pattern.start + i * pattern.step;
        if (index >= tape_.size()) break;
        event.indices.push_back(index);
        event.values.push_back(tape_.read(index));
    }
    vmOutputObservers_.notify(event);
}

// ---------------------------------------------------------------------------------------------
// Breakpoints and source map

bool Interpreter::toggleBreakpoint(const Position& p) {
    const bool set = debug_.toggleBreakpoint(p);
    state_.breakpoints = debug_.breakpoints();
    publish();
    return set;
}

SourceToggle Interpreter::toggleSourceBreakpoint(const Position& source) {
    const SourceToggle result = debug_.toggleSourceBreakpoint(source);
    if (result != SourceToggle::NoCode) {
        state_.breakpoints = debug_.breakpoints();
        state_.sourceBreakpoints = debug_.sourceBreakpoints();
        publish();
    }
    return result;
}

void Interpreter::setBreakpoints(BreakpointSet breakpoints) {
    debug_.assign(std::move(breakpoints), debug_.sourceBreakpoints());
    state_.breakpoints = debug_.breakpoints();
    publish();
}

void Interpreter::clearBreakpoints() {
    debug_.clearAll();
    lastPaused_.reset();
    state_.breakpoints.clear();
    state_.sourceBreakpoints.clear();
    publish();
}

void Interpreter::setSourceMap(std::shared_ptr<const SourceMap> map) {
    debug_.setSourceMap(std::move(map));
    state_.sourceMap = debug_.sourceMap();
    state_.sourcePosition.reset();
    state_.macroContext.clear();
    moveTo(state_.position);
    publish();
}

// ---------------------------------------------------------------------------------------------
// Configuration

void Interpreter::setTapeSize(std::size_t size) {
    validateTapeSize(size, config_.cellWidth);
    if (size * (config_.cellWidth / 8) > TAPEVM_TAPE_WARN_BYTES) {
        std::cerr << "warning: tape of " << size << " cells exceeds "
                  << (TAPEVM_TAPE_WARN_BYTES >> 20) << " MiB" << std::endl;
    }
    config_.tapeSize = size;
    reset();
}

void Interpreter::setCellWidthBits(unsigned bits) {
    validateCellWidth(bits);
    validateTapeSize(config_.tapeSize, bits);
    config_.cellWidth = bits;
    reset();
}

void Interpreter::setLaneCount(unsigned count) {
    validateLaneCount(count);
    config_.laneCount = count;
    state_.laneCount = count;
    publish();
}

void Interpreter::setIncrement(std::uint32_t increment) {
    if (increment == 0) throw ConfigError("Increment must be positive");
    config_.increment = increment;
}

void Interpreter::loadSnapshot(const std::vector<std::uint32_t>& cells, std::size_t pointer,
                               unsigned cellWidth, std::size_t tapeSize) {
    validateCellWidth(cellWidth);
    validateTapeSize(tapeSize, cellWidth);
    if (cells.size() > tapeSize) {
        throw ConfigError("Snapshot holds " + std::to_string(cells.size()) +
                          " cells but the tape has " + std::to_string(tapeSize));
    }
    config_.tapeSize = tapeSize;
    config_.cellWidth = cellWidth;
    reset();
    for (std::size_t i = 0; i < cells.size(); ++i) tape_.write(i, cells[i]);
    tape_.setPointer(pointer);
    if (vmOutput_ && vmOutput_->outFlagCellIndex < tape_.size()) {
        lastFlag_ = tape_.read(vmOutput_->outFlagCellIndex);
    }
    publish();
}

// ---------------------------------------------------------------------------------------------
// Session transfer

SessionState Interpreter::exportSession() {
    releaseTimers();
    finalizeMetrics();
    state_.isRunning = false;
    state_.isPaused = state_.isWaitingForInput;

    SessionState session;
    session.config = config_;
    session.program = program_.lines();
    session.tape = tape_;
    session.position = state_.position;
    session.output = state_.output;
    session.breakpoints = debug_.directBreakpoints();
    session.sourceBreakpoints = debug_.sourceBreakpoints();
    session.sourceMap = debug_.sourceMap();
    session.vmOutput = vmOutput_;
    session.lastRun = state_.lastRun;
    session.pausedAt = lastPaused_;
    session.isStopped = state_.isStopped;
    session.isWaitingForInput = state_.isWaitingForInput;
    publish();
    return session;
}

void Interpreter::importSession(SessionState session) {
    validate(session.config);
    releaseTimers();
    config_ = session.config;
    if (session.program != program_.lines()) {
        program_.rebuild(std::move(session.program));
        ++programVersion_;
    }
    tape_ = std::move(session.tape);
    debug_.assign(std::move(session.breakpoints), std::move(session.sourceBreakpoints));
    debug_.setSourceMap(std::move(session.sourceMap));
    vmOutput_ = std::move(session.vmOutput);
    lastFlag_ = 0;
    if (vmOutput_ && vmOutput_->outFlagCellIndex < tape_.size()) {
        lastFlag_ = tape_.read(vmOutput_->outFlagCellIndex);
    }

    ExecutionState fresh;
    fresh.output = std::move(session.output);
    fresh.breakpoints = debug_.breakpoints();
    fresh.sourceBreakpoints = debug_.sourceBreakpoints();
    fresh.sourceMap = debug_.sourceMap();
    fresh.laneCount = config_.laneCount;
    fresh.lastRun = session.lastRun;
    fresh.isStopped = session.isStopped;
    fresh.isWaitingForInput = session.isWaitingForInput;
    fresh.isPaused = session.isWaitingForInput;
    state_ = std::move(fresh);

    lastPaused_ = session.pausedAt;
    operations_ = 0;
    metricsOpen_ = false;
    moveTo(session.position);
    publish();
}

}  // namespace tapevm

#include <cassert>
#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "helpers.hxx"
#include "tapevm/facade.hxx"
#include "tapevm/scheduler.hxx"
#include "tapevm/source_map.hxx"
#include "tapevm/worker.hxx"

using tapevm::EngineConfig;
using tapevm::EngineKind;
using tapevm::EventLoop;
using tapevm::ExecutionFacade;
using tapevm::Position;
using tapevm::RunMode;

static_assert(tapevm::requiredEngine(RunMode::Interval, true) == EngineKind::Local);
static_assert(tapevm::requiredEngine(RunMode::Smooth, true) == EngineKind::Local);
static_assert(tapevm::requiredEngine(RunMode::Turbo, true) == EngineKind::Worker);
static_assert(tapevm::requiredEngine(RunMode::TurboResume, true) == EngineKind::Worker);
static_assert(!tapevm::requiredEngine(RunMode::Immediate, true));
static_assert(!tapevm::requiredEngine(RunMode::Turbo, false));

static EngineConfig config() {
    EngineConfig cfg;
    cfg.tapeSize = 64;
    return cfg;
}

// Worker replies arrive on the loop from another thread.
static bool waitFor(EventLoop& loop, const std::function<bool()>& done) {
    return loop.runUntil(done, SIZE_MAX, std::chrono::milliseconds(2000));
}

static void test_turbo_runs_on_worker() {
    EventLoop loop;
    ExecutionFacade vm(loop, config());
    std::size_t updates = 0;
    vm.subscribe([&](const tapevm::ExecutionState&) { ++updates; });
    vm.setProgram({"++++++++[>++++++++<-]>+."});
    assert(vm.step());
    assert(vm.step());
    assert(vm.state().tape->read(0) == 2);
    assert(vm.activeKind() == EngineKind::Local);

    const std::size_t before = updates;
    vm.runTurbo();
    assert(vm.activeKind() == EngineKind::Worker);
    // Reported as running before the worker has replied.
    assert(vm.state().isRunning);
    assert(!vm.state().isStopped);
    assert(std::string(tapevm::toString(vm.activeKind())) == "worker");
    assert(waitFor(loop, [&] { return vm.state().isStopped; }));
    // The turbo run restarts the program on the tape it inherited.
    assert(vm.state().output == "Q");
    assert(vm.state().tape->read(1) == 81);
    assert(vm.state().lastRun);
    assert(vm.state().lastRun->mode == tapevm::ExecutionMode::Turbo);
    assert(updates > before);
}

static void test_session_moves_both_ways() {
    EventLoop loop;
    ExecutionFacade vm(loop, config());
    auto map = std::make_shared<tapevm::SourceMapTable>();
    tapevm::MapEntry entry;
    entry.expandedRange = {{2, 1}, {2, 5}};
    entry.sourceRange = {{7, 1}, {7, 4}};
    map->addMapping(entry);

    std::vector<Position> positions;
    vm.subscribePosition([&](const Position& p) { positions.push_back(p); });
    vm.setProgram({"++++", "+>+."});
    vm.setSourceMap(map);
    assert(vm.toggleBreakpoint({1, 0}));

    vm.runTurbo();
    assert(waitFor(loop, [&] { return vm.state().isPaused; }));
    assert(vm.activeKind() == EngineKind::Worker);
    assert(vm.hasBreakpointAt({1, 0}));
    assert(vm.state().position == Position({1, 0}));
    assert(vm.state().tape->read(0) == 4);
    assert(vm.state().sourceMap == map);
    assert(vm.state().sourcePosition == Position({6, 0}));
    assert(!positions.empty());

    // Continuing elsewhere does not report the same breakpoint again.
    vm.run(std::chrono::milliseconds(1));
    assert(vm.activeKind() == EngineKind::Local);
    assert(vm.state().position == Position({1, 0}));
    assert(vm.hasBreakpointAt({1, 0}));
    assert(vm.state().sourceMap == map);
    assert(waitFor(loop, [&] { return vm.state().isStopped; }));
    assert(vm.state().tape->read(0) == 5);
    assert(vm.state().tape->read(1) == 1);
    assert(vm.state().output == "\x01");
    assert(positions.back() == Position({1, 3}));
}

static void test_immediate_keeps_current_engine() {
    EventLoop loop;
    ExecutionFacade vm(loop, config());
    vm.setProgram({"+$+."});
    vm.runTurbo();
    assert(waitFor(loop, [&] { return vm.state().isPaused; }));
    assert(vm.activeKind() == EngineKind::Worker);
    vm.reset();
    assert(waitFor(loop, [&] { return !vm.state().isPaused && vm.state().tape->read(0) == 0; }));
    vm.runImmediately();
    assert(vm.activeKind() == EngineKind::Worker);
    assert(waitFor(loop, [&] { return vm.state().isPaused; }));
    assert(vm.resume());
    assert(waitFor(loop, [&] { return vm.state().isStopped; }));
    assert(vm.state().output == "\x02");
}

static void test_without_worker() {
    EventLoop loop;
    ExecutionFacade vm(loop, config(), false);
    vm.setProgram({"+++."});
    vm.runTurbo();
    assert(vm.activeKind() == EngineKind::Local);
    assert(waitFor(loop, [&] { return vm.state().isStopped; }));
    assert(vm.state().output == "\x03");
}

static void test_input_through_worker() {
    EventLoop loop;
    ExecutionFacade vm(loop, config());
    vm.setProgram({",."});
    vm.runTurbo();
    assert(waitFor(loop, [&] { return vm.state().isWaitingForInput; }));
    assert(vm.provideInput('k'));
    {
        CerrCapture cap;
        assert(!vm.provideInput('k'));
        assert(cap.contains("not waiting"));
    }
    assert(waitFor(loop, [&] { return vm.state().isStopped; }));
    assert(vm.state().output == "k");
}

static void test_stop_endless_worker_run() {
    EventLoop loop;
    ExecutionFacade vm(loop, config());
    vm.setProgram({"+[]"});
    vm.runTurbo();
    assert(waitFor(loop, [&] { return vm.state().isRunning; }));
    vm.stop();
    assert(waitFor(loop, [&] { return vm.state().isStopped; }));
    assert(!vm.state().isRunning);
}

// Everything sent before the worker reports ready is applied once it starts, in order.
static void test_requests_before_ready() {
    EventLoop loop;
    tapevm::WorkerEngine worker(loop, config());
    assert(!worker.ready());
    worker.setProgram({"+++>+"});
    worker.setTapeSize(4);
    worker.toggleBreakpoint({0, 4});
    worker.setIncrement(5);
    worker.runTurbo();
    assert(worker.state().isRunning);

    assert(waitFor(loop, [&] { return worker.state().isPaused; }));
    assert(worker.ready());
    assert(worker.state().position == Position({0, 4}));
    assert(worker.state().tape->size() == 4);
    assert(worker.state().tape->read(0) == 15);
    assert(worker.state().tape->pointer() == 1);

    assert(worker.resume());
    assert(waitFor(loop, [&] { return worker.state().isStopped; }));
    assert(worker.state().tape->read(1) == 5);

    tapevm::SessionState session = worker.exportSession();
    assert(session.config.tapeSize == 4);
    assert(session.config.increment == 5);
    assert(session.breakpoints.count({0, 4}) == 1);
}

static void test_step_after_finish() {
    EventLoop loop;
    tapevm::WorkerEngine worker(loop, config());
    worker.setProgram({"+"});
    assert(worker.step());
    assert(waitFor(loop, [&] { return worker.state().isStopped; }));
    {
        CerrCapture cap;
        assert(!worker.step());
        assert(cap.contains("finished"));
    }
    // A reset is accepted at once, so the next step is too.
    worker.reset();
    assert(!worker.state().isStopped);
    worker.setIncrement(3);
    assert(worker.step());
    assert(waitFor(loop, [&] {
        return worker.state().isStopped && worker.state().tape->read(0) == 3;
    }));
}

static void test_worker_engine_export() {
    EventLoop loop;
    tapevm::WorkerEngine worker(loop, config());
    assert(waitFor(loop, [&] { return worker.ready(); }));
    worker.setProgram({"+++"});
    worker.resumeTurbo();
    assert(waitFor(loop, [&] { return worker.state().isStopped; }));
    assert(worker.state().tape->read(0) == 3);

    tapevm::SessionState session = worker.exportSession();
    assert(session.isStopped);
    assert(session.tape.read(0) == 3);
    assert((session.program == std::vector<std::string>{"+++"}));
    assert(session.config.tapeSize == 64);

    bool threw = false;
    try {
        worker.setTapeSize(0);
    } catch (const tapevm::ConfigError&) {
        threw = true;
    }
    assert(threw);
    assert(worker.config().tapeSize == 64);
    (void)threw;
}

int main() {
    test_turbo_runs_on_worker();
    test_session_moves_both_ways();
    test_immediate_keeps_current_engine();
    test_without_worker();
    test_input_through_worker();
    test_stop_endless_worker_run();
    test_requests_before_ready();
    test_step_after_finish();
    test_worker_engine_export();
    return 0;
}

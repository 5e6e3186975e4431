#include <cassert>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "helpers.hxx"
#include "tapevm/interpreter.hxx"
#include "tapevm/scheduler.hxx"

using tapevm::EngineConfig;
using tapevm::EventLoop;
using tapevm::Interpreter;
using tapevm::Position;

static EngineConfig config(unsigned width, std::size_t size = 64) {
    EngineConfig cfg;
    cfg.tapeSize = size;
    cfg.cellWidth = width;
    return cfg;
}

// Input-free programs whose loops terminate at every cell width.
static const std::vector<std::vector<std::string>> programs = {
    {"++++++++[>++++[>++>+++>+++>+<<<<-]>+>+>->>+[<]<-]>>.>---.+++++++..+++.>>.<-.<.+++.------.",
     "--------.>>+.>++."},
    {"++++++[<++++++>-]<.", "comment line", "[->>+<<]>>."},
    {"++[>+++[>++++<-]<-]>>[-]<+/ text after the terminator [[[", "+>+."},
    {"+++[>+++++<-]>[>++>+++<<-]>.>."},
    {"-.>+++++[-<->]<."},
};

static void test_turbo_matches_stepping() {
    for (unsigned width : {8u, 16u, 32u}) {
        for (const auto& program : programs) {
            EventLoop loop(EventLoop::Clock::Simulated);
            Interpreter stepped(loop, config(width));
            Interpreter turbo(loop, config(width));
            stepped.setProgram(program);
            turbo.setProgram(program);
            while (stepped.step()) {
            }
            turbo.runTurbo();
            settle(loop, turbo);
            assert(turbo.state().isStopped);
            assert(hashOutput(turbo.state().output) == hashOutput(stepped.state().output));
            assert(hashTape(turbo.tape()) == hashTape(stepped.tape()));
            assert(turbo.tape() == stepped.tape());
        }
    }
}

static void test_turbo_metrics() {
    EventLoop loop(EventLoop::Clock::Simulated);
    Interpreter vm(loop, config(8));
    vm.setProgram({"+++", "x>"});
    vm.runTurbo();
    assert(vm.state().mode == tapevm::ExecutionMode::Turbo);
    settle(loop, vm);
    assert(vm.state().lastRun);
    assert(vm.state().lastRun->operations == 4);
    assert(vm.state().lastRun->mode == tapevm::ExecutionMode::Turbo);
    assert(vm.tape().pointer() == 1);
}

static void test_turbo_breakpoint() {
    EventLoop loop(EventLoop::Clock::Simulated);
    Interpreter vm(loop, config(8));
    vm.setProgram({"+++."});
    vm.toggleBreakpoint({0, 2});
    vm.runTurbo();
    settle(loop, vm);
    assert(vm.state().isPaused);
    assert(vm.state().position == Position({0, 2}));
    assert(vm.tape().read(0) == 2);
    assert(vm.resume());
    settle(loop, vm);
    assert(vm.state().isStopped);
    assert(vm.tape().read(0) == 3);
    assert(vm.state().output == "\x03");
}

static void test_breakpoint_added_between_batches() {
    EventLoop loop(EventLoop::Clock::Simulated);
    EngineConfig cfg = config(8);
    cfg.turboBatch = 3;
    Interpreter vm(loop, cfg);
    vm.setProgram({"++++++"});
    vm.runTurbo();
    // First batch runs three operations, then yields.
    loop.runOnce();
    assert(vm.tape().read(0) == 3);
    assert(vm.state().isRunning);
    vm.toggleBreakpoint({0, 4});
    settle(loop, vm);
    assert(vm.state().isPaused);
    assert(vm.tape().read(0) == 4);
    vm.clearBreakpoints();
    vm.resume();
    settle(loop, vm);
    assert(vm.tape().read(0) == 6);
}

static void test_turbo_marker_and_input() {
    EventLoop loop(EventLoop::Clock::Simulated);
    Interpreter vm(loop, config(8));
    vm.setProgram({"+$+,."});
    vm.runTurbo();
    settle(loop, vm);
    assert(vm.state().isPaused);
    assert(!vm.state().isWaitingForInput);
    assert(vm.tape().read(0) == 1);
    vm.resume();
    settle(loop, vm);
    assert(vm.state().isWaitingForInput);
    assert(vm.state().position == Position({0, 3}));
    assert(vm.tape().read(0) == 2);
    assert(vm.provideInput('Q'));
    settle(loop, vm);
    assert(vm.state().isStopped);
    assert(vm.state().output == "Q");
}

static void test_increment_shared_with_stepping() {
    EventLoop loop(EventLoop::Clock::Simulated);
    EngineConfig cfg = config(8);
    cfg.increment = 3;
    Interpreter stepped(loop, cfg);
    Interpreter turbo(loop, cfg);
    stepped.setProgram({"++-"});
    turbo.setProgram({"++-"});
    while (stepped.step()) {
    }
    turbo.runTurbo();
    settle(loop, turbo);
    assert(stepped.tape().read(0) == 5);
    assert(turbo.tape().read(0) == 5);
}

static void test_run_turbo_restarts_keeping_tape() {
    EventLoop loop(EventLoop::Clock::Simulated);
    Interpreter vm(loop, config(8));
    vm.setProgram({"+."});
    vm.runTurbo();
    settle(loop, vm);
    assert(vm.state().output == "\x01");
    vm.runTurbo();
    settle(loop, vm);
    assert(vm.tape().read(0) == 2);
    assert(vm.state().output == "\x02");
}

static void test_resume_turbo_continues() {
    EventLoop loop(EventLoop::Clock::Simulated);
    Interpreter vm(loop, config(8));
    vm.setProgram({"+++"});
    vm.step();
    assert(vm.tape().read(0) == 1);
    vm.resumeTurbo();
    settle(loop, vm);
    assert(vm.state().isStopped);
    assert(vm.tape().read(0) == 3);
    assert(vm.state().lastRun->operations == 2);

    CerrCapture cap;
    vm.resumeTurbo();
    assert(cap.contains("program has finished"));
    assert(vm.tape().read(0) == 3);
}

static void test_yields_between_batches() {
    EventLoop loop(EventLoop::Clock::Simulated);
    EngineConfig cfg = config(8);
    cfg.turboBatch = 10;
    Interpreter vm(loop, cfg);
    vm.setProgram({"++++++++++[>++++++++++<-]>"});
    std::size_t publications = 0;
    vm.subscribe([&](const tapevm::ExecutionState&) { ++publications; });
    vm.runTurbo();
    settle(loop, vm);
    assert(vm.tape().read(1) == 100);
    assert(publications > 10);
}

static void test_stop_discards_pending_batch() {
    EventLoop loop(EventLoop::Clock::Simulated);
    Interpreter vm(loop, config(8));
    vm.setProgram({"+++"});
    vm.runTurbo();
    vm.stop();
    loop.runUntil([] { return false; });
    assert(vm.state().isStopped);
    assert(vm.tape().read(0) == 0);
}

int main() {
    test_turbo_matches_stepping();
    test_turbo_metrics();
    test_turbo_breakpoint();
    test_breakpoint_added_between_batches();
    test_turbo_marker_and_input();
    test_increment_shared_with_stepping();
    test_run_turbo_restarts_keeping_tape();
    test_resume_turbo_continues();
    test_yields_between_batches();
    test_stop_discards_pending_batch();
    return 0;
}

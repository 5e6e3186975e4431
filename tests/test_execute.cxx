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

static EngineConfig smallTape(std::size_t size = 8, unsigned width = 8) {
    EngineConfig cfg;
    cfg.tapeSize = size;
    cfg.cellWidth = width;
    return cfg;
}

static void test_multiply_loop() {
    EventLoop loop(EventLoop::Clock::Simulated);
    Interpreter vm(loop, smallTape(2));
    vm.setProgram({"++++++++[>++++<-]>."});
    vm.runImmediately();
    assert(settle(loop, vm));
    assert(vm.state().isStopped);
    assert(vm.tape().pointer() == 1);
    assert(vm.tape().read(1) == 32);
    assert(vm.tape().read(0) == 0);
    assert(vm.state().output == " ");
    assert(vm.state().lastRun);
    assert(vm.state().lastRun->mode == tapevm::ExecutionMode::Normal);
}

static void test_stepping_matches_run() {
    EventLoop loop(EventLoop::Clock::Simulated);
    Interpreter vm(loop, smallTape(2));
    vm.setProgram({"++++++++[>++++<-]>."});
    std::size_t steps = 0;
    while (vm.step()) ++steps;
    assert(steps > 0);
    assert(vm.state().isStopped);
    assert(vm.tape().read(1) == 32);
    assert(vm.state().output == " ");
}

static void test_input_round_trip() {
    EventLoop loop(EventLoop::Clock::Simulated);
    Interpreter vm(loop, smallTape());
    vm.setProgram({",."});
    vm.runImmediately();
    settle(loop, vm);
    assert(vm.state().isWaitingForInput);
    assert(vm.state().isPaused);
    assert(vm.state().runState() == tapevm::RunState::WaitingForInput);
    assert(vm.provideInput('Z'));
    assert(!vm.state().isWaitingForInput);
    settle(loop, vm);
    assert(vm.state().isStopped);
    assert(vm.state().output == "Z");
}

static void test_input_reduced_mod_width() {
    EventLoop loop(EventLoop::Clock::Simulated);
    Interpreter vm(loop, smallTape());
    vm.setProgram({","});
    vm.step();
    assert(vm.state().isWaitingForInput);
    vm.provideInput(0x141);
    assert(vm.tape().read(0) == 0x41);
}

static void test_input_while_not_waiting() {
    EventLoop loop(EventLoop::Clock::Simulated);
    Interpreter vm(loop, smallTape());
    vm.setProgram({"+."});
    CerrCapture cap;
    assert(!vm.provideInput('A'));
    assert(cap.contains("not waiting"));
    assert(vm.tape().read(0) == 0);
    assert(vm.state().position == Position({0, 0}));
    assert(!vm.resume());
    assert(cap.contains("resume requested while not paused"));
}

static void test_clear_loop_keeps_pointer() {
    EventLoop loop(EventLoop::Clock::Simulated);
    Interpreter vm(loop, smallTape(4));
    vm.setProgram({"[-]"});
    vm.loadSnapshot({5}, 0, 8, 4);
    assert(vm.tape().read(0) == 5);
    vm.runImmediately();
    settle(loop, vm);
    assert(vm.state().isStopped);
    assert(vm.tape().read(0) == 0);
    assert(vm.tape().pointer() == 0);
}

static void test_rejected_tape_size() {
    EventLoop loop(EventLoop::Clock::Simulated);
    Interpreter vm(loop, smallTape(4));
    vm.setProgram({"+++"});
    while (vm.step()) {
    }
    bool threw = false;
    try {
        vm.setTapeSize(0);
    } catch (const tapevm::ConfigError&) {
        threw = true;
    }
    assert(threw);
    assert(vm.tape().size() == 4);
    assert(vm.tape().read(0) == 3);
    assert(vm.config().tapeSize == 4);

    threw = false;
    try {
        vm.setCellWidthBits(12);
    } catch (const tapevm::ConfigError&) {
        threw = true;
    }
    assert(threw);
    assert(vm.tape().cellWidth() == 8);
    (void)threw;
}

static void test_breakpoint_pauses_before_instruction() {
    EventLoop loop(EventLoop::Clock::Simulated);
    Interpreter vm(loop, smallTape());
    vm.setProgram({"+++."});
    assert(vm.toggleBreakpoint({0, 2}));
    assert(vm.hasBreakpointAt({0, 2}));
    vm.runImmediately();
    settle(loop, vm);
    assert(vm.state().isPaused);
    assert(vm.state().position == Position({0, 2}));
    assert(vm.tape().read(0) == 2);

    assert(vm.resume());
    settle(loop, vm);
    assert(vm.state().isStopped);
    assert(vm.tape().read(0) == 3);
    assert(vm.state().output == std::string(1, '\x03'));
}

static void test_step_over_breakpoint() {
    EventLoop loop(EventLoop::Clock::Simulated);
    Interpreter vm(loop, smallTape());
    vm.setProgram({"+>+"});
    vm.toggleBreakpoint({0, 1});
    vm.step();
    assert(vm.state().isPaused);
    assert(vm.state().position == Position({0, 1}));
    vm.step();
    assert(vm.tape().pointer() == 1);
    assert(vm.state().position == Position({0, 2}));
    assert(!vm.toggleBreakpoint({0, 1}));
    assert(!vm.hasBreakpointAt({0, 1}));
}

static void test_breakpoint_on_comment_ignored() {
    EventLoop loop(EventLoop::Clock::Simulated);
    Interpreter vm(loop, smallTape());
    vm.setProgram({"+x+"});
    vm.toggleBreakpoint({0, 1});
    vm.runImmediately();
    settle(loop, vm);
    assert(vm.state().isStopped);
    assert(vm.tape().read(0) == 2);
}

static void test_marker_pauses() {
    EventLoop loop(EventLoop::Clock::Simulated);
    Interpreter vm(loop, smallTape());
    vm.setProgram({"+$+"});
    vm.runImmediately();
    settle(loop, vm);
    assert(vm.state().isPaused);
    assert(vm.tape().read(0) == 1);
    assert(vm.resume());
    settle(loop, vm);
    assert(vm.state().isStopped);
    assert(vm.tape().read(0) == 2);
}

static void test_line_terminator() {
    EventLoop loop(EventLoop::Clock::Simulated);
    Interpreter vm(loop, smallTape());
    vm.setProgram({"+/++", "+"});
    while (vm.step()) {
    }
    assert(vm.tape().read(0) == 2);
}

static void test_long_comment_run() {
    EventLoop loop(EventLoop::Clock::Simulated);
    Interpreter vm(loop, smallTape());
    vm.setProgram({std::string(200000, 'x') + "+", std::string(1000, ' '), "+"});
    assert(vm.step());
    assert(vm.tape().read(0) == 1);
    assert(!vm.step());
    assert(vm.tape().read(0) == 2);
}

static void test_stopped_engine_rejects_runs() {
    EventLoop loop(EventLoop::Clock::Simulated);
    Interpreter vm(loop, smallTape());
    vm.setProgram({"+"});
    assert(!vm.step());
    assert(vm.state().isStopped);
    {
        CerrCapture cap;
        assert(!vm.step());
        vm.runImmediately();
        assert(cap.contains("program has finished"));
    }
    assert(vm.tape().read(0) == 1);
    vm.reset();
    assert(!vm.state().isStopped);
    assert(vm.tape().read(0) == 0);
    assert(!vm.step());
    assert(vm.tape().read(0) == 1);
}

static void test_increment_and_utf8_output() {
    EventLoop loop(EventLoop::Clock::Simulated);
    EngineConfig cfg = smallTape(4, 16);
    cfg.increment = 0x263A;
    Interpreter vm(loop, cfg);
    vm.setProgram({"+.>++-"});
    while (vm.step()) {
    }
    assert(vm.state().output == "\xE2\x98\xBA");
    assert(vm.tape().read(1) == (2u * 0x263A - 1) % 65536);

    vm.setIncrement(2);
    vm.reset();
    while (vm.step()) {
    }
    assert(vm.tape().read(0) == 2);
    assert(vm.tape().read(1) == 3);
    bool threw = false;
    try {
        vm.setIncrement(0);
    } catch (const tapevm::ConfigError&) {
        threw = true;
    }
    assert(threw);
    (void)threw;
}

static void test_unmatched_bracket_continues() {
    EventLoop loop(EventLoop::Clock::Simulated);
    Interpreter vm(loop, smallTape());
    CerrCapture cap;
    vm.setProgram({"+]+"});
    assert(cap.contains("unmatched ']'"));
    while (vm.step()) {
    }
    assert(cap.contains("no matching bracket"));
    assert(vm.tape().read(0) == 2);
}

static void test_positions() {
    EventLoop loop(EventLoop::Clock::Simulated);
    Interpreter vm(loop, smallTape());
    vm.setProgram({"+", "+++"});
    vm.stepToPosition({1, 1});
    assert(vm.tape().read(0) == 1);
    assert(vm.state().position == Position({1, 2}));
    assert(!vm.state().isStopped);

    vm.runFromPosition({1, 0});
    assert(vm.tape().read(0) == 0);
    settle(loop, vm);
    assert(vm.state().isStopped);
    assert(vm.tape().read(0) == 3);
}

static void test_observers() {
    EventLoop loop(EventLoop::Clock::Simulated);
    Interpreter vm(loop, smallTape());
    vm.setProgram({"+>+"});
    std::size_t states = 0;
    std::vector<Position> positions;
    tapevm::SubscriptionId once = 0;
    std::size_t onceCalls = 0;
    vm.subscribe([&](const tapevm::ExecutionState& s) {
        ++states;
        assert(s.tape == &vm.tape());
    });
    vm.subscribePosition([&](const Position& p) { positions.push_back(p); });
    once = vm.subscribe([&](const tapevm::ExecutionState&) {
        ++onceCalls;
        vm.unsubscribe(once);
    });
    vm.step();
    vm.step();
    assert(states == 2);
    assert(onceCalls == 1);
    assert(positions.size() == 2);
    assert(positions[0] == Position({0, 1}));
    assert(positions[1] == Position({0, 2}));
}

static void test_instances_are_independent() {
    EventLoop loop(EventLoop::Clock::Simulated);
    Interpreter a(loop, smallTape());
    Interpreter b(loop, smallTape());
    a.setProgram({"+++."});
    b.setProgram({"++."});
    a.runImmediately();
    b.runImmediately();
    loop.runUntil([&] { return a.state().isStopped && b.state().isStopped; });
    assert(a.state().output == "\x03");
    assert(b.state().output == "\x02");
    assert(a.tape().read(0) == 3);
    assert(b.tape().read(0) == 2);
}

static void test_lane_count() {
    EventLoop loop(EventLoop::Clock::Simulated);
    Interpreter vm(loop, smallTape());
    vm.setLaneCount(4);
    assert(vm.state().laneCount == 4);
    bool threw = false;
    try {
        vm.setLaneCount(TAPEVM_MAX_LANE_COUNT + 1);
    } catch (const tapevm::ConfigError&) {
        threw = true;
    }
    assert(threw);
    assert(vm.config().laneCount == 4);

    threw = false;
    try {
        vm.setLaneCount(0);
    } catch (const tapevm::ConfigError&) {
        threw = true;
    }
    assert(threw);
    assert(vm.state().laneCount == 4);
    (void)threw;
}

int main() {
    test_multiply_loop();
    test_stepping_matches_run();
    test_input_round_trip();
    test_input_reduced_mod_width();
    test_input_while_not_waiting();
    test_clear_loop_keeps_pointer();
    test_rejected_tape_size();
    test_breakpoint_pauses_before_instruction();
    test_step_over_breakpoint();
    test_breakpoint_on_comment_ignored();
    test_marker_pauses();
    test_line_terminator();
    test_long_comment_run();
    test_stopped_engine_rejects_runs();
    test_increment_and_utf8_output();
    test_unmatched_bracket_continues();
    test_positions();
    test_observers();
    test_instances_are_independent();
    test_lane_count();
    return 0;
}

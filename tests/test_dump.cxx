#include <cassert>
#include <sstream>
#include <string>

#include "tapevm/dump.hxx"
#include "tapevm/engine.hxx"
#include "tapevm/tape.hxx"

static void test_dump_rows() {
    tapevm::Tape tape(12, 8);
    tape.write(0, 5);
    tape.write(11, 255);
    tape.setPointer(3);
    std::ostringstream out;
    tapevm::dumpMemory(tape, 1, out, false);
    assert(out.str() ==
           "Memory dump:\n"
           "row+col |0  |1  |2  |3  |4  |5  |6  |7  |8  |9  |\n"
           "0       |5  |0  |0  |0  |0  |0  |0  |0  |0  |0  |\n"
           "10      |0  |255|\n"
           "Pointer: 3\n");
}

static void test_dump_lanes() {
    tapevm::Tape tape(6, 16);
    tape.write(1, 65535);
    std::ostringstream out;
    tapevm::dumpMemory(tape, 2, out, false);
    assert(out.str() ==
           "Memory dump:\n"
           "row+lane|0    |1    |\n"
           "0       |0    |65535|\n"
           "Pointer: 0\n");
}

static void test_location() {
    tapevm::ExecutionState state;
    state.position = {1, 2};
    std::ostringstream plain;
    tapevm::printLocation(state, plain);
    assert(plain.str() == "Position 2:3\n");

    state.sourcePosition = tapevm::Position{4, 0};
    state.macroContext = {{"inner", {{"x", "1"}}}, {"outer", {}}};
    std::ostringstream out;
    tapevm::printLocation(state, out);
    assert(out.str() == "Position 2:3 (source 5:1)\n  in inner(x=1)\n  in outer\n");
}

int main() {
    test_dump_rows();
    test_dump_lanes();
    test_location();
    return 0;
}

/*
    TapeVM - A debuggable brainfuck VM
    Memory dump and stop reports
    Published under the GNU AGPL-3.0-or-later license
*/
// SPDX-License-Identifier: AGPL-3.0-or-later
#include "tapevm/dump.hxx"

#include <algorithm>
#include <string>

#include "tapevm/ansi.hxx"

namespace tapevm {

namespace {

std::size_t digits(std::uint64_t v) { return std::to_string(v).size(); }

void pad(std::ostream& out, std::size_t used, std::size_t width) {
    if (used < width) out << std::string(width - used, ' ');
}

std::string oneBased(const Position& p) {
    return std::to_string(p.line + 1) + ":" + std::to_string(p.column + 1);
}

}  // namespace

void dumpMemory(const Tape& tape, unsigned laneCount, std::ostream& out, bool color) {
    if (tape.size() == 0) {
        out << "Memory dump:" << '\n' << "<empty>" << std::endl;
        return;
    }
    const std::size_t perRow = laneCount > 1 ? laneCount : 10;
    const std::size_t cellWidth = std::max<std::size_t>(3, digits(tape.mask()));
    const std::size_t last = std::max(tape.lastNonZero().value_or(0), tape.pointer());
    const std::size_t end = std::min(tape.size(), (last / perRow + 1) * perRow);

    out << "Memory dump:" << '\n';
    if (color) out << ansi::header;
    out << (laneCount > 1 ? "row+lane|" : "row+col |");
    for (std::size_t c = 0; c < perRow; ++c) {
        std::string label = std::to_string(c);
        out << label;
        pad(out, label.size(), cellWidth);
        out << '|';
    }
    if (color) out << ansi::reset;
    out << std::endl;

    for (std::size_t i = 0; i < end; ++i) {
        if (i % perRow == 0) {
            if (i) out << std::endl;
            std::string row = std::to_string(i);
            out << row;
            pad(out, row.size(), 8);
            out << '|';
        }
        std::string cell = std::to_string(tape.read(i));
        const bool here = i == tape.pointer();
        if (color && here) out << ansi::pointer;
        out << cell;
        if (color && here) out << ansi::reset;
        pad(out, cell.size(), cellWidth);
        out << '|';
    }
    out << std::endl;
    if (!color) out << "Pointer: " << tape.pointer() << std::endl;
}

void printLocation(const ExecutionState& state, std::ostream& out) {
    out << "Position " << oneBased(state.position);
    if (state.sourcePosition) out << " (source " << oneBased(*state.sourcePosition) << ")";
    out << '\n';
    for (const auto& frame : state.macroContext) {
        out << "  in " << frame.macroName;
        if (!frame.parameters.empty()) {
            out << '(';
            bool first = true;
            for (const auto& [name, value] : frame.parameters) {
                if (!first) out << ", ";
                out << name << '=' << value;
                first = false;
            }
            out << ')';
        }
        out << '\n';
    }
    out << std::flush;
}

}  // namespace tapevm

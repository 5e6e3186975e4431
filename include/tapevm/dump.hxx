/*
    TapeVM - A debuggable brainfuck VM
    Memory dump and stop reports
    Published under the GNU AGPL-3.0-or-later license
*/
// SPDX-License-Identifier: AGPL-3.0-or-later
#pragma once

#include <iostream>
#include <ostream>

#include "tapevm/engine.hxx"
#include "tapevm/tape.hxx"

namespace tapevm {

/// @brief Prints the used part of the tape as a table.
///
/// With one lane the table has ten cells per row. With more, each row holds one cell per lane
/// (lane = index mod laneCount). The pointer cell is green when `color` is set; otherwise its
/// index is printed below the table.
void dumpMemory(const Tape& tape, unsigned laneCount, std::ostream& out = std::cout,
                bool color = true);

/// Engine position, source position and macro stack, one item per line. Positions are 1-based.
void printLocation(const ExecutionState& state, std::ostream& out = std::cout);

}  // namespace tapevm

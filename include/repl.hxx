/*
    TapeVM - A debuggable brainfuck VM
    Interactive debugger declarations
    Published under the GNU AGPL-3.0-or-later license
*/
// SPDX-License-Identifier: AGPL-3.0-or-later
#pragma once
#ifdef TAPEVM_ENABLE_REPL
#include <chrono>
#include <string>

#include "tapevm/facade.hxx"
#include "tapevm/scheduler.hxx"

struct ReplConfig {
    std::chrono::milliseconds delay{TAPEVM_DEFAULT_DELAY_MS};
    bool dumpOnPause = true;
};

/// Line-based debugger over `engine`. Returns the process exit code.
int runRepl(tapevm::ExecutionFacade& engine, tapevm::EventLoop& loop, ReplConfig cfg = {});
#endif  // TAPEVM_ENABLE_REPL
